/**
 * @file cleanpath_c_api.cpp
 * @brief cleanpath C API Implementation
 *
 * All C++ exceptions are caught at the boundary and converted to error codes.
 */

#include "cleanpath/cleanpath.h"
#include "cleanpath/clean_path.hpp"

#include <cstdlib>
#include <cstring>
#include <exception>
#include <new>
#include <string>
#include <string_view>

// Version is generated at build time from VERSION file
#ifndef CLEANPATH_VERSION_STRING
#define CLEANPATH_VERSION_STRING "unknown"
#endif

// ============================================================================
// Thread-Local Error State
// ============================================================================

namespace {

thread_local std::string g_last_error;
thread_local CleanpathStatus g_last_error_code = CLEANPATH_OK;

void set_error(CleanpathStatus code, const char* message) {
    g_last_error_code = code;
    g_last_error = message ? message : "";
}

void clear_error() {
    g_last_error_code = CLEANPATH_OK;
    g_last_error.clear();
}

// Duplicate a string for returning to C caller (caller must free)
char* duplicate_string(const std::string& s) {
    char* result = static_cast<char*>(malloc(s.size() + 1));
    if (result) {
        memcpy(result, s.data(), s.size());
        result[s.size()] = '\0';
    }
    return result;
}

} // namespace

extern "C" {

// ============================================================================
// API Version
// ============================================================================

CLEANPATH_CAPI int32_t cleanpath_abi_version(void) {
    return CLEANPATH_ABI_VERSION;
}

CLEANPATH_CAPI const char* cleanpath_version_string(void) {
    return CLEANPATH_VERSION_STRING;
}

// ============================================================================
// Error Handling
// ============================================================================

CLEANPATH_CAPI const char* cleanpath_get_last_error(void) {
    return g_last_error.c_str();
}

CLEANPATH_CAPI CleanpathStatus cleanpath_get_last_error_code(void) {
    return g_last_error_code;
}

CLEANPATH_CAPI void cleanpath_clear_error(void) {
    clear_error();
}

// ============================================================================
// Memory Management
// ============================================================================

CLEANPATH_CAPI void cleanpath_free_string(char* str) {
    free(str);
}

// ============================================================================
// Path Cleaning
// ============================================================================

CLEANPATH_CAPI char* cleanpath_clean(const char* path, size_t len, size_t* out_len) {
    clear_error();

    if (!path && len > 0) {
        set_error(CLEANPATH_ERROR_INVALID_ARGUMENT, "path is NULL");
        return nullptr;
    }

    try {
        std::string result = cleanpath::clean_path(std::string_view(path ? path : "", len));
        char* copy = duplicate_string(result);
        if (!copy) {
            set_error(CLEANPATH_ERROR_OUT_OF_MEMORY, "Failed to allocate result");
            return nullptr;
        }
        if (out_len) {
            *out_len = result.size();
        }
        return copy;
    } catch (const std::bad_alloc&) {
        set_error(CLEANPATH_ERROR_OUT_OF_MEMORY, "Failed to allocate result");
        return nullptr;
    } catch (const std::exception& e) {
        set_error(CLEANPATH_ERROR_INTERNAL, e.what());
        return nullptr;
    }
}

CLEANPATH_CAPI CleanpathStatus cleanpath_clean_in_place(char* buf, size_t len, size_t cap,
                                                        size_t* out_len) {
    clear_error();

    if (!out_len) {
        set_error(CLEANPATH_ERROR_INVALID_ARGUMENT, "out_len is NULL");
        return CLEANPATH_ERROR_INVALID_ARGUMENT;
    }
    if (!buf && (len > 0 || cap > 0)) {
        set_error(CLEANPATH_ERROR_INVALID_ARGUMENT, "buf is NULL");
        return CLEANPATH_ERROR_INVALID_ARGUMENT;
    }
    if (len > cap) {
        set_error(CLEANPATH_ERROR_INVALID_ARGUMENT, "len exceeds cap");
        return CLEANPATH_ERROR_INVALID_ARGUMENT;
    }

    bool rooted = len > 0 && buf[0] == '/';
    size_t required = rooted ? len : cleanpath::clean_path_capacity(len);
    if (cap < required) {
        *out_len = required;
        set_error(CLEANPATH_ERROR_BUFFER_TOO_SMALL, "Buffer too small for leading '/'");
        return CLEANPATH_ERROR_BUFFER_TOO_SMALL;
    }

    if (!rooted) {
        memmove(buf + 1, buf, len);
        buf[0] = '/';
        ++len;
    }
    *out_len = cleanpath::clean_path_into(std::string_view(buf, len), buf);
    return CLEANPATH_OK;
}

CLEANPATH_CAPI int cleanpath_is_clean(const char* path, size_t len) {
    if (!path) {
        return 0;
    }
    return cleanpath::is_clean_path(std::string_view(path, len)) ? 1 : 0;
}

} // extern "C"
