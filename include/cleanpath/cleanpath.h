/**
 * @file cleanpath.h
 * @brief cleanpath C API - Stable ABI for request path canonicalization
 *
 * This header exposes the path cleaner to C callers and FFI hosts
 * (Rust, Go, Python, ...).
 *
 * ## Design Principles
 *
 * 1. **Ownership**: Functions returning `char*` return newly allocated
 *    strings that the caller must free with `cleanpath_free_string()`.
 *
 * 2. **Error handling**: Fallible operations return a status code or NULL.
 *    Use `cleanpath_get_last_error()` for details. Errors are thread-local.
 *
 * 3. **No exceptions**: The C++ implementation catches all exceptions
 *    and converts them to error codes.
 *
 * ## Example
 *
 * ```c
 * #include <cleanpath/cleanpath.h>
 * #include <stdio.h>
 * #include <string.h>
 *
 * int main(void) {
 *     const char* raw = "abc//./../def/";
 *     size_t len = 0;
 *     char* clean = cleanpath_clean(raw, strlen(raw), &len);
 *     if (!clean) {
 *         fprintf(stderr, "Error: %s\n", cleanpath_get_last_error());
 *         return 1;
 *     }
 *     printf("%s\n", clean);  // "/def/"
 *     cleanpath_free_string(clean);
 *     return 0;
 * }
 * ```
 */

#ifndef CLEANPATH_H
#define CLEANPATH_H

#include <cleanpath/export.hpp>

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * ABI Version
 * ============================================================================
 *
 * CLEANPATH_ABI_VERSION is incremented when breaking changes are made to the
 * C API. It is independent of the library version (from the VERSION file).
 */

#define CLEANPATH_ABI_VERSION 1

/* ============================================================================
 * Export Macros
 * ============================================================================ */

#define CLEANPATH_CAPI CLEANPATH_API

/* ============================================================================
 * Status Codes
 * ============================================================================ */

typedef enum CleanpathStatus {
    CLEANPATH_OK = 0,
    CLEANPATH_ERROR_INVALID_ARGUMENT = 1,
    CLEANPATH_ERROR_BUFFER_TOO_SMALL = 2,
    CLEANPATH_ERROR_OUT_OF_MEMORY = 3,
    CLEANPATH_ERROR_INTERNAL = 99
} CleanpathStatus;

/* ============================================================================
 * API Version
 * ============================================================================ */

/**
 * @brief Get the ABI version of the loaded library
 * @return ABI version number (compare with CLEANPATH_ABI_VERSION)
 */
CLEANPATH_CAPI int32_t cleanpath_abi_version(void);

/**
 * @brief Get the library version string
 * @return Version string (e.g., "1.0.0"). Pointer is valid for program lifetime.
 */
CLEANPATH_CAPI const char* cleanpath_version_string(void);

/* ============================================================================
 * Error Handling
 * ============================================================================ */

/**
 * @brief Get the last error message (thread-local)
 * @return Error message string, or empty string if no error.
 *         Pointer valid until the next cleanpath call on this thread.
 */
CLEANPATH_CAPI const char* cleanpath_get_last_error(void);

/**
 * @brief Get the last error code (thread-local)
 */
CLEANPATH_CAPI CleanpathStatus cleanpath_get_last_error_code(void);

/**
 * @brief Clear the last error (thread-local)
 */
CLEANPATH_CAPI void cleanpath_clear_error(void);

/* ============================================================================
 * Memory Management
 * ============================================================================ */

/**
 * @brief Free a string returned by cleanpath functions
 * @param str String to free (NULL is safe)
 */
CLEANPATH_CAPI void cleanpath_free_string(char* str);

/* ============================================================================
 * Path Cleaning
 * ============================================================================ */

/**
 * @brief Return the canonical form of a path
 * @param path    Path bytes (need not be NUL-terminated; may contain NUL).
 *                May be NULL only when len is 0.
 * @param len     Number of bytes in path
 * @param out_len Receives the result length, excluding the terminator (may be NULL)
 * @return Newly allocated NUL-terminated string, or NULL on error.
 *         Free with cleanpath_free_string().
 */
CLEANPATH_CAPI char* cleanpath_clean(const char* path, size_t len, size_t* out_len);

/**
 * @brief Canonicalize a path in the caller's buffer
 * @param buf     Path bytes, rewritten in place
 * @param len     Number of path bytes in buf
 * @param cap     Size of buf in bytes. Must be at least len + 1 when buf does
 *                not start with '/' (or len is 0), at least len otherwise.
 * @param out_len Receives the result length. On CLEANPATH_ERROR_BUFFER_TOO_SMALL
 *                it receives the required capacity instead.
 * @return CLEANPATH_OK, CLEANPATH_ERROR_INVALID_ARGUMENT or
 *         CLEANPATH_ERROR_BUFFER_TOO_SMALL (buf is left untouched)
 *
 * The result is not NUL-terminated.
 */
CLEANPATH_CAPI CleanpathStatus cleanpath_clean_in_place(char* buf, size_t len, size_t cap,
                                                        size_t* out_len);

/**
 * @brief Check whether a path is already canonical
 * @return 1 if canonical, 0 otherwise (including invalid arguments)
 */
CLEANPATH_CAPI int cleanpath_is_clean(const char* path, size_t len);

#ifdef __cplusplus
}
#endif

#endif /* CLEANPATH_H */
