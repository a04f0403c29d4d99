/**
 * @file c_api_tests.cpp
 * @brief Tests for the cleanpath C API
 *
 * These tests verify the C API wrapper functions work correctly,
 * focusing on NULL safety, error handling, and memory management.
 */

#include <doctest/doctest.h>
#include <cleanpath/cleanpath.h>

#include <cstring>
#include <string>

// =============================================================================
// Version Tests
// =============================================================================

TEST_CASE("C API: cleanpath_abi_version returns correct version") {
    CHECK(cleanpath_abi_version() == CLEANPATH_ABI_VERSION);
}

TEST_CASE("C API: cleanpath_version_string returns non-empty string") {
    const char* version = cleanpath_version_string();
    REQUIRE(version != nullptr);
    CHECK(strlen(version) > 0);
}

// =============================================================================
// Error Handling Tests
// =============================================================================

TEST_CASE("C API: error handling") {
    SUBCASE("initial state has no error") {
        cleanpath_clear_error();
        CHECK(cleanpath_get_last_error_code() == CLEANPATH_OK);
        CHECK(strlen(cleanpath_get_last_error()) == 0);
    }

    SUBCASE("NULL path with non-zero length sets error") {
        char* result = cleanpath_clean(nullptr, 3, nullptr);
        CHECK(result == nullptr);
        CHECK(cleanpath_get_last_error_code() == CLEANPATH_ERROR_INVALID_ARGUMENT);
        CHECK(strlen(cleanpath_get_last_error()) > 0);
    }

    SUBCASE("clear_error resets state") {
        cleanpath_clean(nullptr, 3, nullptr);  // Set an error
        cleanpath_clear_error();
        CHECK(cleanpath_get_last_error_code() == CLEANPATH_OK);
    }

    SUBCASE("successful call clears a previous error") {
        cleanpath_clean(nullptr, 3, nullptr);
        char* result = cleanpath_clean("/a", 2, nullptr);
        REQUIRE(result != nullptr);
        CHECK(cleanpath_get_last_error_code() == CLEANPATH_OK);
        cleanpath_free_string(result);
    }
}

// =============================================================================
// Allocating Clean
// =============================================================================

TEST_CASE("C API: cleanpath_clean returns an owned string") {
    size_t len = 0;
    char* result = cleanpath_clean("abc//./../def/", 14, &len);
    REQUIRE(result != nullptr);
    CHECK(std::string(result) == "/def/");
    CHECK(len == 5);
    cleanpath_free_string(result);
}

TEST_CASE("C API: cleanpath_clean of empty input is root") {
    size_t len = 0;
    char* result = cleanpath_clean(nullptr, 0, &len);
    REQUIRE(result != nullptr);
    CHECK(std::string(result) == "/");
    CHECK(len == 1);
    cleanpath_free_string(result);
}

TEST_CASE("C API: cleanpath_clean honours the length, not NUL") {
    const char raw[] = "/a\0b/./c";
    size_t len = 0;
    char* result = cleanpath_clean(raw, sizeof(raw) - 1, &len);
    REQUIRE(result != nullptr);
    CHECK(std::string(result, len) == std::string("/a\0b/c", 6));
    cleanpath_free_string(result);

    result = cleanpath_clean("/abc/def", 4, &len);
    REQUIRE(result != nullptr);
    CHECK(std::string(result) == "/abc");
    cleanpath_free_string(result);
}

TEST_CASE("C API: free NULL string is safe") {
    cleanpath_free_string(nullptr);
}

// =============================================================================
// In-Place Clean
// =============================================================================

TEST_CASE("C API: cleanpath_clean_in_place rewrites a rooted buffer") {
    char buf[] = "/abc//def/../ghi/";
    size_t len = 0;
    CHECK(cleanpath_clean_in_place(buf, strlen(buf), strlen(buf), &len) == CLEANPATH_OK);
    CHECK(std::string(buf, len) == "/abc/ghi/");
}

TEST_CASE("C API: cleanpath_clean_in_place inserts the root when there is room") {
    char buf[16] = "abc/./x";
    size_t len = 0;
    CHECK(cleanpath_clean_in_place(buf, 7, sizeof(buf), &len) == CLEANPATH_OK);
    CHECK(std::string(buf, len) == "/abc/x");
}

TEST_CASE("C API: cleanpath_clean_in_place reports a small buffer") {
    char buf[] = "abc";
    size_t len = 0;
    CHECK(cleanpath_clean_in_place(buf, 3, 3, &len) == CLEANPATH_ERROR_BUFFER_TOO_SMALL);
    CHECK(len == 4);
    CHECK(cleanpath_get_last_error_code() == CLEANPATH_ERROR_BUFFER_TOO_SMALL);
    CHECK(std::string(buf) == "abc");
}

TEST_CASE("C API: cleanpath_clean_in_place of empty input") {
    SUBCASE("with room for the root") {
        char buf[1] = {'x'};
        size_t len = 0;
        CHECK(cleanpath_clean_in_place(buf, 0, 1, &len) == CLEANPATH_OK);
        CHECK(len == 1);
        CHECK(buf[0] == '/');
    }

    SUBCASE("without room") {
        size_t len = 0;
        CHECK(cleanpath_clean_in_place(nullptr, 0, 0, &len) == CLEANPATH_ERROR_BUFFER_TOO_SMALL);
        CHECK(len == 1);
    }
}

TEST_CASE("C API: cleanpath_clean_in_place validates arguments") {
    char buf[] = "/a";
    size_t len = 0;
    CHECK(cleanpath_clean_in_place(buf, 2, 2, nullptr) == CLEANPATH_ERROR_INVALID_ARGUMENT);
    CHECK(cleanpath_clean_in_place(nullptr, 2, 2, &len) == CLEANPATH_ERROR_INVALID_ARGUMENT);
    CHECK(cleanpath_clean_in_place(buf, 3, 2, &len) == CLEANPATH_ERROR_INVALID_ARGUMENT);
}

// =============================================================================
// Predicate
// =============================================================================

TEST_CASE("C API: cleanpath_is_clean") {
    CHECK(cleanpath_is_clean("/abc/", 5) == 1);
    CHECK(cleanpath_is_clean("/abc/.", 6) == 0);
    CHECK(cleanpath_is_clean("abc", 3) == 0);
    CHECK(cleanpath_is_clean(nullptr, 0) == 0);
}
