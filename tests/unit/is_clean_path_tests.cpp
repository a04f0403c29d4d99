#include <doctest/doctest.h>
#include <cleanpath/clean_path.hpp>

#include "clean_path_cases.hpp"

using cleanpath::clean_path;
using cleanpath::is_clean_path;
using cleanpath::test::clean_cases;

TEST_CASE("is_clean_path accepts canonical paths") {
    CHECK(is_clean_path("/"));
    CHECK(is_clean_path("/abc"));
    CHECK(is_clean_path("/abc/"));
    CHECK(is_clean_path("/a/b/c"));
    CHECK(is_clean_path("/.well-known/acme"));
    CHECK(is_clean_path("/..."));
}

TEST_CASE("is_clean_path rejects paths the cleaner would rewrite") {
    CHECK_FALSE(is_clean_path(""));
    CHECK_FALSE(is_clean_path("abc"));
    CHECK_FALSE(is_clean_path("//"));
    CHECK_FALSE(is_clean_path("/abc//"));
    CHECK_FALSE(is_clean_path("/abc//def"));
    CHECK_FALSE(is_clean_path("/."));
    CHECK_FALSE(is_clean_path("/abc/."));
    CHECK_FALSE(is_clean_path("/abc/./def"));
    CHECK_FALSE(is_clean_path("/.."));
    CHECK_FALSE(is_clean_path("/abc/../def"));
    CHECK_FALSE(is_clean_path("/abc/.."));
}

TEST_CASE("is_clean_path matches the cleaner's fixed points") {
    for (const auto& tc : clean_cases()) {
        CAPTURE(tc.path);
        CHECK(is_clean_path(tc.path) == (clean_path(tc.path) == tc.path));
        CHECK(is_clean_path(tc.result));
    }
}
