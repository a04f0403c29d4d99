#pragma once

/**
 * @file clean_path.hpp
 * @brief Canonicalization of HTTP request paths before route matching.
 *
 * The canonical form of a path:
 * - starts with exactly one '/'
 * - contains no run of consecutive '/'
 * - contains no "." or ".." segment; ".." never climbs above the root
 * - ends with '/' only when the input ended with '/' or a final "." segment
 *   and the result is not the root
 *
 * Only the bytes '/' and '.' are interpreted. No percent-decoding, no
 * case folding, no Unicode handling.
 *
 * @example
 * ```cpp
 * #include <cleanpath/clean_path.hpp>
 *
 * std::string key = cleanpath::clean_path("abc/./../def");  // "/def"
 *
 * std::string target = read_request_target();
 * cleanpath::clean_path_in_place(target);  // reuses target's storage
 * ```
 */

#include <cleanpath/export.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace cleanpath {

/// Most bytes clean_path_into() writes for an input of `size` bytes.
constexpr std::size_t clean_path_capacity(std::size_t size) {
    return size + 1;
}

/**
 * @brief Write the canonical form of `path` to `out`
 * @param path Raw request path (any bytes, may be empty)
 * @param out  Destination with room for clean_path_capacity(path.size()) bytes
 * @return Length of the canonical path written to `out`
 *
 * `out` may be `path.data()` itself when `path` starts with '/'; the write
 * cursor never passes the read cursor in that case. Otherwise `out` must not
 * overlap `path`.
 */
CLEANPATH_API std::size_t clean_path_into(std::string_view path, char* out) noexcept;

/**
 * @brief Return the canonical form of `path` in a new string
 *
 * Exactly one buffer is allocated (and only when the result does not fit
 * the small-string buffer).
 */
CLEANPATH_API std::string clean_path(std::string_view path);

/**
 * @brief Canonicalize `path` using its own storage
 *
 * No allocation takes place when `path` is empty or already starts with '/'.
 * A missing leading '/' is inserted first, which reallocates only if the
 * string has no spare capacity.
 */
CLEANPATH_API void clean_path_in_place(std::string& path);

/// True when `path` is already canonical, i.e. clean_path(path) == path.
CLEANPATH_API bool is_clean_path(std::string_view path) noexcept;

} // namespace cleanpath
