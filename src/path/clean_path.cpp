#include "cleanpath/clean_path.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace cleanpath {

namespace {

constexpr char kSeparator = '/';
constexpr char kDot = '.';

// Start of the segment ending at `end`, or 1 when it is the first one.
std::size_t previous_segment_start(const char* out, std::size_t end) {
    std::size_t start = end;
    while (start > 1 && out[start - 1] != kSeparator) {
        --start;
    }
    return start;
}

} // namespace

std::size_t clean_path_into(std::string_view path, char* out) noexcept {
    const std::size_t n = path.size();
    const char* in = path.data();

    out[0] = kSeparator;
    if (n == 0) {
        return 1;
    }

    // Reading starts at 0 when the leading '/' is missing, so the write
    // cursor is one byte ahead of the read cursor from the start.
    std::size_t r = in[0] == kSeparator ? 1 : 0;
    std::size_t w = 1;
    std::size_t segment_start = 1;

    // Must be decided before the loop; an aliased `out` overwrites `in`.
    bool trailing = n > 1 && in[n - 1] == kSeparator;

    while (r < n) {
        if (in[r] == kSeparator) {
            ++r;
        } else if (in[r] == kDot && r + 1 == n) {
            // Final "." names the directory itself.
            trailing = true;
            ++r;
        } else if (in[r] == kDot && in[r + 1] == kSeparator) {
            r += 2;
        } else if (in[r] == kDot && in[r + 1] == kDot &&
                   (r + 2 == n || in[r + 2] == kSeparator)) {
            r += 3;
            if (w > 1) {
                w = segment_start > 1 ? segment_start - 1 : 1;
                segment_start = previous_segment_start(out, w);
            }
        } else {
            if (w > 1) {
                out[w++] = kSeparator;
            }
            segment_start = w;
            while (r < n && in[r] != kSeparator) {
                out[w++] = in[r++];
            }
        }
    }

    if (trailing && w > 1) {
        out[w++] = kSeparator;
    }
    return w;
}

std::string clean_path(std::string_view path) {
    std::string result(clean_path_capacity(path.size()), '\0');
    result.resize(clean_path_into(path, result.data()));
    return result;
}

void clean_path_in_place(std::string& path) {
    if (path.empty()) {
        path.assign(1, kSeparator);
        return;
    }
    if (path[0] != kSeparator) {
        path.insert(path.begin(), kSeparator);
    }
    path.resize(clean_path_into(path, path.data()));
}

bool is_clean_path(std::string_view path) noexcept {
    const std::size_t n = path.size();
    if (n == 0 || path[0] != kSeparator) {
        return false;
    }

    std::size_t i = 1;
    while (i < n) {
        std::size_t end = path.find(kSeparator, i);
        if (end == std::string_view::npos) {
            end = n;
        }
        std::string_view segment = path.substr(i, end - i);
        if (segment.empty() || segment == "." || segment == "..") {
            return false;
        }
        if (end == n) {
            break;
        }
        // A separator as the final byte is a kept trailing slash.
        i = end + 1;
    }
    return true;
}

} // namespace cleanpath
