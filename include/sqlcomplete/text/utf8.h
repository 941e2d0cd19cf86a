#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace sqlcomplete::utf8 {

/// Checks if a byte is a UTF8 codepoint boundary.
constexpr bool isCodepointBoundary(unsigned char b) { return b < 128 || b >= 192; }
/// Count the codepoints in a UTF8 string.
/// Invalid sequences are counted byte-wise, every non-continuation byte starts a new codepoint.
constexpr size_t countCodepoints(std::string_view text) {
    size_t n = 0;
    for (char c : text) {
        n += isCodepointBoundary(static_cast<unsigned char>(c));
    }
    return n;
}

}  // namespace sqlcomplete::utf8
