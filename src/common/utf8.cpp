#include "common/utf8.hpp"

#include <cstdint>

namespace respkv {

std::size_t utf8_sequence_length(std::string_view s, std::size_t pos) noexcept {
    const auto* p = reinterpret_cast<const std::uint8_t*>(s.data());
    const std::size_t n = s.size();
    if (pos >= n) {
        return 0;
    }

    const std::uint8_t c = p[pos];
    if (c < 0x80) {
        return 1;
    }

    std::size_t len = 0;
    std::uint8_t lo = 0x80;
    std::uint8_t hi = 0xBF;

    // Second-byte range depends on the lead byte (Unicode table 3-7).
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
    } else if (c == 0xE0) {
        len = 3; lo = 0xA0;
    } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
        len = 3;
    } else if (c == 0xED) {
        len = 3; hi = 0x9F;
    } else if (c == 0xF0) {
        len = 4; lo = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
        len = 4;
    } else if (c == 0xF4) {
        len = 4; hi = 0x8F;
    } else {
        return 0;
    }

    if (pos + len > n) {
        return 0;
    }
    if (p[pos + 1] < lo || p[pos + 1] > hi) {
        return 0;
    }
    for (std::size_t k = 2; k < len; ++k) {
        if (p[pos + k] < 0x80 || p[pos + k] > 0xBF) {
            return 0;
        }
    }
    return len;
}

bool is_valid_utf8(std::string_view s) noexcept {
    std::size_t i = 0;
    while (i < s.size()) {
        const std::size_t len = utf8_sequence_length(s, i);
        if (len == 0) {
            return false;
        }
        i += len;
    }
    return true;
}

} // namespace respkv
