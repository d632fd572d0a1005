#pragma once

#include <cstddef>
#include <string_view>

namespace respkv {

// Length in bytes of the well-formed UTF-8 sequence starting at `pos`, or 0
// if the bytes there are not one (bad lead byte, bad continuation, overlong,
// surrogate, above U+10FFFF or truncated).
[[nodiscard]] std::size_t utf8_sequence_length(std::string_view s, std::size_t pos) noexcept;

// Strict UTF-8 validation: rejects overlong forms, surrogates (U+D800..U+DFFF)
// and code points above U+10FFFF.
[[nodiscard]] bool is_valid_utf8(std::string_view s) noexcept;

} // namespace respkv
