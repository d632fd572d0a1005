#pragma once

#include "resp/frame.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace respkv::resp {

// ── Wire markers ──────────────────────────────────────────────────────────────

inline constexpr char kSimpleStringMarker = '+';
inline constexpr char kSimpleErrorMarker  = '-';
inline constexpr char kIntegerMarker      = ':';
inline constexpr char kBulkStringMarker   = '$';
inline constexpr char kArrayMarker        = '*';
inline constexpr char kNullMarker         = '_';
inline constexpr char kBooleanMarker      = '#';
inline constexpr char kDoubleMarker       = ',';
inline constexpr char kMapMarker          = '%';
inline constexpr char kSetMarker          = '~';

inline constexpr std::string_view kCrlf = "\r\n";

// Largest accepted bulk string payload (matches Redis proto-max-bulk-len).
inline constexpr std::int64_t kMaxBulkLength = 512LL * 1024 * 1024;
// Largest accepted element / pair count of an aggregate header.
inline constexpr std::int64_t kMaxAggregateLength = 0x7fffffffLL;
// Deepest accepted nesting of aggregates.
inline constexpr std::size_t kMaxNestingDepth = 64;

// ── Errors ────────────────────────────────────────────────────────────────────

enum class DecodeErrc : std::uint8_t {
    NotComplete,        // more bytes needed; buffer left untouched
    InvalidFrameType,   // unknown leading marker
    InvalidFrame,       // structurally malformed payload
    InvalidFrameLength, // bad length or count header
    ParseIntError,
    ParseFloatError,
    Utf8Error,
};

[[nodiscard]] std::string_view to_string(DecodeErrc code) noexcept;

struct DecodeError {
    DecodeErrc  code;
    std::string message;

    [[nodiscard]] bool incomplete() const noexcept { return code == DecodeErrc::NotComplete; }
};

using DecodeResult = std::variant<Frame, DecodeError>;
using LengthResult = std::variant<std::size_t, DecodeError>;

// ── Decoder ───────────────────────────────────────────────────────────────────
//
// Two-phase protocol: expect_length() measures the span of the first complete
// frame without consuming anything; decode() parses that span and only then
// erases exactly those bytes from the front of `buf`.  On every error path,
// NotComplete included, `buf` is left byte-for-byte unchanged, so a caller can
// append more data and call decode() again.
//
// Thread-safe: pure functions, no shared state.

// Number of bytes the first frame in `buf` occupies once fully received.
[[nodiscard]] LengthResult expect_length(std::string_view buf);

// Extract the first frame from `buf`.
[[nodiscard]] DecodeResult decode(std::string& buf);

} // namespace respkv::resp
