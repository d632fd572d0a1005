#include "resp/decoder.hpp"
#include "common/utf8.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <limits>
#include <optional>
#include <utility>

namespace respkv::resp {

namespace {

DecodeError make_error(DecodeErrc code, std::string message) {
    return DecodeError{code, std::move(message)};
}

DecodeError not_complete() {
    return make_error(DecodeErrc::NotComplete, "frame is not complete");
}

// Parse a signed decimal integer occupying all of `sv`.
std::optional<std::int64_t> parse_int(std::string_view sv) {
    if (sv.empty()) {
        return std::nullopt;
    }
    // from_chars rejects a leading '+', RESP allows it.  A sign after the
    // '+' is malformed.
    if (sv.front() == '+') {
        sv.remove_prefix(1);
        if (sv.empty() || sv.front() == '-') {
            return std::nullopt;
        }
    }
    std::int64_t out = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        return std::nullopt;
    }
    return out;
}

std::optional<double> parse_double(std::string_view sv) {
    if (sv == "inf" || sv == "+inf") return std::numeric_limits<double>::infinity();
    if (sv == "-inf")                return -std::numeric_limits<double>::infinity();
    if (sv == "nan" || sv == "-nan") return std::numeric_limits<double>::quiet_NaN();
    if (sv.empty()) {
        return std::nullopt;
    }
    if (sv.front() == '+') {
        sv.remove_prefix(1);
        if (sv.empty() || sv.front() == '-') {
            return std::nullopt;
        }
    }
    double out = 0.0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        return std::nullopt;
    }
    return out;
}

// A decoded `<marker><decimal>\r\n` header.
struct Header {
    std::int64_t value = 0;
    std::size_t  size  = 0; // bytes including marker and CRLF
};

using HeaderResult = std::variant<Header, DecodeError>;

HeaderResult read_header(std::string_view buf) {
    const auto end = buf.find(kCrlf, 1);
    if (end == std::string_view::npos) {
        return not_complete();
    }
    const auto digits = buf.substr(1, end - 1);
    // Lengths and counts are bare decimals; only integer frames take a '+'.
    std::optional<std::int64_t> value;
    if (!digits.starts_with('+')) {
        value = parse_int(digits);
    }
    if (!value) {
        return make_error(DecodeErrc::ParseIntError,
                          fmt::format("invalid length header '{}'", digits));
    }
    return Header{*value, end + kCrlf.size()};
}

// ── Phase 1: measure ─────────────────────────────────────────────────────────

LengthResult measure(std::string_view buf, std::size_t depth);

LengthResult measure_line(std::string_view buf) {
    const auto end = buf.find(kCrlf, 1);
    if (end == std::string_view::npos) {
        return not_complete();
    }
    return end + kCrlf.size();
}

LengthResult measure_bulk(std::string_view buf) {
    auto header = read_header(buf);
    if (auto* err = std::get_if<DecodeError>(&header)) {
        return std::move(*err);
    }
    const auto [len, header_size] = std::get<Header>(header);
    if (len == -1) {
        return header_size;
    }
    if (len < 0 || len > kMaxBulkLength) {
        return make_error(DecodeErrc::InvalidFrameLength,
                          fmt::format("invalid bulk string length {}", len));
    }
    const std::size_t total = header_size + static_cast<std::size_t>(len) + kCrlf.size();
    if (buf.size() < total) {
        return not_complete();
    }
    if (buf.substr(total - kCrlf.size(), kCrlf.size()) != kCrlf) {
        return make_error(DecodeErrc::InvalidFrame, "bulk string is not terminated by CRLF");
    }
    return total;
}

LengthResult measure_aggregate(std::string_view buf, std::size_t depth, std::size_t per_entry) {
    auto header = read_header(buf);
    if (auto* err = std::get_if<DecodeError>(&header)) {
        return std::move(*err);
    }
    const auto [count, header_size] = std::get<Header>(header);
    if (count == -1 && buf.front() == kArrayMarker) {
        return header_size;
    }
    if (count < 0 || count > kMaxAggregateLength) {
        return make_error(DecodeErrc::InvalidFrameLength,
                          fmt::format("invalid aggregate length {}", count));
    }

    std::size_t offset = header_size;
    const std::size_t elements = static_cast<std::size_t>(count) * per_entry;
    for (std::size_t i = 0; i < elements; ++i) {
        auto sub = measure(buf.substr(offset), depth + 1);
        if (auto* err = std::get_if<DecodeError>(&sub)) {
            return std::move(*err);
        }
        offset += std::get<std::size_t>(sub);
    }
    return offset;
}

LengthResult measure(std::string_view buf, std::size_t depth) {
    if (buf.empty()) {
        return not_complete();
    }
    if (depth > kMaxNestingDepth) {
        return make_error(DecodeErrc::InvalidFrame, "frame nesting is too deep");
    }

    switch (buf.front()) {
        case kSimpleStringMarker:
        case kSimpleErrorMarker:
        case kIntegerMarker:
        case kNullMarker:
        case kBooleanMarker:
        case kDoubleMarker:
            return measure_line(buf);
        case kBulkStringMarker:
            return measure_bulk(buf);
        case kArrayMarker:
        case kSetMarker:
            return measure_aggregate(buf, depth, 1);
        case kMapMarker:
            return measure_aggregate(buf, depth, 2);
        default:
            return make_error(DecodeErrc::InvalidFrameType,
                              fmt::format("unknown frame type marker 0x{:02x}",
                                          static_cast<unsigned char>(buf.front())));
    }
}

// ── Phase 2: parse ───────────────────────────────────────────────────────────
//
// Runs only on a span that measure() accepted, so every line terminator and
// every bulk payload is known to be present.  `in` is advanced past the frame.

DecodeResult parse(std::string_view& in, std::size_t depth);

// Content of the line after the marker byte, without CRLF.
std::string_view take_line(std::string_view& in) {
    const auto end = in.find(kCrlf, 1);
    const auto line = in.substr(1, end - 1);
    in.remove_prefix(end + kCrlf.size());
    return line;
}

DecodeResult parse_text_line(std::string_view& in, bool is_error) {
    const auto line = take_line(in);
    if (line.find_first_of("\r\n") != std::string_view::npos) {
        return make_error(DecodeErrc::InvalidFrame, "simple frame contains a line terminator");
    }
    if (!is_valid_utf8(line)) {
        return make_error(DecodeErrc::Utf8Error, "simple frame is not valid UTF-8");
    }
    if (is_error) {
        return Frame::error(std::string(line));
    }
    return Frame::simple(std::string(line));
}

DecodeResult parse_integer(std::string_view& in) {
    const auto line = take_line(in);
    const auto value = parse_int(line);
    if (!value) {
        return make_error(DecodeErrc::ParseIntError, fmt::format("invalid integer '{}'", line));
    }
    return Frame::integer(*value);
}

DecodeResult parse_double_frame(std::string_view& in) {
    const auto line = take_line(in);
    const auto value = parse_double(line);
    if (!value) {
        return make_error(DecodeErrc::ParseFloatError, fmt::format("invalid double '{}'", line));
    }
    return Frame::dbl(*value);
}

DecodeResult parse_boolean(std::string_view& in) {
    const auto line = take_line(in);
    if (line == "t") return Frame::boolean(true);
    if (line == "f") return Frame::boolean(false);
    return make_error(DecodeErrc::InvalidFrame, fmt::format("invalid boolean '{}'", line));
}

DecodeResult parse_null(std::string_view& in) {
    const auto line = take_line(in);
    if (!line.empty()) {
        return make_error(DecodeErrc::InvalidFrame, "null frame carries a payload");
    }
    return Frame::null();
}

DecodeResult parse_bulk(std::string_view& in) {
    const auto len = *parse_int(take_line(in));
    if (len == -1) {
        return Frame::null();
    }
    const auto n = static_cast<std::size_t>(len);
    std::string data(in.substr(0, n));
    in.remove_prefix(n + kCrlf.size());
    return Frame::bulk(std::move(data));
}

DecodeResult parse_sequence(std::string_view& in, std::size_t depth, bool as_set) {
    const bool is_array = in.front() == kArrayMarker;
    const auto count = *parse_int(take_line(in));
    if (count == -1 && is_array) {
        return Frame::null();
    }

    std::vector<Frame> items;
    items.reserve(static_cast<std::size_t>(count));
    for (std::int64_t i = 0; i < count; ++i) {
        auto item = parse(in, depth + 1);
        if (auto* err = std::get_if<DecodeError>(&item)) {
            return std::move(*err);
        }
        items.push_back(std::move(std::get<Frame>(item)));
    }
    if (as_set) {
        return Frame::set(std::move(items));
    }
    return Frame::array(std::move(items));
}

DecodeResult parse_map(std::string_view& in, std::size_t depth) {
    const auto count = *parse_int(take_line(in));

    std::map<std::string, Frame> entries;
    for (std::int64_t i = 0; i < count; ++i) {
        auto key = parse(in, depth + 1);
        if (auto* err = std::get_if<DecodeError>(&key)) {
            return std::move(*err);
        }
        std::string key_text;
        auto& key_frame = std::get<Frame>(key);
        if (auto* s = key_frame.get_if<SimpleString>()) {
            key_text = std::move(s->value);
        } else if (auto* b = key_frame.get_if<BulkString>()) {
            if (!is_valid_utf8(b->data)) {
                return make_error(DecodeErrc::Utf8Error, "map key is not valid UTF-8");
            }
            key_text = std::move(b->data);
        } else {
            return make_error(DecodeErrc::InvalidFrame,
                              fmt::format("map key must be a string, got {}",
                                          to_string(key_frame.kind())));
        }

        auto value = parse(in, depth + 1);
        if (auto* err = std::get_if<DecodeError>(&value)) {
            return std::move(*err);
        }
        // A repeated key keeps the last value.
        entries.insert_or_assign(std::move(key_text), std::move(std::get<Frame>(value)));
    }
    return Frame::map(std::move(entries));
}

DecodeResult parse(std::string_view& in, std::size_t depth) {
    switch (in.front()) {
        case kSimpleStringMarker: return parse_text_line(in, false);
        case kSimpleErrorMarker:  return parse_text_line(in, true);
        case kIntegerMarker:      return parse_integer(in);
        case kBulkStringMarker:   return parse_bulk(in);
        case kArrayMarker:        return parse_sequence(in, depth, false);
        case kNullMarker:         return parse_null(in);
        case kBooleanMarker:      return parse_boolean(in);
        case kDoubleMarker:       return parse_double_frame(in);
        case kMapMarker:          return parse_map(in, depth);
        case kSetMarker:          return parse_sequence(in, depth, true);
        default:
            // measure() already rejected unknown markers.
            return make_error(DecodeErrc::InvalidFrameType, "unknown frame type marker");
    }
}

} // anonymous namespace

std::string_view to_string(DecodeErrc code) noexcept {
    switch (code) {
        case DecodeErrc::NotComplete:        return "frame is not complete";
        case DecodeErrc::InvalidFrameType:   return "invalid frame type";
        case DecodeErrc::InvalidFrame:       return "invalid frame";
        case DecodeErrc::InvalidFrameLength: return "invalid frame length";
        case DecodeErrc::ParseIntError:      return "integer parse error";
        case DecodeErrc::ParseFloatError:    return "float parse error";
        case DecodeErrc::Utf8Error:          return "utf-8 error";
    }
    return "unknown decode error";
}

LengthResult expect_length(std::string_view buf) {
    return measure(buf, 0);
}

DecodeResult decode(std::string& buf) {
    auto length = expect_length(buf);
    if (auto* err = std::get_if<DecodeError>(&length)) {
        return std::move(*err);
    }
    const std::size_t n = std::get<std::size_t>(length);

    std::string_view in{buf.data(), n};
    auto result = parse(in, 0);
    if (std::holds_alternative<Frame>(result)) {
        buf.erase(0, n);
    }
    return result;
}

} // namespace respkv::resp
