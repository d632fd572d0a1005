#include "resp/encoder.hpp"
#include "resp/decoder.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <type_traits>

namespace respkv::resp {

namespace {

void put_line(std::string& out, char marker, std::string_view payload) {
    out += marker;
    out += payload;
    out += kCrlf;
}

void put_header(std::string& out, char marker, std::size_t n) {
    fmt::format_to(std::back_inserter(out), "{}{}\r\n", marker, n);
}

void put_bulk(std::string& out, std::string_view data) {
    put_header(out, kBulkStringMarker, data.size());
    out += data;
    out += kCrlf;
}

void put_double(std::string& out, double d) {
    out += kDoubleMarker;
    if (std::isnan(d)) {
        out += "nan";
    } else if (std::isinf(d)) {
        out += d > 0 ? "inf" : "-inf";
    } else {
        // Shortest representation that parses back to the same value.
        fmt::format_to(std::back_inserter(out), "{}", d);
    }
    out += kCrlf;
}

} // anonymous namespace

void encode_to(const Frame& frame, std::string& out) {
    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, SimpleString>) {
                put_line(out, kSimpleStringMarker, v.value);
            } else if constexpr (std::is_same_v<T, SimpleError>) {
                put_line(out, kSimpleErrorMarker, v.message);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                fmt::format_to(std::back_inserter(out), "{}{}\r\n", kIntegerMarker, v);
            } else if constexpr (std::is_same_v<T, BulkString>) {
                put_bulk(out, v.data);
            } else if constexpr (std::is_same_v<T, Array>) {
                put_header(out, kArrayMarker, v.items.size());
                for (const auto& item : v.items) {
                    encode_to(item, out);
                }
            } else if constexpr (std::is_same_v<T, Null>) {
                put_line(out, kNullMarker, {});
            } else if constexpr (std::is_same_v<T, bool>) {
                put_line(out, kBooleanMarker, v ? "t" : "f");
            } else if constexpr (std::is_same_v<T, Double>) {
                put_double(out, v.value);
            } else if constexpr (std::is_same_v<T, Map>) {
                put_header(out, kMapMarker, v.entries.size());
                for (const auto& [key, value] : v.entries) {
                    put_bulk(out, key);
                    encode_to(value, out);
                }
            } else if constexpr (std::is_same_v<T, Set>) {
                std::vector<const Frame*> sorted;
                sorted.reserve(v.items.size());
                for (const auto& item : v.items) {
                    sorted.push_back(&item);
                }
                std::sort(sorted.begin(), sorted.end(),
                          [](const Frame* a, const Frame* b) { return *a < *b; });

                put_header(out, kSetMarker, sorted.size());
                for (const auto* item : sorted) {
                    encode_to(*item, out);
                }
            }
        },
        frame.value);
}

std::string encode(const Frame& frame) {
    std::string out;
    encode_to(frame, out);
    return out;
}

} // namespace respkv::resp
