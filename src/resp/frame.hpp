#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace respkv::resp {

// ── Frame ─────────────────────────────────────────────────────────────────────
//
// One value of the RESP wire domain.  The variant is closed: every consumer
// (encoder, executor, set storage) dispatches over it with std::visit.
//
// Equality and ordering are structural and total: frames compare first by
// kind (variant index), then by payload.  Doubles treat every NaN as equal
// and order NaN after all numbers.  Sets compare and hash on a sorted copy of
// their elements, so insertion order is invisible.

struct Frame;

struct SimpleString {
    std::string value;
};

struct SimpleError {
    std::string message;
};

// Binary-safe payload; may contain CR, LF or NUL bytes.
struct BulkString {
    std::string data;
};

struct Null {};

struct Double {
    double value = 0.0;
};

struct Array {
    std::vector<Frame> items;
};

// Keys are unique and iterate in sorted order.
struct Map {
    std::map<std::string, Frame> entries;
};

// Semantically a set; elements are kept in insertion order, duplicates are
// the constructor's responsibility.
struct Set {
    std::vector<Frame> items;
};

// Index order of Frame::Value, also the first key of the total order.
enum class FrameKind : std::uint8_t {
    SimpleString = 0,
    SimpleError  = 1,
    Integer      = 2,
    BulkString   = 3,
    Array        = 4,
    Null         = 5,
    Boolean      = 6,
    Double       = 7,
    Map          = 8,
    Set          = 9,
};

[[nodiscard]] std::string_view to_string(FrameKind kind) noexcept;

struct Frame {
    using Value = std::variant<SimpleString, SimpleError, std::int64_t, BulkString,
                               Array, Null, bool, Double, Map, Set>;

    Value value;

    Frame() : value(Null{}) {}
    Frame(Value v) : value(std::move(v)) {}

    // ── Construction helpers ────────────────────────────────────────────────
    // `simple` and `error` take text that must not contain CR or LF, or the
    // encoded line cannot be decoded again.  Pass untrusted text through
    // sanitize_line() first.
    static Frame simple(std::string text) { return Frame{SimpleString{std::move(text)}}; }
    static Frame error(std::string message) { return Frame{SimpleError{std::move(message)}}; }
    static Frame integer(std::int64_t n) { return Frame{Value{std::in_place_type<std::int64_t>, n}}; }
    static Frame bulk(std::string bytes) { return Frame{BulkString{std::move(bytes)}}; }
    static Frame bulk(const std::vector<std::uint8_t>& bytes) {
        return Frame{BulkString{std::string(bytes.begin(), bytes.end())}};
    }
    static Frame array(std::vector<Frame> items) { return Frame{Array{std::move(items)}}; }
    static Frame null() { return Frame{}; }
    static Frame boolean(bool b) { return Frame{Value{std::in_place_type<bool>, b}}; }
    static Frame dbl(double d) { return Frame{Double{d}}; }
    static Frame map(std::map<std::string, Frame> entries) { return Frame{Map{std::move(entries)}}; }
    static Frame set(std::vector<Frame> items) { return Frame{Set{std::move(items)}}; }

    [[nodiscard]] FrameKind kind() const noexcept { return static_cast<FrameKind>(value.index()); }

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(value); }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&value); }

    template <typename T>
    [[nodiscard]] T* get_if() noexcept { return std::get_if<T>(&value); }

    friend bool operator==(const Frame& a, const Frame& b);
    friend std::strong_ordering operator<=>(const Frame& a, const Frame& b);
};

// Three-way comparison implementing the total order described above.
[[nodiscard]] std::strong_ordering compare(const Frame& a, const Frame& b);

// Hash consistent with operator==.
[[nodiscard]] std::size_t hash_value(const Frame& f);

// Copy of `text` that is safe as the body of a simple string or simple error:
// control bytes (CR and LF included), DEL and bytes that are not part of a
// well-formed UTF-8 sequence are each replaced by '?'.
[[nodiscard]] std::string sanitize_line(std::string_view text);

// Human-readable rendering in the style of redis-cli, e.g. `(integer) 1`,
// `"bar"`, `(nil)`, with numbered lines for aggregates.
[[nodiscard]] std::string to_string(const Frame& f);

} // namespace respkv::resp

template <>
struct std::hash<respkv::resp::Frame> {
    std::size_t operator()(const respkv::resp::Frame& f) const { return respkv::resp::hash_value(f); }
};
