#pragma once

#include "resp/frame.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace respkv::cmd {

// ── Commands ──────────────────────────────────────────────────────────────────
//
// Typed representation of a single client request.  Each command is a plain
// struct; the whole thing is wrapped in a std::variant so the executor can
// std::visit over it without inheritance.

struct Get {
    std::string key;
    bool operator==(const Get&) const = default;
};

struct Set {
    std::string key;
    resp::Frame value;
    bool operator==(const Set&) const = default;
};

struct HGet {
    std::string key;
    std::string field;
    bool operator==(const HGet&) const = default;
};

struct HSet {
    std::string key;
    std::string field;
    resp::Frame value;
    bool operator==(const HSet&) const = default;
};

struct HGetAll {
    std::string key;
    bool operator==(const HGetAll&) const = default;
};

struct HMGet {
    std::string key;
    std::vector<std::string> fields; // at least one
    bool operator==(const HMGet&) const = default;
};

struct Echo {
    std::string text;
    bool operator==(const Echo&) const = default;
};

struct Sadd {
    std::string key;
    resp::Frame item;
    bool operator==(const Sadd&) const = default;
};

struct Sismember {
    std::string key;
    resp::Frame item;
    bool operator==(const Sismember&) const = default;
};

// Any command name outside the table above.  Executes as a no-op.
struct Unrecognized {
    bool operator==(const Unrecognized&) const = default;
};

using Command = std::variant<Get, Set, HGet, HSet, HGetAll, HMGet, Echo, Sadd, Sismember,
                             Unrecognized>;

// ── Errors ────────────────────────────────────────────────────────────────────

enum class CommandErrc : std::uint8_t {
    InvalidCommand,  // request is not an array led by a bulk-string name
    InvalidArgument, // wrong arity or wrong argument frame kind
    Utf8Error,       // text argument is not valid UTF-8
};

[[nodiscard]] std::string_view to_string(CommandErrc code) noexcept;

struct CommandError {
    CommandErrc code;
    std::string message;
};

// ── Conversion ────────────────────────────────────────────────────────────────

// Validate a decoded frame as a command.  The name is matched
// case-insensitively; unknown names yield Unrecognized rather than an error.
//
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::variant<Command, CommandError> try_command(resp::Frame frame);

// Canonical request form of `command`: an Array whose first element is the
// bulk-string name.  try_command(to_frame(c)) == c for every known command.
[[nodiscard]] resp::Frame to_frame(const Command& command);

// Lower-case wire name ("get", "hmget", …); "unrecognized" for Unrecognized.
[[nodiscard]] std::string_view command_name(const Command& command) noexcept;

} // namespace respkv::cmd
