#include "cmd/command.hpp"
#include "common/utf8.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <type_traits>
#include <utility>

namespace respkv::cmd {

namespace {

using Args = std::vector<resp::Frame>;

using ParseResult = std::variant<Command, CommandError>;

// The array must hold the name token plus exactly `n_args` arguments.
std::optional<CommandError> check_arity(const Args& args, std::string_view name,
                                        std::size_t n_args) {
    if (args.size() != n_args + 1) {
        return CommandError{CommandErrc::InvalidArgument,
                            fmt::format("{} command must have exactly {} argument{}",
                                        name, n_args, n_args == 1 ? "" : "s")};
    }
    return std::nullopt;
}

// Moves the UTF-8 text of a bulk-string argument into `out`.
std::optional<CommandError> take_text(resp::Frame& frame, std::string_view what,
                                      std::string& out) {
    auto* bulk = frame.get_if<resp::BulkString>();
    if (bulk == nullptr) {
        return CommandError{CommandErrc::InvalidArgument,
                            fmt::format("invalid {}: expected bulk-string, got {}",
                                        what, resp::to_string(frame.kind()))};
    }
    if (!is_valid_utf8(bulk->data)) {
        return CommandError{CommandErrc::Utf8Error,
                            fmt::format("invalid {}: not valid UTF-8", what)};
    }
    out = std::move(bulk->data);
    return std::nullopt;
}

// ── Per-command parsers ───────────────────────────────────────────────────────

ParseResult parse_get(Args& args) {
    Get cmd;
    if (auto err = check_arity(args, "get", 1)) return *err;
    if (auto err = take_text(args[1], "key", cmd.key)) return *err;
    return Command{std::move(cmd)};
}

ParseResult parse_set(Args& args) {
    Set cmd;
    if (auto err = check_arity(args, "set", 2)) return *err;
    if (auto err = take_text(args[1], "key", cmd.key)) return *err;
    cmd.value = std::move(args[2]);
    return Command{std::move(cmd)};
}

ParseResult parse_hget(Args& args) {
    HGet cmd;
    if (auto err = check_arity(args, "hget", 2)) return *err;
    if (auto err = take_text(args[1], "key", cmd.key)) return *err;
    if (auto err = take_text(args[2], "field", cmd.field)) return *err;
    return Command{std::move(cmd)};
}

ParseResult parse_hset(Args& args) {
    HSet cmd;
    if (auto err = check_arity(args, "hset", 3)) return *err;
    if (auto err = take_text(args[1], "key", cmd.key)) return *err;
    if (auto err = take_text(args[2], "field", cmd.field)) return *err;
    cmd.value = std::move(args[3]);
    return Command{std::move(cmd)};
}

ParseResult parse_hgetall(Args& args) {
    HGetAll cmd;
    if (auto err = check_arity(args, "hgetall", 1)) return *err;
    if (auto err = take_text(args[1], "key", cmd.key)) return *err;
    return Command{std::move(cmd)};
}

// Variable arity: one key plus one or more fields.
ParseResult parse_hmget(Args& args) {
    if (args.size() < 3) {
        return CommandError{CommandErrc::InvalidArgument,
                            "hmget command must have a key and at least 1 field"};
    }
    HMGet cmd;
    if (auto err = take_text(args[1], "key", cmd.key)) return *err;
    cmd.fields.resize(args.size() - 2);
    for (std::size_t i = 2; i < args.size(); ++i) {
        if (auto err = take_text(args[i], "field", cmd.fields[i - 2])) return *err;
    }
    return Command{std::move(cmd)};
}

ParseResult parse_echo(Args& args) {
    Echo cmd;
    if (auto err = check_arity(args, "echo", 1)) return *err;
    if (auto err = take_text(args[1], "message", cmd.text)) return *err;
    return Command{std::move(cmd)};
}

ParseResult parse_sadd(Args& args) {
    Sadd cmd;
    if (auto err = check_arity(args, "sadd", 2)) return *err;
    if (auto err = take_text(args[1], "key", cmd.key)) return *err;
    cmd.item = std::move(args[2]);
    return Command{std::move(cmd)};
}

ParseResult parse_sismember(Args& args) {
    Sismember cmd;
    if (auto err = check_arity(args, "sismember", 2)) return *err;
    if (auto err = take_text(args[1], "key", cmd.key)) return *err;
    cmd.item = std::move(args[2]);
    return Command{std::move(cmd)};
}

struct CommandEntry {
    std::string_view name;
    ParseResult (*parse)(Args&);
};

constexpr std::array<CommandEntry, 9> kCommandTable{{
    {"get",       &parse_get},
    {"set",       &parse_set},
    {"hget",      &parse_hget},
    {"hset",      &parse_hset},
    {"hgetall",   &parse_hgetall},
    {"hmget",     &parse_hmget},
    {"echo",      &parse_echo},
    {"sadd",      &parse_sadd},
    {"sismember", &parse_sismember},
}};

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

resp::Frame request(std::string_view name, std::vector<resp::Frame> args) {
    std::vector<resp::Frame> items;
    items.reserve(args.size() + 1);
    items.push_back(resp::Frame::bulk(std::string(name)));
    for (auto& a : args) {
        items.push_back(std::move(a));
    }
    return resp::Frame::array(std::move(items));
}

} // anonymous namespace

std::string_view to_string(CommandErrc code) noexcept {
    switch (code) {
        case CommandErrc::InvalidCommand:  return "invalid command";
        case CommandErrc::InvalidArgument: return "invalid argument";
        case CommandErrc::Utf8Error:       return "utf-8 error";
    }
    return "unknown command error";
}

std::variant<Command, CommandError> try_command(resp::Frame frame) {
    auto* array = frame.get_if<resp::Array>();
    if (array == nullptr) {
        return CommandError{CommandErrc::InvalidCommand, "command must be an array"};
    }

    auto& args = array->items;
    if (args.empty()) {
        return CommandError{CommandErrc::InvalidCommand, "command must not be empty"};
    }

    const auto* name = args.front().get_if<resp::BulkString>();
    if (name == nullptr) {
        return CommandError{CommandErrc::InvalidCommand,
                            "command must have a bulk-string as the first argument"};
    }

    const auto lowered = to_lower(name->data);
    const auto it = std::find_if(kCommandTable.begin(), kCommandTable.end(),
                                 [&lowered](const CommandEntry& e) { return e.name == lowered; });
    if (it == kCommandTable.end()) {
        return Command{Unrecognized{}};
    }

    return it->parse(args);
}

resp::Frame to_frame(const Command& command) {
    using resp::Frame;

    return std::visit(
        [](const auto& c) -> Frame {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, Get>) {
                return request("get", {Frame::bulk(c.key)});
            } else if constexpr (std::is_same_v<T, Set>) {
                return request("set", {Frame::bulk(c.key), c.value});
            } else if constexpr (std::is_same_v<T, HGet>) {
                return request("hget", {Frame::bulk(c.key), Frame::bulk(c.field)});
            } else if constexpr (std::is_same_v<T, HSet>) {
                return request("hset", {Frame::bulk(c.key), Frame::bulk(c.field), c.value});
            } else if constexpr (std::is_same_v<T, HGetAll>) {
                return request("hgetall", {Frame::bulk(c.key)});
            } else if constexpr (std::is_same_v<T, HMGet>) {
                std::vector<Frame> args{Frame::bulk(c.key)};
                for (const auto& field : c.fields) {
                    args.push_back(Frame::bulk(field));
                }
                return request("hmget", std::move(args));
            } else if constexpr (std::is_same_v<T, Echo>) {
                return request("echo", {Frame::bulk(c.text)});
            } else if constexpr (std::is_same_v<T, Sadd>) {
                return request("sadd", {Frame::bulk(c.key), c.item});
            } else if constexpr (std::is_same_v<T, Sismember>) {
                return request("sismember", {Frame::bulk(c.key), c.item});
            } else if constexpr (std::is_same_v<T, Unrecognized>) {
                return request("unrecognized", {});
            }
        },
        command);
}

std::string_view command_name(const Command& command) noexcept {
    return std::visit(
        [](const auto& c) -> std::string_view {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, Get>)            return "get";
            else if constexpr (std::is_same_v<T, Set>)       return "set";
            else if constexpr (std::is_same_v<T, HGet>)      return "hget";
            else if constexpr (std::is_same_v<T, HSet>)      return "hset";
            else if constexpr (std::is_same_v<T, HGetAll>)   return "hgetall";
            else if constexpr (std::is_same_v<T, HMGet>)     return "hmget";
            else if constexpr (std::is_same_v<T, Echo>)      return "echo";
            else if constexpr (std::is_same_v<T, Sadd>)      return "sadd";
            else if constexpr (std::is_same_v<T, Sismember>) return "sismember";
            else                                             return "unrecognized";
        },
        command);
}

} // namespace respkv::cmd
