#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace respkv {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v";
constexpr const char* kDefaultName = "respkv";

} // namespace

void init_default_logger(spdlog::level::level_enum level) {
    spdlog::drop(kDefaultName);
    auto logger = spdlog::stdout_color_mt(kDefaultName);
    logger->set_pattern(kPattern);
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

spdlog::level::level_enum parse_log_level(const std::string& s) {
    if (s == "trace")    return spdlog::level::trace;
    if (s == "debug")    return spdlog::level::debug;
    if (s == "info")     return spdlog::level::info;
    if (s == "warn")     return spdlog::level::warn;
    if (s == "error")    return spdlog::level::err;
    if (s == "critical") return spdlog::level::critical;
    return spdlog::level::info;
}

bool is_known_log_level(const std::string& s) {
    return s == "trace" || s == "debug" || s == "info" || s == "warn" ||
           s == "error" || s == "critical";
}

} // namespace respkv
