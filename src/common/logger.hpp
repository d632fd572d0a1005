#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace respkv {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger named "respkv" (server, CLI, tests).
// Call once at program start before any logging.  Calling it again replaces
// the previous default logger.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

// True if `s` names one of the levels accepted by parse_log_level().
[[nodiscard]] bool is_known_log_level(const std::string& s);

} // namespace respkv
