#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <boost/program_options.hpp>

namespace respkv {

// Same default as Redis client-query-buffer-limit.
inline constexpr std::size_t kDefaultMaxQueryBuffer = std::size_t{1} << 30;

// ── ServerConfig ──────────────────────────────────────────────────────────────
// Full configuration for one respkv-server process.
// Populated by parse_config() from CLI arguments.

struct ServerConfig {
    std::string   host       = "0.0.0.0"; // Bind address for client connections
    std::uint16_t port       = 6379;      // Client port (0 = ephemeral, tests only)
    unsigned int  threads    = 1;         // io_context worker threads
    std::size_t   read_chunk = 4096;      // Bytes requested per socket read
    std::size_t   max_query_buffer = kDefaultMaxQueryBuffer; // Undecoded bytes kept per client
    std::string   log_level  = "info";    // spdlog level string
};

// Limits enforced on --read-chunk.
inline constexpr std::size_t kMinReadChunk = 64;
inline constexpr std::size_t kMaxReadChunk = 1024 * 1024;

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ServerConfig.
//
// On success: returns a fully validated ServerConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help also throws, carrying the help text as the message.
//
// Validates:
//   - port in [1, 65535]
//   - threads > 0
//   - read-chunk in [kMinReadChunk, kMaxReadChunk]
//   - max-query-buffer >= read-chunk
//   - log-level is one of trace|debug|info|warn|error|critical

[[nodiscard]] ServerConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with server options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

// Validate an already populated config.  Throws std::runtime_error.
void validate(const ServerConfig& cfg);

} // namespace respkv
