#include "common/server_config.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace respkv {

namespace {

unsigned int default_thread_count() {
    return std::max(1u, std::thread::hardware_concurrency());
}

} // anonymous namespace

// ── validate ──────────────────────────────────────────────────────────────────

void validate(const ServerConfig& cfg) {
    if (cfg.host.empty()) {
        throw std::runtime_error("--host must not be empty");
    }
    if (cfg.port == 0) {
        throw std::runtime_error("--port must be in [1, 65535], got 0");
    }
    if (cfg.threads == 0) {
        throw std::runtime_error("--threads must be > 0");
    }
    if (cfg.read_chunk < kMinReadChunk || cfg.read_chunk > kMaxReadChunk) {
        throw std::runtime_error(
            fmt::format("--read-chunk must be in [{}, {}], got {}",
                        kMinReadChunk, kMaxReadChunk, cfg.read_chunk));
    }
    if (cfg.max_query_buffer < cfg.read_chunk) {
        throw std::runtime_error(
            fmt::format("--max-query-buffer must be >= --read-chunk ({}), got {}",
                        cfg.read_chunk, cfg.max_query_buffer));
    }
    if (!is_known_log_level(cfg.log_level)) {
        throw std::runtime_error(
            fmt::format("--log-level must be one of trace|debug|info|warn|error|critical, got '{}'",
                        cfg.log_level));
    }
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("host",
            po::value<std::string>()->default_value("0.0.0.0"),
            "Bind address for client connections")
        ("port,p",
            po::value<std::uint16_t>()->default_value(6379),
            "Port for client (RESP) connections")
        ("threads",
            po::value<unsigned int>()->default_value(default_thread_count()),
            "Number of event-loop threads")
        ("read-chunk",
            po::value<std::size_t>()->default_value(4096),
            "Bytes requested from the socket per read")
        ("max-query-buffer",
            po::value<std::size_t>()->default_value(kDefaultMaxQueryBuffer),
            "Max undecoded bytes buffered per client before it is disconnected")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ServerConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("respkv-server options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    ServerConfig cfg;
    cfg.host       = vm["host"].as<std::string>();
    cfg.port       = vm["port"].as<std::uint16_t>();
    cfg.threads    = vm["threads"].as<unsigned int>();
    cfg.read_chunk = vm["read-chunk"].as<std::size_t>();
    cfg.max_query_buffer = vm["max-query-buffer"].as<std::size_t>();
    cfg.log_level  = vm["log-level"].as<std::string>();

    validate(cfg);
    return cfg;
}

} // namespace respkv
