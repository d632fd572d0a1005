#include "common/logger.hpp"
#include "common/server_config.hpp"
#include "network/server.hpp"
#include "storage/backend.hpp"

#include <boost/system/system_error.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <stdexcept>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    respkv::ServerConfig cfg;
    try {
        cfg = respkv::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    respkv::init_default_logger(respkv::parse_log_level(cfg.log_level));

    spdlog::info("respkv-server starting – {}:{} threads={} read_chunk={} max_query_buffer={}",
                 cfg.host, cfg.port, cfg.threads, cfg.read_chunk, cfg.max_query_buffer);

    // ── Storage ──────────────────────────────────────────────────────────────
    // One shared handle; every session gets a copy of it.
    respkv::storage::Backend backend;

    // ── Serve ────────────────────────────────────────────────────────────────
    try {
        respkv::network::Server server{cfg, backend};
        server.run();
    } catch (const boost::system::system_error& e) {
        spdlog::error("Failed to start server on {}:{}: {}", cfg.host, cfg.port, e.what());
        return 1;
    }

    spdlog::info("respkv-server stopped");
    return 0;
}
