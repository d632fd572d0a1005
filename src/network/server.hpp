#pragma once

#include "common/server_config.hpp"
#include "storage/backend.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace respkv::network {

// Owns the io_context and TCP acceptor.
//
// Usage:
//   Server srv{cfg, backend};
//   srv.run();   // blocks until SIGINT/SIGTERM or stop()
class Server {
public:
    // Binds and listens immediately; throws boost::system::system_error if the
    // address cannot be bound.
    Server(const ServerConfig& cfg, storage::Backend backend);

    // Starts the thread pool, begins accepting connections, and installs signal
    // handlers for graceful shutdown (SIGINT / SIGTERM).
    // Blocks until the server stops.
    void run();

    // Stops the io_context, causing run() to return.  Safe to call from any
    // thread.
    void stop();

    // Port actually bound (differs from the configured one when that is 0).
    [[nodiscard]] std::uint16_t port() const { return port_; }

private:
    // Accept loop coroutine – runs until the acceptor is closed.
    boost::asio::awaitable<void> accept_loop();

    std::string host_;
    std::uint16_t port_;
    unsigned int threads_;
    std::size_t read_chunk_;
    std::size_t max_query_buffer_;
    storage::Backend backend_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
};

} // namespace respkv::network
