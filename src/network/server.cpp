#include "network/server.hpp"
#include "network/session.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <thread>
#include <vector>

namespace respkv::network {

namespace asio = boost::asio;

Server::Server(const ServerConfig& cfg, storage::Backend backend)
    : host_(cfg.host),
      port_(cfg.port),
      threads_(std::max(1u, cfg.threads)),
      read_chunk_(cfg.read_chunk),
      max_query_buffer_(cfg.max_query_buffer),
      backend_(std::move(backend)),
      ioc_(static_cast<int>(threads_)),
      acceptor_(ioc_) {
    const auto address = asio::ip::make_address(host_);
    const asio::ip::tcp::endpoint endpoint{address, port_};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();

    spdlog::info("Server listening on {}:{}", host_, port_);
}

void Server::run() {
    // Install SIGINT / SIGTERM handler for graceful shutdown.
    asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            spdlog::info("Server: received signal {}, shutting down", signo);
            stop();
        }
    });

    asio::co_spawn(ioc_, accept_loop(), asio::detached);

    // Run the io_context across a thread pool.
    std::vector<std::thread> pool;
    pool.reserve(threads_ - 1);
    for (unsigned int i = 1; i < threads_; ++i) {
        pool.emplace_back([this] { ioc_.run(); });
    }

    ioc_.run(); // Run on the calling thread as well.

    for (auto& t : pool) {
        t.join();
    }

    spdlog::info("Server: io_context stopped, all threads joined "
                 "(keys={}, hashes={}, sets={})",
                 backend_.key_count(), backend_.hash_count(), backend_.set_count());
}

void Server::stop() {
    asio::post(ioc_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
        ioc_.stop();
    });
}

asio::awaitable<void> Server::accept_loop() {
    spdlog::info("Server: accept loop started");

    for (;;) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_.async_accept(asio::redirect_error(asio::use_awaitable, ec));

        if (ec) {
            if (ec != asio::error::operation_aborted) {
                spdlog::warn("Server: accept error: {}", ec.message());
            }
            break; // Acceptor was closed – time to stop.
        }

        // Disable Nagle – send responses immediately.
        socket.set_option(asio::ip::tcp::no_delay(true), ec);
        if (ec) {
            spdlog::debug("Server: could not set TCP_NODELAY: {}", ec.message());
        }

        auto session = std::make_shared<Session>(std::move(socket), backend_, read_chunk_,
                                                 max_query_buffer_);
        asio::co_spawn(
            ioc_,
            [sp = std::move(session)]() -> asio::awaitable<void> {
                co_await sp->run();
            },
            asio::detached);
    }

    spdlog::info("Server: accept loop exited");
}

} // namespace respkv::network
