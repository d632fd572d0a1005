#include "cmd/command.hpp"
#include "common/logger.hpp"
#include "resp/decoder.hpp"
#include "resp/encoder.hpp"
#include "resp/frame.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/program_options.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace po = boost::program_options;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

// Split an input line on whitespace into a request Array of bulk strings.
respkv::resp::Frame make_request(const std::string& line) {
    std::vector<respkv::resp::Frame> parts;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        parts.push_back(respkv::resp::Frame::bulk(token));
    }
    return respkv::resp::Frame::array(std::move(parts));
}

} // anonymous namespace

// ── REPL coroutine ────────────────────────────────────────────────────────────

asio::awaitable<void> repl(tcp::socket socket, std::size_t read_chunk) {
    std::string recv_buf;

    std::string line;
    while (true) {
        fprintf(stdout, "> ");
        fflush(stdout);

        if (!std::getline(std::cin, line)) {
            fprintf(stdout, "\n");
            break;
        }

        auto request = make_request(line);
        if (request.get_if<respkv::resp::Array>()->items.empty()) {
            continue;
        }

        // Local sanity check so typos in known commands are reported without
        // a round-trip; the server applies the same rules.
        if (auto checked = respkv::cmd::try_command(request);
            std::holds_alternative<respkv::cmd::CommandError>(checked)) {
            fprintf(stdout, "(error) %s\n",
                    std::get<respkv::cmd::CommandError>(checked).message.c_str());
            continue;
        }

        const std::string wire = respkv::resp::encode(request);

        boost::system::error_code wec;
        co_await asio::async_write(socket, asio::buffer(wire),
                                   asio::redirect_error(asio::use_awaitable, wec));
        if (wec) {
            spdlog::error("respkv-cli: send error: {}", wec.message());
            break;
        }

        // Read until one whole reply frame is buffered.
        bool done = false;
        while (!done) {
            auto decoded = respkv::resp::decode(recv_buf);
            if (auto* frame = std::get_if<respkv::resp::Frame>(&decoded)) {
                fprintf(stdout, "%s\n", respkv::resp::to_string(*frame).c_str());
                done = true;
                continue;
            }

            const auto& err = std::get<respkv::resp::DecodeError>(decoded);
            if (!err.incomplete()) {
                spdlog::error("respkv-cli: malformed reply: {}", err.message);
                co_return;
            }

            const std::size_t filled = recv_buf.size();
            recv_buf.resize(filled + read_chunk);
            boost::system::error_code rec;
            const std::size_t n = co_await socket.async_read_some(
                asio::buffer(recv_buf.data() + filled, read_chunk),
                asio::redirect_error(asio::use_awaitable, rec));
            recv_buf.resize(filled + n);

            if (rec) {
                if (rec == asio::error::eof) {
                    fprintf(stdout, "Server disconnected.\n");
                } else {
                    spdlog::error("respkv-cli: recv error: {}", rec.message());
                }
                co_return;
            }
        }
    }
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    po::options_description desc("respkv-cli options");
    desc.add_options()
        ("help,h",                                                       "Show this help")
        ("host",        po::value<std::string>()->default_value("127.0.0.1"), "Server host")
        ("port,p",      po::value<std::uint16_t>()->default_value(6379),      "Server port")
        ("log-level,l", po::value<std::string>()->default_value("warn"),      "Log level");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return 1;
    }

    if (vm.count("help")) {
        std::ostringstream oss;
        oss << desc;
        fprintf(stdout, "%s\n", oss.str().c_str());
        return 0;
    }

    const auto host      = vm["host"].as<std::string>();
    const auto port      = vm["port"].as<std::uint16_t>();
    const auto log_level = vm["log-level"].as<std::string>();

    respkv::init_default_logger(respkv::parse_log_level(log_level));

    spdlog::debug("respkv-cli connecting to {}:{}", host, port);

    try {
        asio::io_context ioc;
        tcp::resolver resolver{ioc};
        auto endpoints = resolver.resolve(host, std::to_string(port));

        tcp::socket socket{ioc};
        boost::system::error_code ec;
        asio::connect(socket, endpoints, ec);

        if (ec) {
            spdlog::error("respkv-cli: failed to connect to {}:{} – {}", host, port, ec.message());
            return 1;
        }

        socket.set_option(tcp::no_delay(true));

        fprintf(stdout, "Connected to %s:%u. "
                "Type commands (SET k v, GET k, HSET k f v, HMGET k f..., SADD k m, ...). "
                "Ctrl+D to quit.\n",
                host.c_str(), static_cast<unsigned>(port));

        asio::co_spawn(ioc, repl(std::move(socket), 4096), asio::detached);
        ioc.run();

    } catch (const std::exception& ex) {
        spdlog::error("respkv-cli: exception: {}", ex.what());
        return 1;
    }

    return 0;
}
