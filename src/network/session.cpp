#include "network/session.hpp"
#include "cmd/command.hpp"
#include "cmd/executor.hpp"
#include "resp/decoder.hpp"
#include "resp/encoder.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <string_view>
#include <utility>
#include <variant>

namespace respkv::network {

namespace asio = boost::asio;

namespace {

bool is_disconnect(const boost::system::error_code& ec) {
    return ec == asio::error::eof || ec == asio::error::connection_reset ||
           ec == asio::error::operation_aborted;
}

// Decoder messages quote client bytes; the reply line must stay decodable.
void append_protocol_error(std::string_view detail, std::string& out) {
    resp::encode_to(
        resp::Frame::error(fmt::format("ERR protocol error: {}", resp::sanitize_line(detail))),
        out);
}

} // namespace

Session::Session(asio::ip::tcp::socket socket, storage::Backend backend,
                 std::size_t read_chunk, std::size_t max_query_buffer)
    : socket_(std::move(socket)),
      backend_(std::move(backend)),
      read_chunk_(read_chunk),
      max_query_buffer_(max_query_buffer) {}

std::string Session::handle_frame(resp::Frame frame, storage::Backend& backend) {
    auto parsed = cmd::try_command(std::move(frame));
    if (auto* err = std::get_if<cmd::CommandError>(&parsed)) {
        spdlog::debug("Session: rejected command ({}): {}", cmd::to_string(err->code), err->message);
        return resp::encode(resp::Frame::error("ERR " + err->message));
    }

    auto& command = std::get<cmd::Command>(parsed);
    spdlog::trace("Session: executing '{}'", cmd::command_name(command));
    return resp::encode(cmd::execute(std::move(command), backend));
}

asio::awaitable<void> Session::run() {
    const auto remote = [&]() -> std::string {
        boost::system::error_code ec;
        const auto ep = socket_.remote_endpoint(ec);
        return ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
    }();

    spdlog::debug("Session::run() - client connected from {}", remote);

    std::string buf;
    buf.reserve(read_chunk_);

    for (;;) {
        // Append one chunk to the receive buffer.
        const std::size_t filled = buf.size();
        buf.resize(filled + read_chunk_);

        boost::system::error_code ec;
        const std::size_t n = co_await socket_.async_read_some(
            asio::buffer(buf.data() + filled, read_chunk_),
            asio::redirect_error(asio::use_awaitable, ec));
        buf.resize(filled + n);

        if (ec) {
            if (!is_disconnect(ec)) {
                spdlog::warn("Session {}: read error: {}", remote, ec.message());
            }
            break;
        }

        // Drain every complete frame; a partial tail stays in `buf`.
        std::string out;
        bool fatal = false;
        for (;;) {
            auto decoded = resp::decode(buf);
            if (auto* err = std::get_if<resp::DecodeError>(&decoded)) {
                if (err->incomplete()) {
                    break;
                }
                spdlog::warn("Session {}: protocol error ({}): {}",
                             remote, resp::to_string(err->code), err->message);
                append_protocol_error(err->message, out);
                fatal = true;
                break;
            }
            out += handle_frame(std::move(std::get<resp::Frame>(decoded)), backend_);
        }

        if (!fatal && buf.size() > max_query_buffer_) {
            spdlog::warn("Session {}: query buffer limit exceeded ({} > {} bytes)",
                         remote, buf.size(), max_query_buffer_);
            append_protocol_error("query buffer limit exceeded", out);
            fatal = true;
        }

        if (!out.empty()) {
            boost::system::error_code wec;
            co_await asio::async_write(socket_, asio::buffer(out),
                                       asio::redirect_error(asio::use_awaitable, wec));
            if (wec) {
                if (!is_disconnect(wec)) {
                    spdlog::warn("Session {}: write error: {}", remote, wec.message());
                }
                break;
            }
        }

        if (fatal) {
            // The byte stream cannot be resynchronised after a bad frame.
            break;
        }
    }

    boost::system::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    spdlog::debug("Session::run() - client disconnected: {}", remote);
}

} // namespace respkv::network
