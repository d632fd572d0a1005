#pragma once

#include "resp/frame.hpp"
#include "storage/backend.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstddef>
#include <string>

namespace respkv::network {

// Handles one TCP connection for its lifetime.
//
// Each Session is co_spawned from Server::accept_loop() and runs until the
// client disconnects, an I/O error occurs, the peer sends bytes that do not
// decode as RESP, or more than `max_query_buffer` undecoded bytes pile up.  Bytes are appended to a per-connection buffer; after every
// read the buffer is drained frame by frame and the replies are written back
// in request order.
class Session {
public:
    Session(boost::asio::ip::tcp::socket socket, storage::Backend backend,
            std::size_t read_chunk, std::size_t max_query_buffer);

    // Main coroutine.  Returns when the connection closes.
    boost::asio::awaitable<void> run();

    // Decode → command → execute for one request frame; returns the encoded
    // reply.  Command errors become a -ERR reply.
    [[nodiscard]] static std::string handle_frame(resp::Frame frame, storage::Backend& backend);

private:
    boost::asio::ip::tcp::socket socket_;
    storage::Backend backend_;
    std::size_t read_chunk_;
    std::size_t max_query_buffer_;
};

} // namespace respkv::network
