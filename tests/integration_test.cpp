// Integration test: starts a real Server in a background thread on an
// ephemeral port, connects via a synchronous TCP socket, and verifies
// request/reply round-trips at the byte level.

#include "common/logger.hpp"
#include "common/server_config.hpp"
#include "network/server.hpp"
#include "resp/decoder.hpp"
#include "resp/encoder.hpp"
#include "storage/backend.hpp"

#include <gtest/gtest.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace {

using tcp = boost::asio::ip::tcp;
using respkv::resp::Frame;

constexpr const char* TEST_HOST = "127.0.0.1";

// ---------------------------------------------------------------------------
// Thin synchronous TCP helper used in tests.
// ---------------------------------------------------------------------------
class SyncClient {
public:
    explicit SyncClient(std::uint16_t port) : ioc_(1), socket_(ioc_) {
        tcp::resolver resolver{ioc_};
        auto endpoints = resolver.resolve(TEST_HOST, std::to_string(port));
        boost::asio::connect(socket_, endpoints);
    }

    // Send raw bytes exactly as given.
    void send_raw(const std::string& bytes) {
        boost::asio::write(socket_, boost::asio::buffer(bytes));
    }

    // Encode `words` as an array of bulk strings and send it.
    void send(const std::vector<std::string>& words) {
        std::vector<Frame> items;
        items.reserve(words.size());
        for (const auto& w : words) {
            items.push_back(Frame::bulk(w));
        }
        send_raw(respkv::resp::encode(Frame::array(std::move(items))));
    }

    // Read until one complete reply frame is buffered and return its exact
    // wire bytes.
    std::string recv_raw() {
        for (;;) {
            auto length = respkv::resp::expect_length(buf_);
            if (auto* n = std::get_if<std::size_t>(&length)) {
                std::string frame = buf_.substr(0, *n);
                buf_.erase(0, *n);
                return frame;
            }
            if (!std::get<respkv::resp::DecodeError>(length).incomplete()) {
                throw std::runtime_error("malformed reply from server");
            }
            fill();
        }
    }

    Frame recv() {
        std::string wire = recv_raw();
        auto decoded = respkv::resp::decode(wire);
        if (!std::holds_alternative<Frame>(decoded)) {
            throw std::runtime_error("undecodable reply from server");
        }
        return std::get<Frame>(std::move(decoded));
    }

    // Convenience: send a command and return the decoded reply.
    Frame cmd(const std::vector<std::string>& words) {
        send(words);
        return recv();
    }

    // Read everything until the server closes the connection.
    std::string drain_until_closed() {
        for (;;) {
            char chunk[512];
            boost::system::error_code ec;
            const std::size_t n = socket_.read_some(boost::asio::buffer(chunk), ec);
            buf_.append(chunk, n);
            if (ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset) {
                break;
            }
            if (ec) {
                throw boost::system::system_error(ec);
            }
        }
        std::string out;
        out.swap(buf_);
        return out;
    }

private:
    void fill() {
        char chunk[512];
        const std::size_t n = socket_.read_some(boost::asio::buffer(chunk));
        buf_.append(chunk, n);
    }

    boost::asio::io_context ioc_;
    tcp::socket socket_;
    std::string buf_;
};

// ---------------------------------------------------------------------------
// Test fixture: manages server lifetime.
// ---------------------------------------------------------------------------
class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        respkv::init_default_logger(spdlog::level::warn);

        respkv::ServerConfig cfg;
        cfg.host       = TEST_HOST;
        cfg.port       = 0;
        cfg.threads    = 2;
        cfg.read_chunk = respkv::kMinReadChunk;
        configure(cfg);

        server_ = std::make_unique<respkv::network::Server>(cfg, backend_);
        server_thread_ = std::thread([this] { server_->run(); });

        // Give the server a moment to start accepting before connecting.
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    void TearDown() override {
        server_->stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
    }

    // Per-fixture overrides applied before the server starts.
    virtual void configure(respkv::ServerConfig& /*cfg*/) {}

    std::uint16_t port() const { return server_->port(); }

    respkv::storage::Backend backend_;
    std::unique_ptr<respkv::network::Server> server_;
    std::thread server_thread_;
};

// ---------------------------------------------------------------------------
// Tests
// ---------------------------------------------------------------------------

TEST_F(IntegrationTest, BindsEphemeralPort) {
    EXPECT_NE(port(), 0u);
}

TEST_F(IntegrationTest, SetThenGetExactBytes) {
    SyncClient client{port()};
    client.send_raw("*3\r\n$3\r\nset\r\n$3\r\nfoo\r\n$3\r\nbar\r\n");
    EXPECT_EQ(client.recv_raw(), "+OK\r\n");
    client.send_raw("*2\r\n$3\r\nget\r\n$3\r\nfoo\r\n");
    EXPECT_EQ(client.recv_raw(), "$3\r\nbar\r\n");
}

TEST_F(IntegrationTest, GetOnEmptyStoreIsNull) {
    SyncClient client{port()};
    client.send_raw("*2\r\n$3\r\nget\r\n$5\r\nhello\r\n");
    EXPECT_EQ(client.recv_raw(), "_\r\n");
}

TEST_F(IntegrationTest, HmgetOmitsAbsentFields) {
    SyncClient client{port()};
    EXPECT_EQ(client.cmd({"hset", "key", "field", "value"}), Frame::simple("OK"));
    EXPECT_EQ(client.cmd({"hmget", "key", "field", "other"}),
              Frame::array({Frame::bulk("value")}));
}

TEST_F(IntegrationTest, UnknownCommandRepliesOk) {
    SyncClient client{port()};
    client.send_raw("*1\r\n$4\r\nnoop\r\n");
    EXPECT_EQ(client.recv_raw(), "+OK\r\n");
}

TEST_F(IntegrationTest, HgetallRepliesMap) {
    SyncClient client{port()};
    client.cmd({"hset", "h", "b", "2"});
    client.cmd({"hset", "h", "a", "1"});
    client.send({"hgetall", "h"});
    EXPECT_EQ(client.recv_raw(), "%2\r\n$1\r\na\r\n$1\r\n1\r\n$1\r\nb\r\n$1\r\n2\r\n");
}

TEST_F(IntegrationTest, EchoAndSets) {
    SyncClient client{port()};
    EXPECT_EQ(client.cmd({"ECHO", "hi"}), Frame::simple("hi"));
    EXPECT_EQ(client.cmd({"sadd", "s", "m"}), Frame::integer(1));
    EXPECT_EQ(client.cmd({"sadd", "s", "m"}), Frame::integer(0));
    EXPECT_EQ(client.cmd({"sismember", "s", "m"}), Frame::integer(1));
    EXPECT_EQ(client.cmd({"sismember", "s", "x"}), Frame::integer(0));
}

TEST_F(IntegrationTest, CommandErrorKeepsConnectionOpen) {
    SyncClient client{port()};
    client.send({"get", "hello", "extra"});
    EXPECT_EQ(client.recv_raw(), "-ERR get command must have exactly 1 argument\r\n");

    EXPECT_EQ(client.cmd({"set", "k", "v"}), Frame::simple("OK"));
    EXPECT_EQ(client.cmd({"get", "k"}), Frame::bulk("v"));
}

TEST_F(IntegrationTest, NonArrayRequestIsCommandError) {
    SyncClient client{port()};
    client.send_raw("+PING\r\n");
    EXPECT_EQ(client.recv_raw(), "-ERR command must be an array\r\n");
    EXPECT_EQ(client.cmd({"echo", "still here"}), Frame::simple("still here"));
}

TEST_F(IntegrationTest, ProtocolErrorClosesConnection) {
    SyncClient client{port()};
    client.send_raw("!bogus\r\n");
    const auto rest = client.drain_until_closed();
    EXPECT_EQ(rest.rfind("-ERR protocol error: ", 0), 0u) << rest;
    EXPECT_EQ(rest.substr(rest.size() - 2), "\r\n");
}

TEST_F(IntegrationTest, ProtocolErrorReplyIsSingleLine) {
    SyncClient client{port()};
    // The bad integer carries a bare LF; the reply must still be one line.
    client.send_raw(":1\n2\r\n");
    const auto rest = client.drain_until_closed();
    EXPECT_EQ(rest, "-ERR protocol error: invalid integer '1?2'\r\n");

    auto wire = rest;
    auto decoded = respkv::resp::decode(wire);
    ASSERT_TRUE(std::holds_alternative<Frame>(decoded));
    EXPECT_TRUE(std::get<Frame>(decoded).is<respkv::resp::SimpleError>());
    EXPECT_TRUE(wire.empty());
}

TEST_F(IntegrationTest, ProtocolErrorReplyIsValidUtf8) {
    SyncClient client{port()};
    client.send_raw(std::string(":\xff\xfe\r\n"));
    const auto rest = client.drain_until_closed();
    EXPECT_EQ(rest, "-ERR protocol error: invalid integer '??'\r\n");

    auto wire = rest;
    EXPECT_TRUE(std::holds_alternative<Frame>(respkv::resp::decode(wire)));
}

TEST_F(IntegrationTest, RequestSplitAcrossWrites) {
    SyncClient client{port()};
    const std::string wire = "*3\r\n$3\r\nset\r\n$5\r\nsplit\r\n$5\r\nvalue\r\n";
    for (char c : wire) {
        client.send_raw(std::string(1, c));
    }
    EXPECT_EQ(client.recv_raw(), "+OK\r\n");
    EXPECT_EQ(client.cmd({"get", "split"}), Frame::bulk("value"));
}

TEST_F(IntegrationTest, LargeValueSpansManyReads) {
    SyncClient client{port()};
    const std::string big(100000, 'x');
    EXPECT_EQ(client.cmd({"set", "big", big}), Frame::simple("OK"));
    EXPECT_EQ(client.cmd({"get", "big"}), Frame::bulk(big));
}

TEST_F(IntegrationTest, PipelineMultipleCommands) {
    SyncClient client{port()};
    // Send several commands back-to-back before reading responses.
    client.send_raw("*3\r\n$3\r\nset\r\n$2\r\np1\r\n$3\r\naaa\r\n"
                    "*3\r\n$3\r\nset\r\n$2\r\np2\r\n$3\r\nbbb\r\n"
                    "*2\r\n$3\r\nget\r\n$2\r\np1\r\n"
                    "*2\r\n$3\r\nget\r\n$2\r\np2\r\n"
                    "*1\r\n$4\r\nnoop\r\n");

    EXPECT_EQ(client.recv_raw(), "+OK\r\n");
    EXPECT_EQ(client.recv_raw(), "+OK\r\n");
    EXPECT_EQ(client.recv_raw(), "$3\r\naaa\r\n");
    EXPECT_EQ(client.recv_raw(), "$3\r\nbbb\r\n");
    EXPECT_EQ(client.recv_raw(), "+OK\r\n");
}

TEST_F(IntegrationTest, MultipleConnectionsShareStore) {
    SyncClient c1{port()};
    SyncClient c2{port()};

    EXPECT_EQ(c1.cmd({"set", "shared", "42"}), Frame::simple("OK"));
    EXPECT_EQ(c2.cmd({"get", "shared"}), Frame::bulk("42"));
    EXPECT_EQ(backend_.get("shared"), Frame::bulk("42"));
}

TEST_F(IntegrationTest, ConcurrentClients) {
    constexpr int kClients = 4;
    constexpr int kOps = 50;

    std::vector<std::thread> threads;
    for (int c = 0; c < kClients; ++c) {
        threads.emplace_back([this, c] {
            SyncClient client{port()};
            for (int i = 0; i < kOps; ++i) {
                const auto key = "c" + std::to_string(c) + "_" + std::to_string(i);
                EXPECT_EQ(client.cmd({"set", key, std::to_string(i)}), Frame::simple("OK"));
                EXPECT_EQ(client.cmd({"get", key}), Frame::bulk(std::to_string(i)));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(backend_.key_count(), static_cast<std::size_t>(kClients * kOps));
}

// ---------------------------------------------------------------------------
// Server with a small per-connection query buffer.
// ---------------------------------------------------------------------------
class QueryBufferLimitTest : public IntegrationTest {
protected:
    static constexpr std::size_t kLimit = 1024;

    void configure(respkv::ServerConfig& cfg) override { cfg.max_query_buffer = kLimit; }
};

TEST_F(QueryBufferLimitTest, OversizedPendingFrameClosesConnection) {
    SyncClient client{port()};
    // A bulk string announced far larger than the limit, followed by exactly
    // seventeen reads' worth of bytes: the 17th read pushes the buffer over.
    std::string wire = "$100000\r\n";
    wire.append(17 * respkv::kMinReadChunk - wire.size(), 'x');
    client.send_raw(wire);

    const auto rest = client.drain_until_closed();
    EXPECT_EQ(rest, "-ERR protocol error: query buffer limit exceeded\r\n");

    SyncClient other{port()};
    EXPECT_EQ(other.cmd({"echo", "alive"}), Frame::simple("alive"));
    EXPECT_EQ(backend_.key_count(), 0u);
}

TEST_F(QueryBufferLimitTest, DrainedPipelineMayExceedLimit) {
    SyncClient client{port()};
    std::string wire;
    constexpr int kCommands = 64;
    for (int i = 0; i < kCommands; ++i) {
        wire += "*3\r\n$3\r\nset\r\n$2\r\nk" + std::to_string(i % 10) + "\r\n$3\r\nabc\r\n";
    }
    ASSERT_GT(wire.size(), kLimit);
    client.send_raw(wire);
    for (int i = 0; i < kCommands; ++i) {
        EXPECT_EQ(client.recv_raw(), "+OK\r\n");
    }
    EXPECT_EQ(client.cmd({"get", "k3"}), Frame::bulk("abc"));
}

TEST_F(QueryBufferLimitTest, ValueBelowLimitIsAccepted) {
    SyncClient client{port()};
    const std::string value(kLimit / 2, 'v');
    EXPECT_EQ(client.cmd({"set", "half", value}), Frame::simple("OK"));
    EXPECT_EQ(client.cmd({"get", "half"}), Frame::bulk(value));
}

} // namespace
