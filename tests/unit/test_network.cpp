/**
 * @file test_network.cpp
 * @brief Unit tests for TcpTransport framing over loopback.
 * @author Dimitris Kafetzis
 */

#include "network/transport.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace kubesim;

namespace {

/// Echo server on an ephemeral loopback port.
class EchoServer {
public:
    EchoServer() {
        auto listening = server.listen(0, "127.0.0.1");
        EXPECT_TRUE(listening.has_value()) << (listening ? "" : listening.error().message);
        server.serve([this](const std::vector<uint8_t>& request) {
            ++handled;
            std::vector<uint8_t> reply{'E', ':'};
            reply.insert(reply.end(), request.begin(), request.end());
            return reply;
        });
    }

    uint16_t port() const { return server.bound_port(); }

    std::atomic<int> handled{0};
    TcpTransport server;
};

std::vector<uint8_t> bytes(const std::string& s) {
    return {s.begin(), s.end()};
}

}  // namespace

// ═══════════════════════════════════════════════
// TcpTransport Tests
// ═══════════════════════════════════════════════

TEST(TcpTransportTest, DefaultState) {
    TcpTransport transport;
    EXPECT_FALSE(transport.is_connected());
    EXPECT_FALSE(transport.is_listening());
    EXPECT_EQ(transport.bound_port(), 0);
}

TEST(TcpTransportTest, SendWithoutConnect) {
    TcpTransport transport;
    auto result = transport.send({0x01, 0x02, 0x03});
    EXPECT_FALSE(result.has_value());
}

TEST(TcpTransportTest, ReceiveWithoutConnect) {
    TcpTransport transport;
    auto result = transport.receive(100);
    EXPECT_FALSE(result.has_value());
}

TEST(TcpTransportTest, InvalidAddress) {
    TcpTransport transport;
    auto result = transport.connect("not-an-ip", 5000, 100);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Validation);
}

TEST(TcpTransportTest, ListenOnEphemeralPort) {
    TcpTransport server;
    auto listening = server.listen(0, "127.0.0.1");
    ASSERT_TRUE(listening.has_value()) << listening.error().message;
    EXPECT_TRUE(server.is_listening());
    EXPECT_NE(server.bound_port(), 0);

    auto twice = server.listen(0, "127.0.0.1");
    EXPECT_FALSE(twice.has_value());

    server.stop_serving();
    EXPECT_FALSE(server.is_listening());
}

TEST(TcpTransportTest, ConnectToClosedPort) {
    uint16_t port = 0;
    {
        TcpTransport probe;
        ASSERT_TRUE(probe.listen(0, "127.0.0.1"));
        port = probe.bound_port();
    }
    TcpTransport client;
    auto result = client.connect("127.0.0.1", port, 500);
    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(client.is_connected());
}

TEST(TcpTransportTest, RequestResponse) {
    EchoServer echo;

    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", echo.port(), 2000));
    auto reply = client.request(bytes("ping"), 2000);
    ASSERT_TRUE(reply.has_value()) << reply.error().message;
    EXPECT_EQ(*reply, bytes("E:ping"));
}

TEST(TcpTransportTest, SeveralFramesPerConnection) {
    EchoServer echo;

    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", echo.port(), 2000));
    for (int i = 0; i < 5; ++i) {
        auto payload = bytes("msg-" + std::to_string(i));
        auto reply = client.request(payload, 2000);
        ASSERT_TRUE(reply.has_value()) << reply.error().message;
        EXPECT_EQ(reply->size(), payload.size() + 2);
    }
    EXPECT_EQ(echo.handled.load(), 5);
}

TEST(TcpTransportTest, EmptyAndLargeFrames) {
    EchoServer echo;

    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", echo.port(), 2000));

    auto empty = client.request({}, 2000);
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(*empty, bytes("E:"));

    std::vector<uint8_t> large(512 * 1024, 0xAB);
    auto reply = client.request(large, 5000);
    ASSERT_TRUE(reply.has_value()) << reply.error().message;
    EXPECT_EQ(reply->size(), large.size() + 2);
    EXPECT_EQ(reply->back(), 0xAB);
}

TEST(TcpTransportTest, SequentialClients) {
    EchoServer echo;

    for (int i = 0; i < 3; ++i) {
        TcpTransport client;
        ASSERT_TRUE(client.connect("127.0.0.1", echo.port(), 2000));
        auto reply = client.request(bytes("x"), 2000);
        ASSERT_TRUE(reply.has_value());
        client.disconnect();
        EXPECT_FALSE(client.is_connected());
    }
    EXPECT_EQ(echo.handled.load(), 3);
}

TEST(TcpTransportTest, OpenConnectionDoesNotBlockOtherClients) {
    EchoServer echo;

    TcpTransport idle;
    ASSERT_TRUE(idle.connect("127.0.0.1", echo.port(), 2000));
    ASSERT_TRUE(idle.request(bytes("first"), 2000).has_value());

    // The first connection stays open while a second client is served.
    TcpTransport other;
    ASSERT_TRUE(other.connect("127.0.0.1", echo.port(), 2000));
    auto reply = other.request(bytes("second"), 2000);
    ASSERT_TRUE(reply.has_value()) << reply.error().message;
    EXPECT_EQ(*reply, bytes("E:second"));

    auto again = idle.request(bytes("third"), 2000);
    ASSERT_TRUE(again.has_value()) << again.error().message;
    EXPECT_EQ(*again, bytes("E:third"));
    EXPECT_EQ(echo.handled.load(), 3);
}

TEST(TcpTransportTest, SlowHandlerDoesNotBlockOtherClients) {
    TcpTransport server;
    ASSERT_TRUE(server.listen(0, "127.0.0.1"));
    server.serve([](const std::vector<uint8_t>& request) {
        if (!request.empty() && request.front() == 's') {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        }
        return request;
    });

    std::jthread slow_client([port = server.bound_port()] {
        TcpTransport slow;
        ASSERT_TRUE(slow.connect("127.0.0.1", port, 2000));
        auto reply = slow.request(bytes("slow"), 5000);
        EXPECT_TRUE(reply.has_value());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    TcpTransport fast;
    ASSERT_TRUE(fast.connect("127.0.0.1", server.bound_port(), 2000));
    auto start = std::chrono::steady_clock::now();
    auto reply = fast.request(bytes("fast"), 1000);
    ASSERT_TRUE(reply.has_value()) << reply.error().message;
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(1000));

    slow_client.join();
    server.stop_serving();
}

TEST(TcpTransportTest, ReceiveTimesOut) {
    TcpTransport server;
    ASSERT_TRUE(server.listen(0, "127.0.0.1"));
    // Never served, so the connection completes in the backlog but nothing answers.
    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", server.bound_port(), 2000));

    auto start = std::chrono::steady_clock::now();
    auto reply = client.receive(100);
    EXPECT_FALSE(reply.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST(TcpTransportTest, StopServingIsIdempotent) {
    EchoServer echo;
    echo.server.stop_serving();
    echo.server.stop_serving();
    EXPECT_FALSE(echo.server.is_listening());
}
