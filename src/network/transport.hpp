/**
 * @file transport.hpp
 * @brief TCP transport for the API surface with length-prefixed framing.
 * @author Dimitris Kafetzis
 *
 * Provides both client (connect + request/response) and server (accept +
 * handle) sides. Messages are framed as [4-byte big-endian length][payload].
 * A connection may carry any number of request/response exchanges; the
 * server answers each frame in order until the peer closes or goes idle.
 * Each accepted connection is served on its own thread, up to
 * MAX_CONNECTIONS at once.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <string>
#include <thread>
#include <vector>

namespace kubesim {

/**
 * @brief Length-prefixed TCP transport.
 *
 * Wire format per message:
 *   [uint32_t big-endian length][payload bytes]
 *
 * Maximum message size: 16 MB.
 */
class TcpTransport {
public:
    static constexpr uint32_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;  // 16 MB
    static constexpr int DEFAULT_BACKLOG = 16;
    static constexpr uint32_t IDLE_TIMEOUT_MS = 30000;
    static constexpr size_t MAX_CONNECTIONS = 64;

    TcpTransport();
    ~TcpTransport();

    // Non-copyable
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // ── Client-side ──────────────────────────
    Result<void> connect(const std::string& address, uint16_t port,
                         uint32_t timeout_ms = 5000);
    Result<void> send(const std::vector<uint8_t>& data);
    Result<std::vector<uint8_t>> receive(uint32_t timeout_ms = 10000);

    /// send() followed by receive() on the same connection.
    Result<std::vector<uint8_t>> request(const std::vector<uint8_t>& data,
                                         uint32_t timeout_ms = 10000);
    void disconnect();

    // ── Server-side ──────────────────────────
    using MessageHandler = std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)>;

    /// Bind and listen. Port 0 picks an ephemeral port (see bound_port()).
    Result<void> listen(uint16_t port,
                        const std::string& bind_address = "0.0.0.0",
                        int backlog = DEFAULT_BACKLOG);
    void serve(MessageHandler handler);
    void stop_serving();

    // ── State queries ────────────────────────
    [[nodiscard]] bool is_connected() const noexcept;
    [[nodiscard]] bool is_listening() const noexcept;
    [[nodiscard]] uint16_t bound_port() const noexcept { return bound_port_; }

private:
    enum class IoStatus : uint8_t { Ok, Closed, TimedOut, Failed };

    // Wire helpers
    static Result<void> send_frame(int fd, const std::vector<uint8_t>& data);
    static IoStatus recv_frame(int fd, uint32_t timeout_ms, std::vector<uint8_t>& out);
    static IoStatus send_all(int fd, const void* buf, size_t len, uint32_t timeout_ms);
    static IoStatus recv_all(int fd, void* buf, size_t len, uint32_t timeout_ms);

    // `worker` is declared last so it is joined before `done` is destroyed.
    struct Connection {
        std::atomic<bool> done{false};
        std::jthread worker;
    };

    void handle_connection(int fd, const MessageHandler& handler, std::stop_token stop);

    int client_fd_ = -1;
    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::jthread serve_thread_;
    std::atomic<bool> serving_{false};
};

}  // namespace kubesim
