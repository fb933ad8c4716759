/**
 * @file transport.cpp
 * @brief TcpTransport implementation: length-prefixed TCP messaging.
 * @author Dimitris Kafetzis
 *
 * Wire format: [uint32_t big-endian length][payload bytes]
 * Uses poll() for non-blocking I/O with timeouts.
 */

#include "network/transport.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace kubesim {

namespace {

constexpr int STOP_POLL_MS = 100;

void configure_socket(int fd) {
    int flag = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));
}

void encode_u32(uint8_t* buf, uint32_t val) {
    buf[0] = static_cast<uint8_t>((val >> 24) & 0xFF);
    buf[1] = static_cast<uint8_t>((val >> 16) & 0xFF);
    buf[2] = static_cast<uint8_t>((val >> 8) & 0xFF);
    buf[3] = static_cast<uint8_t>(val & 0xFF);
}

uint32_t decode_u32(const uint8_t* buf) {
    return (static_cast<uint32_t>(buf[0]) << 24)
         | (static_cast<uint32_t>(buf[1]) << 16)
         | (static_cast<uint32_t>(buf[2]) << 8)
         | static_cast<uint32_t>(buf[3]);
}

Error io_error(std::string what) {
    return Error{ErrorCode::Internal, std::move(what)};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

TcpTransport::TcpTransport() = default;

TcpTransport::~TcpTransport() {
    stop_serving();
    disconnect();
}

// ─────────────────────────────────────────────
// Client Side
// ─────────────────────────────────────────────

Result<void> TcpTransport::connect(const std::string& address, uint16_t port,
                                   uint32_t timeout_ms) {
    if (client_fd_ >= 0) {
        return io_error("already connected");
    }

    sockaddr_in server{};
    server.sin_family = AF_INET;
    server.sin_port = htons(port);
    if (::inet_pton(AF_INET, address.c_str(), &server.sin_addr) != 1) {
        return Error{ErrorCode::Validation, "invalid address: " + address};
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return io_error("socket: " + std::string(strerror(errno)));
    }

    int ret = ::connect(fd, reinterpret_cast<const sockaddr*>(&server), sizeof(server));
    if (ret < 0 && errno != EINPROGRESS) {
        int err = errno;
        ::close(fd);
        return io_error("connect to " + address + ":" + std::to_string(port) + ": "
                        + std::string(strerror(err)));
    }

    if (ret < 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        if (::poll(&pfd, 1, static_cast<int>(timeout_ms)) <= 0) {
            ::close(fd);
            return io_error("connect to " + address + ":" + std::to_string(port)
                            + " timed out");
        }

        int err = 0;
        socklen_t len = sizeof(err);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len);
        if (err != 0) {
            ::close(fd);
            return io_error("connect to " + address + ":" + std::to_string(port) + ": "
                            + std::string(strerror(err)));
        }
    }

    configure_socket(fd);
    client_fd_ = fd;
    return Result<void>{};
}

Result<void> TcpTransport::send(const std::vector<uint8_t>& data) {
    if (client_fd_ < 0) {
        return io_error("not connected");
    }
    return send_frame(client_fd_, data);
}

Result<std::vector<uint8_t>> TcpTransport::receive(uint32_t timeout_ms) {
    if (client_fd_ < 0) {
        return io_error("not connected");
    }

    std::vector<uint8_t> payload;
    switch (recv_frame(client_fd_, timeout_ms, payload)) {
        case IoStatus::Ok:       return payload;
        case IoStatus::Closed:   return io_error("connection closed by peer");
        case IoStatus::TimedOut: return io_error("receive timed out");
        case IoStatus::Failed:   break;
    }
    return io_error("receive failed");
}

Result<std::vector<uint8_t>> TcpTransport::request(const std::vector<uint8_t>& data,
                                                   uint32_t timeout_ms) {
    if (auto sent = send(data); !sent) return sent.error();
    return receive(timeout_ms);
}

void TcpTransport::disconnect() {
    if (client_fd_ >= 0) {
        ::shutdown(client_fd_, SHUT_RDWR);
        ::close(client_fd_);
        client_fd_ = -1;
    }
}

// ─────────────────────────────────────────────
// Server Side
// ─────────────────────────────────────────────

Result<void> TcpTransport::listen(uint16_t port, const std::string& bind_address, int backlog) {
    if (server_fd_ >= 0) {
        return io_error("already listening");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
        return Error{ErrorCode::Validation, "invalid bind address: " + bind_address};
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return io_error("socket: " + std::string(strerror(errno)));
    }

    int optval = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        return io_error("bind " + bind_address + ":" + std::to_string(port) + ": "
                        + std::string(strerror(err)));
    }

    if (::listen(fd, backlog) < 0) {
        int err = errno;
        ::close(fd);
        return io_error("listen: " + std::string(strerror(err)));
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }

    server_fd_ = fd;
    return Result<void>{};
}

void TcpTransport::serve(MessageHandler handler) {
    if (server_fd_ < 0 || serving_.exchange(true)) return;

    serve_thread_ = std::jthread([this, handler = std::move(handler)](std::stop_token stop) {
        // Owned by this thread only; destroying a worker stops and joins it.
        std::list<Connection> connections;
        auto reap = [&connections] {
            connections.remove_if([](const Connection& c) { return c.done.load(); });
        };

        while (!stop.stop_requested()) {
            reap();
            if (connections.size() >= MAX_CONNECTIONS) {
                std::this_thread::sleep_for(std::chrono::milliseconds(STOP_POLL_MS));
                continue;
            }

            pollfd pfd{};
            pfd.fd = server_fd_;
            pfd.events = POLLIN;

            if (::poll(&pfd, 1, STOP_POLL_MS) <= 0) continue;

            int client_fd = ::accept4(server_fd_, nullptr, nullptr,
                                      SOCK_NONBLOCK | SOCK_CLOEXEC);
            if (client_fd < 0) continue;

            configure_socket(client_fd);
            auto& connection = connections.emplace_back();
            connection.worker = std::jthread(
                [this, client_fd, &handler, &done = connection.done](std::stop_token conn_stop) {
                    handle_connection(client_fd, handler, conn_stop);
                    ::shutdown(client_fd, SHUT_RDWR);
                    ::close(client_fd);
                    done = true;
                });
        }
        connections.clear();
    });
}

void TcpTransport::handle_connection(int fd, const MessageHandler& handler,
                                     std::stop_token stop) {
    uint32_t idle_ms = 0;
    while (!stop.stop_requested()) {
        std::vector<uint8_t> request;
        auto status = recv_frame(fd, STOP_POLL_MS, request);

        if (status == IoStatus::TimedOut) {
            // Only a timeout before the first header byte keeps the connection.
            idle_ms += STOP_POLL_MS;
            if (idle_ms >= IDLE_TIMEOUT_MS) return;
            continue;
        }
        if (status != IoStatus::Ok) return;

        idle_ms = 0;
        if (!send_frame(fd, handler(request))) return;
    }
}

void TcpTransport::stop_serving() {
    if (serve_thread_.joinable()) {
        serve_thread_.request_stop();
        serve_thread_.join();
    }
    serving_ = false;
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    bound_port_ = 0;
}

// ─────────────────────────────────────────────
// State Queries
// ─────────────────────────────────────────────

bool TcpTransport::is_connected() const noexcept {
    return client_fd_ >= 0;
}

bool TcpTransport::is_listening() const noexcept {
    return server_fd_ >= 0;
}

// ─────────────────────────────────────────────
// Wire Protocol Helpers
// ─────────────────────────────────────────────

Result<void> TcpTransport::send_frame(int fd, const std::vector<uint8_t>& data) {
    if (data.size() > MAX_MESSAGE_SIZE) {
        return Error{ErrorCode::Validation,
                     "message too large: " + std::to_string(data.size()) + " bytes"};
    }

    uint8_t header[4];
    encode_u32(header, static_cast<uint32_t>(data.size()));

    if (send_all(fd, header, sizeof(header), 5000) != IoStatus::Ok) {
        return io_error("failed to send frame header");
    }
    if (!data.empty() && send_all(fd, data.data(), data.size(), 5000) != IoStatus::Ok) {
        return io_error("failed to send frame payload");
    }
    return Result<void>{};
}

TcpTransport::IoStatus TcpTransport::recv_frame(int fd, uint32_t timeout_ms,
                                                std::vector<uint8_t>& out) {
    uint8_t header[4];
    if (auto status = recv_all(fd, header, sizeof(header), timeout_ms); status != IoStatus::Ok) {
        return status;
    }

    uint32_t length = decode_u32(header);
    if (length > MAX_MESSAGE_SIZE) return IoStatus::Failed;

    out.assign(length, 0);
    if (length == 0) return IoStatus::Ok;

    // Once a header has arrived the payload must follow; a stall is an error.
    auto status = recv_all(fd, out.data(), length, 10000);
    return status == IoStatus::Ok ? IoStatus::Ok : IoStatus::Failed;
}

TcpTransport::IoStatus TcpTransport::send_all(int fd, const void* buf, size_t len,
                                              uint32_t timeout_ms) {
    const auto* ptr = static_cast<const uint8_t*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready == 0) return IoStatus::TimedOut;
        if (ready < 0) {
            if (errno == EINTR) continue;
            return IoStatus::Failed;
        }

        auto sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
            return IoStatus::Failed;
        }

        ptr += sent;
        remaining -= static_cast<size_t>(sent);
    }
    return IoStatus::Ok;
}

TcpTransport::IoStatus TcpTransport::recv_all(int fd, void* buf, size_t len,
                                              uint32_t timeout_ms) {
    auto* ptr = static_cast<uint8_t*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready == 0) {
            // A partially read header cannot be resumed by the caller.
            return remaining == len ? IoStatus::TimedOut : IoStatus::Failed;
        }
        if (ready < 0) {
            if (errno == EINTR) continue;
            return IoStatus::Failed;
        }

        auto received = ::recv(fd, ptr, remaining, 0);
        if (received == 0) {
            return remaining == len ? IoStatus::Closed : IoStatus::Failed;
        }
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return IoStatus::Failed;
        }

        ptr += received;
        remaining -= static_cast<size_t>(received);
    }
    return IoStatus::Ok;
}

}  // namespace kubesim
