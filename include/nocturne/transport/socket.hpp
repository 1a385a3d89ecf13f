#pragma once

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <netinet/in.h>

#include <nocturne/core/error.hpp>

namespace nocturne::transport {

enum class SocketType {
    UDP,
    TCP
};

enum class SocketState {
    CLOSED,
    BOUND,
    LISTENING,
    CONNECTING,
    CONNECTED,
    SHUTDOWN,
    ERROR
};

struct SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : port(0) {}
    SocketAddress(const std::string& ip, uint16_t port) : ip(ip), port(port) {}

    std::string toString() const {
        return ip + ":" + std::to_string(port);
    }

    bool empty() const { return ip.empty() && port == 0; }

    core::Result<sockaddr_in> toSockAddr() const;
    static SocketAddress fromSockAddr(const sockaddr_in& addr);
};

// Blocking IPv4 socket. shutdown() wakes up a thread blocked in
// accept/connect/receive; the descriptor itself is released by close() or the destructor.
class Socket {
    // Restricts the adopting constructor to accept()
    struct AcceptedTag {};

public:
    explicit Socket(SocketType type);
    Socket(AcceptedTag, SocketType type, int existing_fd, const SocketAddress& remote);
    virtual ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    core::Result<void> bind(const SocketAddress& address);
    core::Result<void> listen(int backlog = 1);                  // TCP only
    core::Result<std::unique_ptr<Socket>> accept();              // TCP only
    core::Result<void> connect(const SocketAddress& address);

    // Writes every byte or fails
    core::Result<void> sendAll(const uint8_t* data, size_t size);
    core::Result<void> sendTo(const uint8_t* data, size_t size, const SocketAddress& to);

    // Returns 0 on orderly shutdown by the peer (TCP)
    core::Result<size_t> receive(uint8_t* buffer, size_t capacity);
    core::Result<size_t> receiveFrom(uint8_t* buffer, size_t capacity, SocketAddress& from);

    void shutdown();
    void close();

    SocketType getType() const { return type_; }
    SocketState getState() const { return state_; }
    SocketAddress getLocalAddress() const;
    SocketAddress getRemoteAddress() const;

    // Interval at which blocking waits re-check for shutdown()
    static constexpr std::chrono::milliseconds kPollInterval{200};

private:
    core::Result<void> ensureOpen();
    core::Result<void> waitReadable();
    core::Result<void> waitWritable();
    core::Result<void> waitReady(short events);
    core::Result<void> setBlocking(bool blocking);

    SocketType type_;
    std::atomic<SocketState> state_;
    std::atomic<int> socket_fd_;
    SocketAddress local_address_;
    SocketAddress remote_address_;

    mutable std::mutex mutex_;
};

} // namespace nocturne::transport
