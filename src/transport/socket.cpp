#include "nocturne/transport/socket.hpp"
#include "nocturne/core/logger.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <errno.h>
#include <cstring>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <netinet/tcp.h>

namespace nocturne::transport {

using core::ErrorCode;
using core::Result;

namespace {

std::string lastError() {
    return std::string(strerror(errno));
}

} // namespace

Result<sockaddr_in> SocketAddress::toSockAddr() const {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (ip == "localhost") {
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return {ErrorCode::InvalidAddress, "Invalid IPv4 address: " + ip};
    }
    return addr;
}

SocketAddress SocketAddress::fromSockAddr(const sockaddr_in& addr) {
    char ip_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr.sin_addr, ip_str, INET_ADDRSTRLEN);
    return SocketAddress(ip_str, ntohs(addr.sin_port));
}

Socket::Socket(SocketType type)
    : type_(type), state_(SocketState::CLOSED), socket_fd_(-1) {
}

Socket::Socket(AcceptedTag, SocketType type, int existing_fd, const SocketAddress& remote)
    : type_(type), state_(SocketState::CONNECTED), socket_fd_(existing_fd), remote_address_(remote) {
    sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);
    if (getsockname(existing_fd, reinterpret_cast<sockaddr*>(&addr), &addr_len) == 0) {
        local_address_ = SocketAddress::fromSockAddr(addr);
    }
}

Socket::~Socket() {
    close();
}

Result<void> Socket::ensureOpen() {
    if (socket_fd_ >= 0) {
        return {};
    }

    int type = (type_ == SocketType::UDP) ? SOCK_DGRAM : SOCK_STREAM;
    int fd = ::socket(AF_INET, type | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        state_ = SocketState::ERROR;
        return {ErrorCode::IoError, "Failed to create socket: " + lastError()};
    }

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        core::Logger::warn("Failed to set SO_REUSEADDR: {}", lastError());
    }
    if (type_ == SocketType::TCP &&
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
        core::Logger::warn("Failed to set TCP_NODELAY: {}", lastError());
    }

    socket_fd_ = fd;
    return {};
}

Result<void> Socket::bind(const SocketAddress& address) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != SocketState::CLOSED) {
        return {ErrorCode::InvalidState, "Socket must be closed before binding"};
    }

    auto addr = address.toSockAddr();
    if (!addr) {
        return addr.error();
    }

    auto opened = ensureOpen();
    if (!opened) {
        return opened;
    }

    sockaddr_in bound = addr.value();
    if (::bind(socket_fd_, reinterpret_cast<const sockaddr*>(&bound), sizeof(bound)) < 0) {
        state_ = SocketState::ERROR;
        return {ErrorCode::ConnectionFailed, "Failed to bind " + address.toString() + ": " + lastError()};
    }

    // Get actual bound address (in case port was 0)
    socklen_t addr_len = sizeof(bound);
    if (getsockname(socket_fd_, reinterpret_cast<sockaddr*>(&bound), &addr_len) == 0) {
        local_address_ = SocketAddress::fromSockAddr(bound);
    } else {
        local_address_ = address;
    }

    state_ = SocketState::BOUND;
    core::Logger::debug("Socket bound to {}", local_address_.toString());
    return {};
}

Result<void> Socket::listen(int backlog) {
    if (type_ != SocketType::TCP) {
        return {ErrorCode::NotSupported, "Listen is only supported for TCP sockets"};
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != SocketState::BOUND) {
        return {ErrorCode::InvalidState, "Socket must be bound before listening"};
    }

    if (::listen(socket_fd_, backlog) < 0) {
        state_ = SocketState::ERROR;
        return {ErrorCode::ConnectionFailed, "Failed to listen: " + lastError()};
    }

    state_ = SocketState::LISTENING;
    core::Logger::info("Socket listening on {}", local_address_.toString());
    return {};
}

Result<std::unique_ptr<Socket>> Socket::accept() {
    if (state_ != SocketState::LISTENING) {
        return {ErrorCode::InvalidState, "Socket is not listening"};
    }

    while (true) {
        auto readable = waitReadable();
        if (!readable) {
            return readable.error();
        }

        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int client_fd = ::accept4(socket_fd_, reinterpret_cast<sockaddr*>(&client_addr),
                                  &addr_len, SOCK_CLOEXEC);
        if (client_fd >= 0) {
            auto remote = SocketAddress::fromSockAddr(client_addr);
            core::Logger::info("Accepted connection from {}", remote.toString());
            return std::make_unique<Socket>(AcceptedTag{}, SocketType::TCP, client_fd, remote);
        }

        if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) {
            continue;
        }
        if (state_ == SocketState::SHUTDOWN) {
            return {ErrorCode::ConnectionClosed, "Listening socket shut down"};
        }
        return {ErrorCode::ConnectionFailed, "Accept failed: " + lastError()};
    }
}

Result<void> Socket::connect(const SocketAddress& address) {
    sockaddr_in peer{};
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ != SocketState::BOUND && state_ != SocketState::CLOSED) {
            return {ErrorCode::InvalidState, "Invalid state for connect"};
        }

        auto addr = address.toSockAddr();
        if (!addr) {
            return addr.error();
        }

        auto opened = ensureOpen();
        if (!opened) {
            return opened;
        }

        // Non-blocking connect so that shutdown() can abandon it
        if (auto nonblocking = setBlocking(false); !nonblocking) {
            return nonblocking;
        }

        peer = addr.value();
        if (::connect(socket_fd_, reinterpret_cast<const sockaddr*>(&peer), sizeof(peer)) < 0 &&
            errno != EINPROGRESS) {
            state_ = SocketState::ERROR;
            return {ErrorCode::ConnectionFailed, "Failed to connect to " + address.toString() + ": " + lastError()};
        }
        state_ = SocketState::CONNECTING;
    }

    // Lock released while waiting; shutdown() needs it
    auto writable = waitWritable();
    if (!writable) {
        if (state_ == SocketState::SHUTDOWN) {
            return {ErrorCode::Cancelled, "Connect to " + address.toString() + " cancelled"};
        }
        return writable;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SocketState::CONNECTING) {
        return {ErrorCode::Cancelled, "Connect to " + address.toString() + " cancelled"};
    }

    int error = 0;
    socklen_t error_len = sizeof(error);
    if (getsockopt(socket_fd_, SOL_SOCKET, SO_ERROR, &error, &error_len) < 0) {
        error = errno;
    }
    if (error != 0) {
        state_ = SocketState::ERROR;
        return {ErrorCode::ConnectionFailed,
            "Failed to connect to " + address.toString() + ": " + std::string(strerror(error))};
    }

    if (auto blocking = setBlocking(true); !blocking) {
        state_ = SocketState::ERROR;
        return blocking;
    }

    sockaddr_in local{};
    socklen_t addr_len = sizeof(local);
    if (getsockname(socket_fd_, reinterpret_cast<sockaddr*>(&local), &addr_len) == 0) {
        local_address_ = SocketAddress::fromSockAddr(local);
    }

    remote_address_ = address;
    state_ = SocketState::CONNECTED;
    core::Logger::info("Connected to {}", remote_address_.toString());
    return {};
}

Result<void> Socket::setBlocking(bool blocking) {
    int flags = fcntl(socket_fd_, F_GETFL, 0);
    if (flags < 0) {
        return {ErrorCode::IoError, "Failed to read socket flags: " + lastError()};
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    if (fcntl(socket_fd_, F_SETFL, flags) < 0) {
        return {ErrorCode::IoError, "Failed to set socket flags: " + lastError()};
    }
    return {};
}

Result<void> Socket::sendAll(const uint8_t* data, size_t size) {
    size_t offset = 0;
    while (offset < size) {
        if (state_ != SocketState::CONNECTED) {
            return {ErrorCode::NotConnected, "Socket not connected"};
        }

        ssize_t sent = ::send(socket_fd_, data + offset, size - offset, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            // Datagrams are best effort; a pending ICMP error is not fatal
            if (type_ == SocketType::UDP && errno == ECONNREFUSED) {
                core::Logger::debug("Datagram to {} refused", remote_address_.toString());
                return {};
            }
            return {ErrorCode::IoError, "Send failed: " + lastError()};
        }
        offset += static_cast<size_t>(sent);
    }
    return {};
}

Result<void> Socket::sendTo(const uint8_t* data, size_t size, const SocketAddress& to) {
    if (socket_fd_ < 0 || state_ == SocketState::SHUTDOWN) {
        return {ErrorCode::NotConnected, "Socket not open"};
    }

    auto addr = to.toSockAddr();
    if (!addr) {
        return addr.error();
    }

    sockaddr_in dest = addr.value();
    ssize_t sent = ::sendto(socket_fd_, data, size, MSG_NOSIGNAL,
                            reinterpret_cast<const sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        return {ErrorCode::IoError, "Send failed: " + lastError()};
    }
    if (static_cast<size_t>(sent) != size) {
        return {ErrorCode::IoError, "Partial datagram send"};
    }
    return {};
}

Result<void> Socket::waitReadable() {
    return waitReady(POLLIN);
}

Result<void> Socket::waitWritable() {
    return waitReady(POLLOUT);
}

Result<void> Socket::waitReady(short events) {
    while (true) {
        int fd = socket_fd_;
        if (fd < 0 || state_ == SocketState::SHUTDOWN) {
            return {ErrorCode::ConnectionClosed, "Socket shut down"};
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        int ready = ::poll(&pfd, 1, static_cast<int>(kPollInterval.count()));
        if (ready > 0) {
            return {};
        }
        if (ready < 0 && errno != EINTR) {
            return {ErrorCode::IoError, "Poll failed: " + lastError()};
        }
    }
}

Result<size_t> Socket::receive(uint8_t* buffer, size_t capacity) {
    while (true) {
        auto readable = waitReadable();
        if (!readable) {
            return readable.error();
        }

        ssize_t received = ::recv(socket_fd_, buffer, capacity, 0);
        if (received >= 0) {
            return static_cast<size_t>(received);
        }
        if (errno == EINTR || errno == EAGAIN) {
            continue;
        }
        // ICMP port unreachable from an earlier datagram; the peer may come up later
        if (type_ == SocketType::UDP && errno == ECONNREFUSED) {
            core::Logger::debug("Datagram peer {} unreachable", remote_address_.toString());
            continue;
        }
        return {ErrorCode::IoError, "Receive failed: " + lastError()};
    }
}

Result<size_t> Socket::receiveFrom(uint8_t* buffer, size_t capacity, SocketAddress& from) {
    while (true) {
        auto readable = waitReadable();
        if (!readable) {
            return readable.error();
        }

        sockaddr_in sender{};
        socklen_t addr_len = sizeof(sender);
        ssize_t received = ::recvfrom(socket_fd_, buffer, capacity, 0,
                                      reinterpret_cast<sockaddr*>(&sender), &addr_len);
        if (received >= 0) {
            from = SocketAddress::fromSockAddr(sender);
            return static_cast<size_t>(received);
        }
        if (errno == EINTR || errno == EAGAIN) {
            continue;
        }
        return {ErrorCode::IoError, "Receive failed: " + lastError()};
    }
}

void Socket::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (socket_fd_ < 0 || state_ == SocketState::SHUTDOWN) {
        return;
    }

    // Errors ignored: ENOTCONN for listening or unconnected datagram sockets is expected
    ::shutdown(socket_fd_, SHUT_RDWR);
    state_ = SocketState::SHUTDOWN;
}

void Socket::close() {
    shutdown();

    std::lock_guard<std::mutex> lock(mutex_);
    int fd = socket_fd_.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
    state_ = SocketState::CLOSED;
}

SocketAddress Socket::getLocalAddress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_address_;
}

SocketAddress Socket::getRemoteAddress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remote_address_;
}

} // namespace nocturne::transport
