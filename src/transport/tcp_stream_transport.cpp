#include "nocturne/transport/tcp_stream_transport.hpp"
#include "nocturne/core/logger.hpp"

namespace nocturne::transport {

using core::ErrorCode;
using core::Result;

TcpStreamTransport::TcpStreamTransport() = default;

TcpStreamTransport::~TcpStreamTransport() {
    close();
}

Result<std::string> TcpStreamTransport::open(const TransportTarget& target) {
    if (closed_) {
        return {ErrorCode::InvalidState, "Transport already closed"};
    }

    std::shared_ptr<Socket> socket;

    if (target.mode == TransportTarget::Mode::Listen) {
        auto listener = std::make_shared<Socket>(SocketType::TCP);
        if (auto bound = listener->bind(target.local); !bound) {
            return bound.error();
        }
        if (auto listening = listener->listen(); !listening) {
            return listening.error();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return {ErrorCode::Cancelled, "Transport closed while opening"};
            }
            listener_ = listener;
            listening_address_ = listener->getLocalAddress();
        }

        core::Logger::info("Waiting for head unit on {}", listener->getLocalAddress().toString());
        auto accepted = listener->accept();

        // One peer per transport; stop listening either way
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listener_.reset();
        }
        listener->close();

        if (!accepted) {
            return accepted.error();
        }
        socket = std::shared_ptr<Socket>(std::move(accepted).value());
    } else {
        socket = std::make_shared<Socket>(SocketType::TCP);
        if (!target.local.empty()) {
            if (auto bound = socket->bind(target.local); !bound) {
                return bound.error();
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return {ErrorCode::Cancelled, "Transport closed while opening"};
            }
            pending_socket_ = socket;
        }

        auto connected = socket->connect(target.remote);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_socket_.reset();
        }
        if (!connected) {
            return connected.error();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        socket->close();
        return {ErrorCode::Cancelled, "Transport closed while opening"};
    }
    socket_ = socket;
    return socket_->getRemoteAddress().toString();
}

std::shared_ptr<Socket> TcpStreamTransport::connection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ ? nullptr : socket_;
}

Result<void> TcpStreamTransport::send(const Bytes& data) {
    auto socket = connection();
    if (!socket) {
        return {ErrorCode::NotConnected, "TCP transport is not connected"};
    }

    auto sent = socket->sendAll(data.data(), data.size());
    if (!sent) {
        return sent;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.sends++;
    stats_.bytes_sent += data.size();
    return {};
}

Result<Bytes> TcpStreamTransport::receive() {
    auto socket = connection();
    if (!socket) {
        return {ErrorCode::NotConnected, "TCP transport is not connected"};
    }

    Bytes buffer(kReadBufferSize);
    auto received = socket->receive(buffer.data(), buffer.size());
    if (!received) {
        return received.error();
    }
    if (received.value() == 0) {
        return {ErrorCode::ConnectionClosed, "Peer closed the connection"};
    }

    buffer.resize(received.value());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.receives++;
        stats_.bytes_received += buffer.size();
    }
    return buffer;
}

void TcpStreamTransport::close() {
    std::shared_ptr<Socket> listener;
    std::shared_ptr<Socket> pending;
    std::shared_ptr<Socket> socket;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.exchange(true)) {
            return;
        }
        listener = listener_;
        pending = pending_socket_;
        socket = socket_;
    }

    // Only wake blocked threads here; descriptors are released with the last owner
    if (listener) {
        listener->shutdown();
    }
    if (pending) {
        pending->shutdown();
    }
    if (socket) {
        socket->shutdown();
        core::Logger::debug("TCP transport to {} closed", socket->getRemoteAddress().toString());
    }
}

bool TcpStreamTransport::isOpen() const {
    return connection() != nullptr;
}

Transport::Stats TcpStreamTransport::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

SocketAddress TcpStreamTransport::listeningAddress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listening_address_;
}

} // namespace nocturne::transport
