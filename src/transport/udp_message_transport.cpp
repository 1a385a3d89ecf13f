#include "nocturne/transport/udp_message_transport.hpp"
#include "nocturne/core/logger.hpp"

namespace nocturne::transport {

using core::ErrorCode;
using core::Result;

UdpMessageTransport::UdpMessageTransport(std::size_t max_payload_size)
    : max_payload_size_(max_payload_size) {
    if (max_payload_size_ == 0 || max_payload_size_ > kMaxDatagramSize) {
        core::throw_error(ErrorCode::InvalidArgument,
            "UDP max payload size must be between 1 and " + std::to_string(kMaxDatagramSize));
    }
}

UdpMessageTransport::~UdpMessageTransport() {
    close();
}

Result<std::string> UdpMessageTransport::open(const TransportTarget& target) {
    if (closed_) {
        return {ErrorCode::InvalidState, "Transport already closed"};
    }
    if (target.mode == TransportTarget::Mode::Connect && target.remote.empty()) {
        return {ErrorCode::InvalidArgument, "UDP connect requires a remote address"};
    }

    auto socket = std::make_shared<Socket>(SocketType::UDP);
    if (target.mode == TransportTarget::Mode::Listen || !target.local.empty()) {
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
        local_address_ = socket->getLocalAddress();
    }

    SocketAddress peer = target.remote;
    std::optional<Bytes> first;

    if (target.mode == TransportTarget::Mode::Listen) {
        core::Logger::info("Waiting for head unit datagram on {}", socket->getLocalAddress().toString());

        Bytes buffer(kMaxDatagramSize);
        auto received = socket->receiveFrom(buffer.data(), buffer.size(), peer);
        if (!received) {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_socket_.reset();
            return received.error();
        }
        buffer.resize(received.value());
        first = std::move(buffer);
    }

    // Connecting filters out datagrams from anyone but the peer
    auto connected = socket->connect(peer);

    std::lock_guard<std::mutex> lock(mutex_);
    pending_socket_.reset();
    if (!connected) {
        return connected.error();
    }
    if (closed_) {
        socket->close();
        return {ErrorCode::Cancelled, "Transport closed while opening"};
    }

    socket_ = socket;
    local_address_ = socket->getLocalAddress();
    first_datagram_ = std::move(first);
    return peer.toString();
}

std::shared_ptr<Socket> UdpMessageTransport::connection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ ? nullptr : socket_;
}

Result<void> UdpMessageTransport::send(const Bytes& data) {
    if (data.size() > max_payload_size_) {
        return {ErrorCode::FrameTooLarge,
            "Datagram of " + std::to_string(data.size()) + " bytes exceeds limit of " +
            std::to_string(max_payload_size_)};
    }

    auto socket = connection();
    if (!socket) {
        return {ErrorCode::NotConnected, "UDP transport is not connected"};
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

Result<Bytes> UdpMessageTransport::receive() {
    auto socket = connection();
    if (!socket) {
        return {ErrorCode::NotConnected, "UDP transport is not connected"};
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (first_datagram_) {
            Bytes first = std::move(*first_datagram_);
            first_datagram_.reset();
            stats_.receives++;
            stats_.bytes_received += first.size();
            return first;
        }
    }

    Bytes buffer(kMaxDatagramSize);
    auto received = socket->receive(buffer.data(), buffer.size());
    if (!received) {
        return received.error();
    }
    // A shut down datagram socket reads as empty
    if (closed_) {
        return {ErrorCode::ConnectionClosed, "UDP transport closed"};
    }

    buffer.resize(received.value());
    countReceived(buffer.size());
    return buffer;
}

void UdpMessageTransport::countReceived(std::size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.receives++;
    stats_.bytes_received += size;
}

void UdpMessageTransport::close() {
    std::shared_ptr<Socket> pending;
    std::shared_ptr<Socket> socket;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.exchange(true)) {
            return;
        }
        pending = pending_socket_;
        socket = socket_;
    }

    if (pending) {
        pending->shutdown();
    }
    if (socket) {
        socket->shutdown();
        core::Logger::debug("UDP transport to {} closed", socket->getRemoteAddress().toString());
    }
}

bool UdpMessageTransport::isOpen() const {
    return connection() != nullptr;
}

Transport::Stats UdpMessageTransport::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

SocketAddress UdpMessageTransport::localAddress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_address_;
}

} // namespace nocturne::transport
