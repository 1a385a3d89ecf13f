#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

#include <nocturne/transport/transport.hpp>
#include <nocturne/transport/socket.hpp>

namespace nocturne::transport {

// Message transport over UDP: every send is one datagram of at most
// maxPayloadSize() bytes. Listen mode binds locally and adopts the sender of
// the first datagram as the peer; Connect mode dials the remote address.
class UdpMessageTransport : public Transport {
public:
    // 512-byte MTU minus the 3-byte ATT header of the radio link it stands in for
    static constexpr std::size_t kDefaultMaxPayloadSize = 509;
    static constexpr std::size_t kMaxDatagramSize = 65507;

    explicit UdpMessageTransport(std::size_t max_payload_size = kDefaultMaxPayloadSize);
    ~UdpMessageTransport() override;

    core::Result<std::string> open(const TransportTarget& target) override;
    core::Result<void> send(const Bytes& data) override;
    core::Result<Bytes> receive() override;
    void close() override;

    bool isOpen() const override;
    TransportKind kind() const override { return TransportKind::Message; }
    std::size_t maxPayloadSize() const override { return max_payload_size_; }
    Stats getStats() const override;

    // Bound local address; valid once open() has bound the socket
    SocketAddress localAddress() const;

private:
    std::shared_ptr<Socket> connection() const;
    void countReceived(std::size_t size);

    const std::size_t max_payload_size_;

    mutable std::mutex mutex_;
    std::shared_ptr<Socket> socket_;
    std::shared_ptr<Socket> pending_socket_;
    std::optional<Bytes> first_datagram_;
    SocketAddress local_address_;
    std::atomic<bool> closed_{false};
    Stats stats_;
};

} // namespace nocturne::transport
