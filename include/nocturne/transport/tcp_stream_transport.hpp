#pragma once

#include <atomic>
#include <memory>
#include <mutex>

#include <nocturne/transport/transport.hpp>
#include <nocturne/transport/socket.hpp>

namespace nocturne::transport {

// Stream transport over TCP. In Listen mode it accepts exactly one peer and
// stops listening; in Connect mode it dials the peer.
class TcpStreamTransport : public Transport {
public:
    static constexpr std::size_t kReadBufferSize = 1024;

    TcpStreamTransport();
    ~TcpStreamTransport() override;

    core::Result<std::string> open(const TransportTarget& target) override;
    core::Result<void> send(const Bytes& data) override;
    core::Result<Bytes> receive() override;
    void close() override;

    bool isOpen() const override;
    TransportKind kind() const override { return TransportKind::Stream; }
    Stats getStats() const override;

    // Address the listener is bound to; valid once open() has bound it
    SocketAddress listeningAddress() const;

private:
    std::shared_ptr<Socket> connection() const;

    mutable std::mutex mutex_;
    std::shared_ptr<Socket> listener_;
    std::shared_ptr<Socket> pending_socket_;   // connecting, not yet usable
    std::shared_ptr<Socket> socket_;
    SocketAddress listening_address_;
    std::atomic<bool> closed_{false};
    Stats stats_;
};

} // namespace nocturne::transport
