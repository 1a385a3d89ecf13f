#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <functional>

#include <nocturne/core/error.hpp>
#include <nocturne/transport/socket.hpp>

namespace nocturne::transport {

using Bytes = std::vector<uint8_t>;

// Stream: continuous byte pipe, framing done above.
// Message: discrete messages bounded by maxPayloadSize().
enum class TransportKind {
    Stream,
    Message
};

const char* transportKindName(TransportKind kind);

struct TransportTarget {
    enum class Mode {
        Listen,   // wait for the head unit to connect
        Connect   // dial out to the head unit
    };

    Mode mode = Mode::Listen;
    SocketAddress local;    // bind address (Listen, or local port for datagram links)
    SocketAddress remote;   // peer address (Connect)

    std::string toString() const;
};

// A single physical link. One instance per connection attempt: once closed,
// the receive sequence cannot be restarted and a new transport is needed.
class Transport {
public:
    virtual ~Transport() = default;

    // Establishes the link; returns a human-readable peer name
    virtual core::Result<std::string> open(const TransportTarget& target) = 0;

    // Fails with NotConnected when the link is not open; never blocks forever
    virtual core::Result<void> send(const Bytes& data) = 0;

    // Next chunk of bytes (Stream) or next message (Message). Blocks while the
    // link is idle; fails with ConnectionClosed once the link is gone.
    virtual core::Result<Bytes> receive() = 0;

    // Idempotent; wakes up a thread blocked in open() or receive()
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
    virtual TransportKind kind() const = 0;

    // 0 means unbounded
    virtual std::size_t maxPayloadSize() const { return 0; }

    struct Stats {
        uint64_t bytes_sent = 0;
        uint64_t bytes_received = 0;
        uint64_t sends = 0;
        uint64_t receives = 0;
    };

    virtual Stats getStats() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;

} // namespace nocturne::transport
