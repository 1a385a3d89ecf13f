#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

#include <nocturne/core/error.hpp>
#include <nocturne/core/event.hpp>
#include <nocturne/core/task.hpp>
#include <nocturne/protocol/frame_codec.hpp>
#include <nocturne/session/connection_status.hpp>
#include <nocturne/transport/transport.hpp>

namespace nocturne::session {

// Owns the single live connection: its transport, its status and the only
// write path into it.
//
//   Disconnected --start--> Connecting --open ok--> Connected(peer)
//   Connecting --open failed--> Failed(reason) --> Disconnected
//   Connected --stop | receive error | send error--> Disconnected
//
// Every transition is emitted as events::kConnectionStatus, in order and
// exactly once.
class SessionManager {
public:
    struct Settings {
        transport::TransportTarget target;
        std::size_t max_frame_size = 64 * 1024;   // 0 = unlimited
    };

    using FrameHandler = std::function<void(std::string frame)>;
    using ConnectedHandler = std::function<void(const std::string& peer)>;

    SessionManager(core::TaskScheduler& scheduler,
                   core::EventEmitter& emitter,
                   transport::TransportFactory factory,
                   Settings settings);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Set before start(); called from the receive task
    void setFrameHandler(FrameHandler handler);
    void setConnectedHandler(ConnectedHandler handler);

    // Begin a connection attempt. No-op (returns false) while Connecting or
    // Connected.
    bool start();

    // Close the transport and go Disconnected. No-op when already Disconnected.
    void stop();

    // Encode and write one message. Writers are serialized; fails with
    // NotConnected unless Connected. A write error ends the session.
    core::Result<void> send(const std::string& text);

    ConnectionStatus status() const;
    const Settings& settings() const { return settings_; }

    struct Stats {
        uint64_t connection_attempts = 0;
        uint64_t connections = 0;
        uint64_t frames_received = 0;
        uint64_t frames_sent = 0;
        uint64_t bytes_received = 0;
        uint64_t bytes_sent = 0;
        uint64_t decode_errors = 0;
        uint64_t send_failures = 0;
    };

    Stats getStats() const;

private:
    void runConnection(uint64_t generation, std::shared_ptr<transport::Transport> transport);
    void receiveLoop(uint64_t generation, transport::Transport& transport);

    // Idempotent; only the first call for a generation has any effect
    void teardown(uint64_t generation, const std::string& reason);

    // Caller holds state_mutex_
    void setStatusLocked(ConnectionStatus status);
    bool isCurrentLocked(uint64_t generation) const;

    core::TaskScheduler& scheduler_;
    core::EventEmitter& emitter_;
    transport::TransportFactory factory_;
    Settings settings_;

    FrameHandler frame_handler_;
    ConnectedHandler connected_handler_;

    mutable std::mutex state_mutex_;
    ConnectionStatus status_;
    uint64_t generation_ = 0;
    std::shared_ptr<transport::Transport> transport_;
    std::shared_ptr<protocol::FrameEncoder> encoder_;
    std::shared_future<void> loop_done_;
    Stats stats_;

    // Held for the whole encode-and-write of one message
    std::mutex write_mutex_;
};

} // namespace nocturne::session
