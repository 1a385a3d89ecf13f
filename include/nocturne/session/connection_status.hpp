#pragma once

#include <string>

namespace nocturne::session {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Failed
};

const char* connectionStateName(ConnectionState state);

// One live value per session. Connected carries the peer name, Failed the reason.
class ConnectionStatus {
public:
    ConnectionStatus() = default;

    static ConnectionStatus disconnected() { return ConnectionStatus(ConnectionState::Disconnected, {}); }
    static ConnectionStatus connecting() { return ConnectionStatus(ConnectionState::Connecting, {}); }
    static ConnectionStatus connected(std::string peer) {
        return ConnectionStatus(ConnectionState::Connected, std::move(peer));
    }
    static ConnectionStatus failed(std::string reason) {
        return ConnectionStatus(ConnectionState::Failed, std::move(reason));
    }

    ConnectionState state() const noexcept { return state_; }

    // Peer name for Connected, reason for Failed, empty otherwise
    const std::string& detail() const noexcept { return detail_; }

    bool isConnected() const noexcept { return state_ == ConnectionState::Connected; }
    bool isDisconnected() const noexcept { return state_ == ConnectionState::Disconnected; }

    // "Connected to <peer>", "Failed: <reason>", ...
    std::string toString() const;

    bool operator==(const ConnectionStatus& other) const = default;

private:
    ConnectionStatus(ConnectionState state, std::string detail)
        : state_(state), detail_(std::move(detail)) {}

    ConnectionState state_ = ConnectionState::Disconnected;
    std::string detail_;
};

} // namespace nocturne::session
