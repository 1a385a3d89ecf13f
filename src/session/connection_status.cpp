#include "nocturne/session/connection_status.hpp"

namespace nocturne::session {

const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Connected:    return "Connected";
        case ConnectionState::Failed:       return "Failed";
    }
    return "Unknown";
}

std::string ConnectionStatus::toString() const {
    switch (state_) {
        case ConnectionState::Connected:
            return "Connected to " + detail_;
        case ConnectionState::Failed:
            return "Failed: " + detail_;
        case ConnectionState::Connecting:
            return "Connecting...";
        case ConnectionState::Disconnected:
            break;
    }
    return "Disconnected";
}

} // namespace nocturne::session
