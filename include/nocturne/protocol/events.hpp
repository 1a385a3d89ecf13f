#pragma once

#include <string>

#include <nocturne/core/error.hpp>

namespace nocturne::protocol {

// Event names published on the engine's EventEmitter, with the type carried in
// Event::data()
namespace events {
    inline constexpr const char* kRawInbound = "protocol.raw_inbound";          // std::string frame
    inline constexpr const char* kCommand = "protocol.command";                 // protocol::Command
    inline constexpr const char* kStateUpdate = "protocol.state_update";        // std::string JSON line
    inline constexpr const char* kTimeSync = "protocol.time_sync";              // std::string JSON line
    inline constexpr const char* kDiagnostic = "protocol.diagnostic";           // protocol::Diagnostic
    inline constexpr const char* kConnectionStatus = "session.status";          // session::ConnectionStatus
    inline constexpr const char* kNotification = "engine.notification";         // std::string
}

// Something was dropped or failed; never fatal for the session
struct Diagnostic {
    core::ErrorCode code = core::ErrorCode::Unknown;
    std::string message;
    std::string raw;   // failing inbound text, empty when not applicable

    std::string toString() const {
        if (raw.empty()) {
            return message;
        }
        return message + ": " + raw;
    }
};

} // namespace nocturne::protocol
