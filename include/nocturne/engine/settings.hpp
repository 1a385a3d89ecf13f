#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nocturne/core/config.hpp>
#include <nocturne/core/error.hpp>
#include <nocturne/core/logger.hpp>
#include <nocturne/transport/transport.hpp>

namespace nocturne::engine {

enum class TransportType {
    Tcp,   // stream, newline-delimited JSON
    Udp    // message, chunked
};

const char* transportTypeName(TransportType type);

// Default port the companion listens on
inline constexpr uint16_t kDefaultPort = 5757;

struct EngineSettings {
    core::LogLevel log_level = core::LogLevel::INFO;
    std::size_t workers = 4;

    TransportType transport_type = TransportType::Tcp;
    transport::TransportTarget target{
        transport::TransportTarget::Mode::Listen,
        transport::SocketAddress("0.0.0.0", kDefaultPort),
        transport::SocketAddress()
    };
    std::size_t max_payload_size = 509;       // udp only

    std::chrono::milliseconds grace_period{250};
    std::chrono::milliseconds settle_period{100};

    bool publish_on_connect = true;
    bool time_sync_on_connect = true;
    std::chrono::milliseconds time_sync_interval{std::chrono::hours(1)};   // 0 disables the timer
    std::size_t max_frame_size = 64 * 1024;
};

// Build settings from a config document. Every key is optional:
//
//   {
//     "log_level": "info",
//     "workers": 4,
//     "transport": {
//       "type": "tcp" | "udp",
//       "mode": "listen" | "connect",
//       "host": "0.0.0.0", "port": 5757,
//       "peer_host": "...", "peer_port": 0,
//       "max_payload_size": 509
//     },
//     "dispatcher": { "grace_period_ms": 250, "settle_period_ms": 100 },
//     "publisher": {
//       "publish_on_connect": true,
//       "time_sync_on_connect": true,
//       "time_sync_interval_ms": 3600000
//     },
//     "codec": { "max_frame_size": 65536 }
//   }
core::Result<EngineSettings> loadEngineSettings(const core::Config& config);

// Rejects values the engine cannot run with
core::Result<void> validate(const EngineSettings& settings);

} // namespace nocturne::engine
