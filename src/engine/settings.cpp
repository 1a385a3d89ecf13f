#include "nocturne/engine/settings.hpp"
#include "nocturne/protocol/frame_codec.hpp"
#include "nocturne/transport/udp_message_transport.hpp"

namespace nocturne::engine {

using core::ErrorCode;
using core::Result;

namespace {

// Integer key within [min, max], or the fallback when absent
Result<int64_t> integerInRange(const core::Config& config, const std::string& path,
                               int64_t fallback, int64_t min, int64_t max) {
    auto value = config.getOr<int64_t>(path, fallback);
    if (!value) {
        return value;
    }
    if (value.value() < min || value.value() > max) {
        return {ErrorCode::InvalidArgument,
            "'" + path + "' must be between " + std::to_string(min) + " and " + std::to_string(max) +
            ", got " + std::to_string(value.value())};
    }
    return value;
}

} // namespace

const char* transportTypeName(TransportType type) {
    switch (type) {
        case TransportType::Tcp: return "tcp";
        case TransportType::Udp: return "udp";
    }
    return "unknown";
}

Result<EngineSettings> loadEngineSettings(const core::Config& config) {
    EngineSettings settings;

    auto level_name = config.getOr<std::string>("log_level", "info");
    if (!level_name) return level_name.error();
    auto level = core::parseLogLevel(level_name.value());
    if (!level) {
        return {ErrorCode::InvalidArgument, "Unknown log level '" + level_name.value() + "'"};
    }
    settings.log_level = *level;

    auto workers = integerInRange(config, "workers", static_cast<int64_t>(settings.workers), 2, 64);
    if (!workers) return workers.error();
    settings.workers = static_cast<std::size_t>(workers.value());

    // Transport
    auto type = config.getOr<std::string>("transport.type", "tcp");
    if (!type) return type.error();
    if (type.value() == "tcp") {
        settings.transport_type = TransportType::Tcp;
    } else if (type.value() == "udp") {
        settings.transport_type = TransportType::Udp;
    } else {
        return {ErrorCode::InvalidArgument, "Unknown transport type '" + type.value() + "'"};
    }

    auto mode = config.getOr<std::string>("transport.mode", "listen");
    if (!mode) return mode.error();
    if (mode.value() == "listen") {
        settings.target.mode = transport::TransportTarget::Mode::Listen;
    } else if (mode.value() == "connect") {
        settings.target.mode = transport::TransportTarget::Mode::Connect;
    } else {
        return {ErrorCode::InvalidArgument, "Unknown transport mode '" + mode.value() + "'"};
    }

    auto host = config.getOr<std::string>("transport.host",
        settings.target.mode == transport::TransportTarget::Mode::Listen ? "0.0.0.0" : "");
    if (!host) return host.error();

    auto port = integerInRange(config, "transport.port",
        settings.target.mode == transport::TransportTarget::Mode::Listen ? kDefaultPort : 0, 0, 65535);
    if (!port) return port.error();

    if (host.value().empty() && port.value() == 0) {
        settings.target.local = {};
    } else {
        settings.target.local = transport::SocketAddress(host.value(), static_cast<uint16_t>(port.value()));
    }

    auto peer_host = config.getOr<std::string>("transport.peer_host", "");
    if (!peer_host) return peer_host.error();
    auto peer_port = integerInRange(config, "transport.peer_port", 0, 0, 65535);
    if (!peer_port) return peer_port.error();
    if (!peer_host.value().empty()) {
        settings.target.remote = transport::SocketAddress(peer_host.value(),
                                                          static_cast<uint16_t>(peer_port.value()));
    }

    auto max_payload = integerInRange(config, "transport.max_payload_size",
        static_cast<int64_t>(settings.max_payload_size),
        static_cast<int64_t>(protocol::ChunkHeader::kSize + 1),
        static_cast<int64_t>(transport::UdpMessageTransport::kMaxDatagramSize));
    if (!max_payload) return max_payload.error();
    settings.max_payload_size = static_cast<std::size_t>(max_payload.value());

    // Dispatcher
    auto grace = integerInRange(config, "dispatcher.grace_period_ms", settings.grace_period.count(), 0, 10000);
    if (!grace) return grace.error();
    settings.grace_period = std::chrono::milliseconds(grace.value());

    auto settle = integerInRange(config, "dispatcher.settle_period_ms", settings.settle_period.count(), 0, 10000);
    if (!settle) return settle.error();
    settings.settle_period = std::chrono::milliseconds(settle.value());

    // Publisher
    auto publish_on_connect = config.getOr<bool>("publisher.publish_on_connect", settings.publish_on_connect);
    if (!publish_on_connect) return publish_on_connect.error();
    settings.publish_on_connect = publish_on_connect.value();

    auto time_sync_on_connect = config.getOr<bool>("publisher.time_sync_on_connect", settings.time_sync_on_connect);
    if (!time_sync_on_connect) return time_sync_on_connect.error();
    settings.time_sync_on_connect = time_sync_on_connect.value();

    auto time_sync_interval = integerInRange(config, "publisher.time_sync_interval_ms",
        settings.time_sync_interval.count(), 0, 24LL * 60 * 60 * 1000);
    if (!time_sync_interval) return time_sync_interval.error();
    settings.time_sync_interval = std::chrono::milliseconds(time_sync_interval.value());

    // Codec
    auto max_frame = integerInRange(config, "codec.max_frame_size",
        static_cast<int64_t>(settings.max_frame_size), 0, 16 * 1024 * 1024);
    if (!max_frame) return max_frame.error();
    settings.max_frame_size = static_cast<std::size_t>(max_frame.value());

    if (auto valid = validate(settings); !valid) {
        return valid.error();
    }
    return settings;
}

Result<void> validate(const EngineSettings& settings) {
    // One worker is held by the receive task for the whole connection
    if (settings.workers < 2) {
        return {ErrorCode::InvalidArgument, "At least 2 workers are required"};
    }

    if (settings.target.mode == transport::TransportTarget::Mode::Connect) {
        if (settings.target.remote.ip.empty() || settings.target.remote.port == 0) {
            return {ErrorCode::InvalidArgument, "Connect mode requires transport.peer_host and transport.peer_port"};
        }
        if (auto remote = settings.target.remote.toSockAddr(); !remote) {
            return remote.error();
        }
    } else if (auto local = settings.target.local.toSockAddr(); !local) {
        return local.error();
    }

    if (settings.transport_type == TransportType::Udp &&
        settings.max_payload_size <= protocol::ChunkHeader::kSize) {
        return {ErrorCode::InvalidArgument, "transport.max_payload_size leaves no room for chunk data"};
    }

    if (settings.grace_period.count() < 0 || settings.settle_period.count() < 0) {
        return {ErrorCode::InvalidArgument, "Dispatcher delays must not be negative"};
    }
    if (settings.time_sync_interval.count() < 0) {
        return {ErrorCode::InvalidArgument, "Time sync interval must not be negative"};
    }
    return {};
}

} // namespace nocturne::engine
