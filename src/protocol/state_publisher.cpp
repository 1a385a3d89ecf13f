#include "nocturne/protocol/state_publisher.hpp"
#include "nocturne/protocol/events.hpp"
#include "nocturne/core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <variant>

namespace nocturne::protocol {

using core::ErrorCode;

StatePublisher::StatePublisher(media::MediaFacade& facade, core::EventEmitter& emitter, SendFunction send)
    : facade_(facade)
    , emitter_(emitter)
    , send_(std::move(send)) {
    if (!send_) {
        core::throw_error(ErrorCode::InvalidArgument, "State publisher needs a send function");
    }
}

StatePublisher::~StatePublisher() {
    detach();
}

void StatePublisher::attach() {
    std::lock_guard<std::mutex> lock(subscription_mutex_);
    if (subscription_) return;

    subscription_ = facade_.subscribe([this](const media::MediaEvent& event) {
        handleMediaEvent(event);
    });
}

void StatePublisher::detach() {
    std::lock_guard<std::mutex> lock(subscription_mutex_);
    if (!subscription_) return;

    facade_.unsubscribe(*subscription_);
    subscription_.reset();
}

bool StatePublisher::attached() const {
    std::lock_guard<std::mutex> lock(subscription_mutex_);
    return subscription_.has_value();
}

void StatePublisher::handleMediaEvent(const media::MediaEvent& event) {
    std::visit([this](const auto& change) {
        using T = std::decay_t<decltype(change)>;
        if constexpr (std::is_same_v<T, media::MetadataChanged>) {
            onMetadataChanged(change.metadata);
        } else if constexpr (std::is_same_v<T, media::PlaybackStateChanged>) {
            onPlaybackStateChanged(change.state);
        } else if constexpr (std::is_same_v<T, media::VolumeChanged>) {
            onVolumeChanged(change.volume);
        }
        // Controller changes are followed by fresh metadata from the new source
    }, event);
}

void StatePublisher::onMetadataChanged(const media::TrackMetadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.artist = metadata.artist;
    state_.album = metadata.album;
    state_.track = metadata.track;
    state_.duration_ms = metadata.duration_ms;
    publishLocked();
}

void StatePublisher::onPlaybackStateChanged(const media::PlaybackState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.is_playing = state.is_playing;
    state_.position_ms = state.position_ms;
    publishLocked();
}

void StatePublisher::onVolumeChanged(const media::VolumeLevel& volume) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.volume_percent = volumePercent(volume);
    publishLocked();
}

void StatePublisher::publishSnapshot() {
    // Read the facade before taking the lock; the facade may be slow
    auto controller = facade_.activeController();
    std::optional<media::TrackMetadata> metadata;
    std::optional<media::PlaybackState> playback;
    if (controller) {
        metadata = controller->metadata();
        playback = controller->playbackState();
    }
    auto volume = facade_.volume();

    std::lock_guard<std::mutex> lock(mutex_);
    if (metadata) {
        state_.artist = metadata->artist;
        state_.album = metadata->album;
        state_.track = metadata->track;
        state_.duration_ms = metadata->duration_ms;
    }
    if (playback) {
        state_.is_playing = playback->is_playing;
        state_.position_ms = playback->position_ms;
    }
    state_.volume_percent = volumePercent(volume);
    publishLocked();
}

void StatePublisher::publishLocked() {
    std::string line = serialize(state_);
    stats_.published++;

    emitter_.emit(events::kStateUpdate, line);
    sendLocked(line, "State update");
}

void StatePublisher::publishTimeSync(const TimeSync& sync) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string line = serialize(sync);
    stats_.time_syncs++;

    emitter_.emit(events::kTimeSync, line);
    sendLocked(line, "Time sync");
}

void StatePublisher::sendLocked(const std::string& line, const char* what) {
    auto sent = send_(line);
    if (sent) {
        stats_.sent++;
    } else if (sent.code() == ErrorCode::NotConnected) {
        stats_.dropped++;
        core::Logger::debug("{} dropped, not connected", what);
    } else {
        stats_.send_failures++;
        core::Logger::warn("{} send failed: {}", what, sent.error().what());
    }
}

StateUpdate StatePublisher::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int StatePublisher::volumePercent(const media::VolumeLevel& volume) {
    if (volume.max <= 0) {
        return 0;
    }
    auto percent = std::lround(volume.current * 100.0 / volume.max);
    return static_cast<int>(std::clamp<long>(percent, 0, 100));
}

StatePublisher::Stats StatePublisher::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace nocturne::protocol
