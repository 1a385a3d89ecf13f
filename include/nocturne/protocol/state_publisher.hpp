#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include <nocturne/core/error.hpp>
#include <nocturne/core/event.hpp>
#include <nocturne/media/media_facade.hpp>
#include <nocturne/protocol/messages.hpp>

namespace nocturne::protocol {

// Owns the last known playback state. Each media signal overwrites its own
// subset of the snapshot, then the whole snapshot is serialized, broadcast
// and handed to the send path. One publish completes before the next starts.
class StatePublisher {
public:
    // Send path into the session; NotConnected means drop
    using SendFunction = std::function<core::Result<void>(const std::string&)>;

    StatePublisher(media::MediaFacade& facade, core::EventEmitter& emitter, SendFunction send);
    ~StatePublisher();

    StatePublisher(const StatePublisher&) = delete;
    StatePublisher& operator=(const StatePublisher&) = delete;

    // Subscribe to / unsubscribe from the facade's change events
    void attach();
    void detach();
    bool attached() const;

    void onMetadataChanged(const media::TrackMetadata& metadata);
    void onPlaybackStateChanged(const media::PlaybackState& state);
    void onVolumeChanged(const media::VolumeLevel& volume);

    // Re-read everything from the facade, then publish
    void publishSnapshot();

    // Shares the send path so it never interleaves with a state update
    void publishTimeSync(const TimeSync& sync);

    StateUpdate snapshot() const;

    static int volumePercent(const media::VolumeLevel& volume);

    struct Stats {
        uint64_t published = 0;
        uint64_t time_syncs = 0;
        uint64_t sent = 0;
        uint64_t dropped = 0;        // not connected
        uint64_t send_failures = 0;
    };

    Stats getStats() const;

private:
    void handleMediaEvent(const media::MediaEvent& event);

    // Caller holds mutex_
    void publishLocked();
    void sendLocked(const std::string& line, const char* what);

    media::MediaFacade& facade_;
    core::EventEmitter& emitter_;
    SendFunction send_;

    mutable std::mutex mutex_;
    StateUpdate state_;
    Stats stats_;

    mutable std::mutex subscription_mutex_;
    std::optional<media::SubscriptionId> subscription_;
};

} // namespace nocturne::protocol
