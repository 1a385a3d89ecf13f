#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <nocturne/core/error.hpp>

namespace nocturne::media {

struct TrackMetadata {
    std::optional<std::string> artist;
    std::optional<std::string> album;
    std::optional<std::string> track;
    int64_t duration_ms = 0;

    bool operator==(const TrackMetadata& other) const = default;
};

struct PlaybackState {
    bool is_playing = false;
    int64_t position_ms = 0;

    bool operator==(const PlaybackState& other) const = default;
};

// Device stream volume in device steps, e.g. 6 of 15
struct VolumeLevel {
    int current = 0;
    int max = 0;

    bool operator==(const VolumeLevel& other) const = default;
};

// The "now playing" session of one media app
class MediaController {
public:
    virtual ~MediaController() = default;

    virtual std::string packageName() const = 0;
    virtual TrackMetadata metadata() const = 0;
    virtual PlaybackState playbackState() const = 0;

    // Transport controls
    virtual core::Result<void> play() = 0;
    virtual core::Result<void> pause() = 0;
    virtual core::Result<void> skipToNext() = 0;
    virtual core::Result<void> skipToPrevious() = 0;
    virtual core::Result<void> seekTo(int64_t position_ms) = 0;
};

using MediaControllerPtr = std::shared_ptr<MediaController>;

// Change notifications
struct MetadataChanged {
    TrackMetadata metadata;
};

struct PlaybackStateChanged {
    PlaybackState state;
};

struct VolumeChanged {
    VolumeLevel volume;
};

// Package names; empty when no controller is bound
struct ControllerChanged {
    std::string previous;
    std::string current;
};

using MediaEvent = std::variant<MetadataChanged, PlaybackStateChanged, VolumeChanged, ControllerChanged>;
using MediaEventCallback = std::function<void(const MediaEvent&)>;
using SubscriptionId = uint64_t;

// Media source the engine drives and observes. Binding of the active
// controller is owned by the implementation.
class MediaFacade {
public:
    virtual ~MediaFacade() = default;

    // Null when no media app is bound
    virtual MediaControllerPtr activeController() const = 0;

    virtual VolumeLevel volume() const = 0;
    virtual core::Result<void> setVolume(int level) = 0;

    // Callbacks run on the thread that caused the change, never under an
    // internal lock. Subscribers may unsubscribe from inside a callback.
    virtual SubscriptionId subscribe(MediaEventCallback callback) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
};

} // namespace nocturne::media
