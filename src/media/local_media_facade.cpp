#include "nocturne/media/local_media_facade.hpp"
#include "nocturne/core/logger.hpp"

#include <algorithm>

namespace nocturne::media {

using core::ErrorCode;
using core::Result;
using Clock = std::chrono::steady_clock;

struct LocalMediaFacade::State {
    mutable std::mutex mutex;

    std::shared_ptr<Controller> controller;
    std::vector<TrackMetadata> playlist;
    std::size_t index = 0;
    TrackMetadata metadata;

    bool playing = false;
    int64_t position_ms = 0;          // at position_time
    Clock::time_point position_time = Clock::now();

    VolumeLevel volume;

    std::map<SubscriptionId, std::shared_ptr<MediaEventCallback>> subscribers;
    SubscriptionId next_id = 1;

    // Play head now; advances while playing, stops at the end of the track
    int64_t positionLocked() const {
        if (!playing) {
            return position_ms;
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - position_time).count();
        int64_t position = position_ms + elapsed;
        if (metadata.duration_ms > 0) {
            position = std::min(position, metadata.duration_ms);
        }
        return position;
    }

    void movePlayheadLocked(int64_t position) {
        position_ms = std::max<int64_t>(position, 0);
        position_time = Clock::now();
    }

    PlaybackState playbackLocked() const {
        return {playing, positionLocked()};
    }

    // Deliver outside the lock, to a snapshot of the subscribers
    void notify(const std::vector<MediaEvent>& events) {
        std::vector<std::shared_ptr<MediaEventCallback>> targets;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto& [id, callback] : subscribers) {
                targets.push_back(callback);
            }
        }

        for (const auto& event : events) {
            for (const auto& callback : targets) {
                try {
                    (*callback)(event);
                }
                catch (const std::exception& e) {
                    core::Logger::error("Media subscriber failed: {}", e.what());
                }
            }
        }
    }
};

class LocalMediaFacade::Controller : public MediaController {
public:
    Controller(std::string package_name, std::weak_ptr<State> state)
        : package_name_(std::move(package_name)), state_(std::move(state)) {}

    std::string packageName() const override { return package_name_; }

    TrackMetadata metadata() const override {
        auto state = state_.lock();
        if (!state) return {};
        std::lock_guard<std::mutex> lock(state->mutex);
        return state->metadata;
    }

    PlaybackState playbackState() const override {
        auto state = state_.lock();
        if (!state) return {};
        std::lock_guard<std::mutex> lock(state->mutex);
        return state->playbackLocked();
    }

    Result<void> play() override {
        return apply([](State& state, std::vector<MediaEvent>& events) {
            if (state.playing) return;
            state.movePlayheadLocked(state.positionLocked());
            state.playing = true;
            events.push_back(PlaybackStateChanged{state.playbackLocked()});
        });
    }

    Result<void> pause() override {
        return apply([](State& state, std::vector<MediaEvent>& events) {
            if (!state.playing) return;
            state.movePlayheadLocked(state.positionLocked());
            state.playing = false;
            events.push_back(PlaybackStateChanged{state.playbackLocked()});
        });
    }

    Result<void> skipToNext() override {
        return apply([](State& state, std::vector<MediaEvent>& events) {
            if (!state.playlist.empty()) {
                state.index = (state.index + 1) % state.playlist.size();
                state.metadata = state.playlist[state.index];
                events.push_back(MetadataChanged{state.metadata});
            }
            state.movePlayheadLocked(0);
            events.push_back(PlaybackStateChanged{state.playbackLocked()});
        });
    }

    Result<void> skipToPrevious() override {
        return apply([](State& state, std::vector<MediaEvent>& events) {
            if (!state.playlist.empty()) {
                state.index = (state.index + state.playlist.size() - 1) % state.playlist.size();
                state.metadata = state.playlist[state.index];
                events.push_back(MetadataChanged{state.metadata});
            }
            state.movePlayheadLocked(0);
            events.push_back(PlaybackStateChanged{state.playbackLocked()});
        });
    }

    Result<void> seekTo(int64_t position_ms) override {
        if (position_ms < 0) {
            return {ErrorCode::InvalidArgument, "Seek position must not be negative"};
        }
        return apply([position_ms](State& state, std::vector<MediaEvent>& events) {
            state.movePlayheadLocked(position_ms);
            events.push_back(PlaybackStateChanged{state.playbackLocked()});
        });
    }

private:
    template<typename F>
    Result<void> apply(F&& action) {
        auto state = state_.lock();
        if (!state) {
            return {ErrorCode::NoMediaTarget, "Media source is gone"};
        }

        std::vector<MediaEvent> events;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->controller.get() != this) {
                return {ErrorCode::NoMediaTarget, package_name_ + " is no longer the active controller"};
            }
            action(*state, events);
        }
        state->notify(events);
        return {};
    }

    std::string package_name_;
    std::weak_ptr<State> state_;
};

LocalMediaFacade::LocalMediaFacade(int max_volume, int initial_volume)
    : state_(std::make_shared<State>()) {
    if (max_volume <= 0) {
        core::throw_error(ErrorCode::InvalidArgument, "Max volume must be positive");
    }
    state_->volume = {std::clamp(initial_volume, 0, max_volume), max_volume};
}

LocalMediaFacade::~LocalMediaFacade() = default;

void LocalMediaFacade::bindController(const std::string& package_name) {
    std::string previous;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->controller) {
            previous = state_->controller->packageName();
        }
        state_->controller = std::make_shared<Controller>(package_name, state_);
    }
    core::Logger::info("Media controller bound: {}", package_name);
    state_->notify({ControllerChanged{previous, package_name}});
}

void LocalMediaFacade::unbindController() {
    std::string previous;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->controller) return;
        previous = state_->controller->packageName();
        state_->controller.reset();
        state_->movePlayheadLocked(state_->positionLocked());
        state_->playing = false;
    }
    core::Logger::info("Media controller unbound: {}", previous);
    state_->notify({ControllerChanged{previous, ""}});
}

void LocalMediaFacade::setPlaylist(std::vector<TrackMetadata> tracks, std::size_t start_index) {
    std::vector<MediaEvent> events;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->playlist = std::move(tracks);
        if (state_->playlist.empty()) {
            return;
        }
        state_->index = std::min(start_index, state_->playlist.size() - 1);
        state_->metadata = state_->playlist[state_->index];
        state_->movePlayheadLocked(0);
        events.push_back(MetadataChanged{state_->metadata});
        events.push_back(PlaybackStateChanged{state_->playbackLocked()});
    }
    state_->notify(events);
}

void LocalMediaFacade::setMetadata(const TrackMetadata& metadata) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->metadata = metadata;
    }
    state_->notify({MetadataChanged{metadata}});
}

void LocalMediaFacade::setPlaybackState(const PlaybackState& playback) {
    PlaybackState current;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->playing = playback.is_playing;
        state_->movePlayheadLocked(playback.position_ms);
        current = state_->playbackLocked();
    }
    state_->notify({PlaybackStateChanged{current}});
}

MediaControllerPtr LocalMediaFacade::activeController() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->controller;
}

VolumeLevel LocalMediaFacade::volume() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->volume;
}

Result<void> LocalMediaFacade::setVolume(int level) {
    VolumeLevel volume;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (level < 0 || level > state_->volume.max) {
            return {ErrorCode::InvalidArgument,
                "Volume " + std::to_string(level) + " outside 0.." + std::to_string(state_->volume.max)};
        }
        if (state_->volume.current == level) {
            return {};
        }
        state_->volume.current = level;
        volume = state_->volume;
    }
    state_->notify({VolumeChanged{volume}});
    return {};
}

SubscriptionId LocalMediaFacade::subscribe(MediaEventCallback callback) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    SubscriptionId id = state_->next_id++;
    state_->subscribers.emplace(id, std::make_shared<MediaEventCallback>(std::move(callback)));
    return id;
}

void LocalMediaFacade::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->subscribers.erase(id);
}

} // namespace nocturne::media
