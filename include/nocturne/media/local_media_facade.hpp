#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <nocturne/media/media_facade.hpp>

namespace nocturne::media {

// In-process media source: a playlist with a play head and a volume.
// The host side binds a controller and feeds it tracks; the engine side sees
// it through the MediaFacade interface.
class LocalMediaFacade : public MediaFacade {
public:
    explicit LocalMediaFacade(int max_volume = 15, int initial_volume = 7);
    ~LocalMediaFacade() override;

    LocalMediaFacade(const LocalMediaFacade&) = delete;
    LocalMediaFacade& operator=(const LocalMediaFacade&) = delete;

    // Host side
    void bindController(const std::string& package_name);
    void unbindController();
    void setPlaylist(std::vector<TrackMetadata> tracks, std::size_t start_index = 0);
    void setMetadata(const TrackMetadata& metadata);
    void setPlaybackState(const PlaybackState& state);

    // MediaFacade
    MediaControllerPtr activeController() const override;
    VolumeLevel volume() const override;
    core::Result<void> setVolume(int level) override;
    SubscriptionId subscribe(MediaEventCallback callback) override;
    void unsubscribe(SubscriptionId id) override;

private:
    class Controller;
    struct State;

    std::shared_ptr<State> state_;
};

} // namespace nocturne::media
