#include <gtest/gtest.h>
#include <nocturne/media/local_media_facade.hpp>

#include <thread>
#include <utility>

namespace nocturne::media::test {

using core::ErrorCode;
using namespace std::chrono_literals;

class LocalMediaFacadeTest : public ::testing::Test {
protected:
    void SetUp() override {
        facade_ = std::make_unique<LocalMediaFacade>(15, 7);
        subscription_ = facade_->subscribe([this](const MediaEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        });

        playlist_ = {
            track("Burial", "Untrue", "Archangel", 238000),
            track("Four Tet", "There Is Love in You", "Angel Echoes", 240000),
            track("Bonobo", "Black Sands", "Kiara", 226000),
        };
    }

    void TearDown() override {
        facade_->unsubscribe(subscription_);
    }

    static TrackMetadata track(const char* artist, const char* album, const char* title, int64_t duration) {
        TrackMetadata metadata;
        metadata.artist = artist;
        metadata.album = album;
        metadata.track = title;
        metadata.duration_ms = duration;
        return metadata;
    }

    std::vector<MediaEvent> takeEvents() {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::exchange(events_, {});
    }

    std::unique_ptr<LocalMediaFacade> facade_;
    SubscriptionId subscription_ = 0;
    std::vector<TrackMetadata> playlist_;

    std::mutex mutex_;
    std::vector<MediaEvent> events_;
};

TEST(LocalMediaFacadeConfigTest, VolumeBounds) {
    EXPECT_THROW(LocalMediaFacade(0, 0), core::Error);

    LocalMediaFacade loud(15, 99);
    EXPECT_EQ(loud.volume(), (VolumeLevel{15, 15}));
}

TEST_F(LocalMediaFacadeTest, BindingReportsControllerChange) {
    EXPECT_EQ(facade_->activeController(), nullptr);

    facade_->bindController("local.player");
    auto controller = facade_->activeController();
    ASSERT_NE(controller, nullptr);
    EXPECT_EQ(controller->packageName(), "local.player");

    facade_->bindController("other.player");
    facade_->unbindController();
    EXPECT_EQ(facade_->activeController(), nullptr);

    auto events = takeEvents();
    ASSERT_EQ(events.size(), 3u);
    auto first = std::get<ControllerChanged>(events[0]);
    EXPECT_EQ(first.previous, "");
    EXPECT_EQ(first.current, "local.player");
    auto second = std::get<ControllerChanged>(events[1]);
    EXPECT_EQ(second.previous, "local.player");
    EXPECT_EQ(second.current, "other.player");
    auto third = std::get<ControllerChanged>(events[2]);
    EXPECT_EQ(third.previous, "other.player");
    EXPECT_EQ(third.current, "");
}

// Play head maju selama playing dan berhenti saat pause
TEST_F(LocalMediaFacadeTest, PlayAndPauseMoveThePlayHead) {
    facade_->bindController("local.player");
    facade_->setPlaylist(playlist_);
    auto controller = facade_->activeController();
    takeEvents();

    ASSERT_TRUE(controller->play().is_ok());
    std::this_thread::sleep_for(40ms);
    auto playing = controller->playbackState();
    EXPECT_TRUE(playing.is_playing);
    EXPECT_GE(playing.position_ms, 30);

    ASSERT_TRUE(controller->pause().is_ok());
    auto paused = controller->playbackState();
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(controller->playbackState().is_playing);
    EXPECT_EQ(controller->playbackState().position_ms, paused.position_ms);

    // Repeating the current state changes nothing
    ASSERT_TRUE(controller->pause().is_ok());

    auto events = takeEvents();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(std::get<PlaybackStateChanged>(events[0]).state.is_playing);
    EXPECT_FALSE(std::get<PlaybackStateChanged>(events[1]).state.is_playing);
}

TEST_F(LocalMediaFacadeTest, SkipWrapsAroundPlaylist) {
    facade_->bindController("local.player");
    facade_->setPlaylist(playlist_, 2);
    auto controller = facade_->activeController();
    EXPECT_EQ(controller->metadata().track, "Kiara");
    takeEvents();

    ASSERT_TRUE(controller->skipToNext().is_ok());
    EXPECT_EQ(controller->metadata().track, "Archangel");
    EXPECT_EQ(controller->playbackState().position_ms, 0);

    ASSERT_TRUE(controller->skipToPrevious().is_ok());
    EXPECT_EQ(controller->metadata().track, "Kiara");

    auto events = takeEvents();
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(std::get<MetadataChanged>(events[0]).metadata.track, "Archangel");
    EXPECT_TRUE(std::holds_alternative<PlaybackStateChanged>(events[1]));
    EXPECT_EQ(std::get<MetadataChanged>(events[2]).metadata.track, "Kiara");
}

TEST_F(LocalMediaFacadeTest, SeekMovesPlayHead) {
    facade_->bindController("local.player");
    facade_->setPlaylist(playlist_);
    auto controller = facade_->activeController();

    ASSERT_TRUE(controller->seekTo(90000).is_ok());
    EXPECT_EQ(controller->playbackState().position_ms, 90000);

    auto negative = controller->seekTo(-1);
    EXPECT_EQ(negative.code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(controller->playbackState().position_ms, 90000);
}

TEST_F(LocalMediaFacadeTest, PositionStopsAtEndOfTrack) {
    facade_->bindController("local.player");
    facade_->setMetadata(track("A", "B", "Short", 10));
    facade_->setPlaybackState({true, 0});

    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(facade_->activeController()->playbackState().position_ms, 10);
}

// Controller lama tidak boleh mengontrol setelah diganti
TEST_F(LocalMediaFacadeTest, StaleControllerRejected) {
    facade_->bindController("first.player");
    auto stale = facade_->activeController();
    facade_->bindController("second.player");

    auto result = stale->play();
    EXPECT_EQ(result.code(), ErrorCode::NoMediaTarget);
    EXPECT_TRUE(facade_->activeController()->play().is_ok());

    facade_.reset();
    EXPECT_EQ(stale->pause().code(), ErrorCode::NoMediaTarget);
    facade_ = std::make_unique<LocalMediaFacade>();
}

TEST_F(LocalMediaFacadeTest, VolumeChangesReported) {
    EXPECT_EQ(facade_->volume(), (VolumeLevel{7, 15}));

    ASSERT_TRUE(facade_->setVolume(6).is_ok());
    ASSERT_TRUE(facade_->setVolume(6).is_ok());
    EXPECT_EQ(facade_->setVolume(16).code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(facade_->setVolume(-1).code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(facade_->volume(), (VolumeLevel{6, 15}));

    auto events = takeEvents();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<VolumeChanged>(events[0]).volume, (VolumeLevel{6, 15}));
}

// Subscriber boleh unsubscribe dari dalam callback
TEST_F(LocalMediaFacadeTest, UnsubscribeFromCallback) {
    int calls = 0;
    SubscriptionId id = 0;
    id = facade_->subscribe([&](const MediaEvent&) {
        calls++;
        facade_->unsubscribe(id);
    });

    ASSERT_TRUE(facade_->setVolume(1).is_ok());
    ASSERT_TRUE(facade_->setVolume(2).is_ok());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(takeEvents().size(), 2u);
}

TEST_F(LocalMediaFacadeTest, ThrowingSubscriberDoesNotStopOthers) {
    facade_->subscribe([](const MediaEvent&) {
        throw std::runtime_error("subscriber failure");
    });

    ASSERT_TRUE(facade_->setVolume(3).is_ok());
    EXPECT_EQ(takeEvents().size(), 1u);
}

} // namespace nocturne::media::test
