#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <thread>
#include <vector>

#include <nocturne/engine/engine.hpp>
#include <nocturne/protocol/events.hpp>

#include "support/memory_transport.hpp"
#include "support/recording_media.hpp"
#include "support/test_helpers.hpp"

namespace nocturne::engine::test {

using core::ErrorCode;
using nocturne::test::MemoryLink;
using nocturne::test::RecordingMedia;
using nocturne::test::memoryFactory;
using nocturne::test::waitFor;
using namespace std::chrono_literals;

// Sink yang menyimpan semua teks status untuk testing
class RecordingSink : public NotificationSink {
public:
    void onStatusText(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        texts_.push_back(text);
    }

    void onStatusChanged(const session::ConnectionStatus& status) override {
        std::lock_guard<std::mutex> lock(mutex_);
        statuses_.push_back(status);
    }

    std::vector<std::string> texts() {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts_;
    }

    std::vector<session::ConnectionStatus> statuses() {
        std::lock_guard<std::mutex> lock(mutex_);
        return statuses_;
    }

    bool saw(const std::string& text) {
        auto all = texts();
        return std::find(all.begin(), all.end(), text) != all.end();
    }

private:
    std::mutex mutex_;
    std::vector<std::string> texts_;
    std::vector<session::ConnectionStatus> statuses_;
};

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.workers = 2;
        settings_.grace_period = 20ms;
        settings_.settle_period = 10ms;
        settings_.time_sync_on_connect = false;
        link_ = std::make_shared<MemoryLink>();
        sink_ = std::make_shared<RecordingSink>();
    }

    void TearDown() override {
        engine_.reset();
    }

    void createEngine() {
        engine_ = std::make_unique<Engine>(settings_, media_, memoryFactory(link_),
            [] { return protocol::TimeSync{1700000000000, "Europe/Berlin"}; });
        engine_->setNotificationSink(sink_);
    }

    bool waitConnected() {
        return waitFor([this] { return engine_->status().isConnected(); });
    }

    std::vector<protocol::StateUpdate> sentStates() {
        std::vector<protocol::StateUpdate> states;
        for (const auto& line : link_->sentText()) {
            auto parsed = protocol::parseStateUpdate(protocol::json::parse(line));
            EXPECT_TRUE(parsed.is_ok()) << line;
            if (parsed) states.push_back(parsed.value());
        }
        return states;
    }

    EngineSettings settings_;
    RecordingMedia media_{15, 7};
    std::shared_ptr<MemoryLink> link_;
    std::shared_ptr<RecordingSink> sink_;
    std::unique_ptr<Engine> engine_;
};

TEST(EngineCommandTest, ParsesStartAndStop) {
    EXPECT_EQ(parseEngineCommand("START"), EngineCommand::Start);
    EXPECT_EQ(parseEngineCommand(" start\n"), EngineCommand::Start);
    EXPECT_EQ(parseEngineCommand("Stop"), EngineCommand::Stop);
    EXPECT_FALSE(parseEngineCommand("restart").has_value());
    EXPECT_FALSE(parseEngineCommand("   ").has_value());
    EXPECT_FALSE(parseEngineCommand("").has_value());
}

TEST(TransportFactoryTest, FollowsTransportType) {
    EngineSettings settings;
    auto tcp = makeTransportFactory(settings)();
    EXPECT_EQ(tcp->kind(), transport::TransportKind::Stream);

    settings.transport_type = TransportType::Udp;
    settings.max_payload_size = 247;
    auto udp = makeTransportFactory(settings)();
    EXPECT_EQ(udp->kind(), transport::TransportKind::Message);
    EXPECT_EQ(udp->maxPayloadSize(), 247u);
}

TEST_F(EngineTest, InvalidSettingsRejected) {
    settings_.workers = 1;
    EXPECT_THROW(createEngine(), core::Error);
}

// Saat connect, snapshot awal langsung dikirim
TEST_F(EngineTest, StartConnectsAndSendsInitialState) {
    media::TrackMetadata metadata;
    metadata.artist = "Jon Hopkins";
    metadata.track = "Emerald Rush";
    media_.setMetadata(metadata);
    media_.bind();

    createEngine();
    EXPECT_FALSE(engine_->isRunning());
    ASSERT_TRUE(engine_->start());
    EXPECT_TRUE(engine_->isRunning());
    ASSERT_TRUE(waitConnected());

    ASSERT_TRUE(waitFor([this] { return link_->sentCount() == 1; }));
    auto states = sentStates();
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states[0].artist, "Jon Hopkins");
    EXPECT_EQ(states[0].track, "Emerald Rush");
    EXPECT_EQ(states[0].volume_percent, 47);

    ASSERT_TRUE(engine_->waitIdle(2s));
    EXPECT_TRUE(sink_->saw("Connecting..."));
    EXPECT_TRUE(sink_->saw("Connected to head-unit"));
    auto statuses = sink_->statuses();
    ASSERT_EQ(statuses.size(), 2u);
    EXPECT_EQ(statuses[1], session::ConnectionStatus::connected("head-unit"));
}

TEST_F(EngineTest, NoInitialStateWhenDisabled) {
    settings_.publish_on_connect = false;
    media_.bind();
    createEngine();

    ASSERT_TRUE(engine_->start());
    ASSERT_TRUE(waitConnected());
    ASSERT_TRUE(engine_->waitIdle(2s));
    EXPECT_EQ(link_->sentCount(), 0u);
}

// Alur lengkap: command masuk, aksi media, state update keluar
TEST_F(EngineTest, CommandRoundTrip) {
    media_.bind();
    createEngine();
    ASSERT_TRUE(engine_->start());
    ASSERT_TRUE(waitConnected());
    ASSERT_TRUE(waitFor([this] { return link_->sentCount() == 1; }));

    link_->push("{\"command\":\"set_volume\",\"value_percent\":40}\n");

    ASSERT_TRUE(waitFor([this] { return link_->sentCount() == 2; }));
    EXPECT_EQ(media_.calls(), std::vector<std::string>{"set_volume:6"});
    EXPECT_EQ(sentStates().back().volume_percent, 40);

    ASSERT_TRUE(engine_->waitIdle(2s));
    EXPECT_TRUE(sink_->saw("Executing: Set volume to 40% on com.example.player"));
}

TEST_F(EngineTest, DiagnosticsReachSink) {
    media_.bind();
    createEngine();
    ASSERT_TRUE(engine_->start());
    ASSERT_TRUE(waitConnected());

    link_->push("{\"command\":\"seek_to\"}\n");
    ASSERT_TRUE(waitFor([this] { return engine_->dispatcher().getStats().commands_dropped == 1; }));
    ASSERT_TRUE(engine_->waitIdle(2s));

    EXPECT_TRUE(sink_->saw("Error: seek_to requires 'value_ms'"));
    EXPECT_TRUE(media_.calls().empty());
}

// Perubahan dari media source langsung diteruskan ke head unit
TEST_F(EngineTest, MediaChangesArePushed) {
    media_.bind();
    createEngine();
    ASSERT_TRUE(engine_->start());
    ASSERT_TRUE(waitConnected());
    ASSERT_TRUE(waitFor([this] { return link_->sentCount() == 1; }));
    EXPECT_EQ(media_.subscriberCount(), 2u);

    media_.emit(media::PlaybackStateChanged{{true, 3000}});

    ASSERT_EQ(link_->sentCount(), 2u);
    auto last = sentStates().back();
    EXPECT_TRUE(last.is_playing);
    EXPECT_EQ(last.position_ms, 3000);
}

TEST_F(EngineTest, StopDisconnectsAndDetaches) {
    media_.bind();
    createEngine();
    engine_->handle(EngineCommand::Start);
    ASSERT_TRUE(waitConnected());

    engine_->handle(EngineCommand::Stop);
    EXPECT_FALSE(engine_->isRunning());
    EXPECT_TRUE(engine_->status().isDisconnected());
    EXPECT_EQ(media_.subscriberCount(), 0u);
    EXPECT_EQ(link_->closes.load(), 1);

    // Changes while stopped go nowhere
    auto sent = link_->sentCount();
    media_.emit(media::VolumeChanged{{3, 15}});
    EXPECT_EQ(link_->sentCount(), sent);

    // Stopping again is harmless
    engine_->stop();
    ASSERT_TRUE(engine_->waitIdle(2s));
    EXPECT_TRUE(sink_->saw("Disconnected"));
}

TEST_F(EngineTest, StartAgainAfterPeerLeft) {
    media_.bind();
    createEngine();
    ASSERT_TRUE(engine_->start());
    ASSERT_TRUE(waitConnected());

    link_->disconnect();
    ASSERT_TRUE(waitFor([this] { return engine_->status().isDisconnected(); }));
    EXPECT_TRUE(engine_->isRunning());

    ASSERT_TRUE(engine_->start());
    ASSERT_TRUE(waitConnected());
    EXPECT_EQ(link_->opens.load(), 2);
    EXPECT_EQ(media_.subscriberCount(), 2u);
}

TEST_F(EngineTest, ConnectFailureReported) {
    link_->open_error = ErrorCode::ConnectionFailed;
    createEngine();

    ASSERT_TRUE(engine_->start());
    ASSERT_TRUE(waitFor([this] { return sink_->statuses().size() == 3; }));

    auto statuses = sink_->statuses();
    EXPECT_EQ(statuses[1].state(), session::ConnectionState::Failed);
    EXPECT_TRUE(sink_->saw("Failed: Peer unreachable"));
    EXPECT_TRUE(engine_->status().isDisconnected());
}

TEST_F(EngineTest, EventsObservable) {
    media_.bind();
    createEngine();
    nocturne::test::EventRecorder recorder(engine_->events());

    ASSERT_TRUE(engine_->start());
    ASSERT_TRUE(waitConnected());
    link_->push("{\"command\":\"play\"}\n");
    ASSERT_TRUE(waitFor([this] { return link_->sentCount() == 2; }));
    ASSERT_TRUE(engine_->waitIdle(2s));

    EXPECT_EQ(recorder.count(protocol::events::kRawInbound), 1u);
    EXPECT_EQ(recorder.count(protocol::events::kCommand), 1u);
    EXPECT_EQ(recorder.count(protocol::events::kStateUpdate), 2u);
    EXPECT_EQ(recorder.notifications().size(), 1u);
}

// Head unit tidak punya jam sendiri, jadi waktu dikirim saat connect
TEST_F(EngineTest, TimeSyncFollowsInitialState) {
    settings_.time_sync_on_connect = true;
    media_.bind();
    createEngine();
    nocturne::test::EventRecorder recorder(engine_->events());

    ASSERT_TRUE(engine_->start());
    ASSERT_TRUE(waitFor([this] { return link_->sentCount() == 2; }));

    auto lines = link_->sentText();
    EXPECT_TRUE(protocol::parseStateUpdate(protocol::json::parse(lines[0])).is_ok());
    auto sync = protocol::parseTimeSync(protocol::json::parse(lines[1]));
    ASSERT_TRUE(sync.is_ok()) << lines[1];
    EXPECT_EQ(sync.value(), (protocol::TimeSync{1700000000000, "Europe/Berlin"}));

    ASSERT_TRUE(engine_->waitIdle(2s));
    EXPECT_EQ(recorder.count(protocol::events::kTimeSync), 1u);
}

TEST_F(EngineTest, PeriodicTimeSyncWhileRunning) {
    settings_.publish_on_connect = false;
    settings_.time_sync_interval = 20ms;
    createEngine();

    ASSERT_TRUE(engine_->start());
    EXPECT_TRUE(engine_->timeSync().running());
    ASSERT_TRUE(waitFor([this] { return link_->sentCount() >= 2; }));
    for (const auto& line : link_->sentText()) {
        EXPECT_TRUE(protocol::parseTimeSync(protocol::json::parse(line)).is_ok()) << line;
    }

    engine_->stop();
    EXPECT_FALSE(engine_->timeSync().running());
    auto sent = link_->sentCount();
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(link_->sentCount(), sent);
}

TEST_F(EngineTest, NoPeriodicTimeSyncBeforeConnect) {
    settings_.time_sync_interval = 10ms;
    link_->hold_open = true;
    createEngine();

    ASSERT_TRUE(engine_->start());
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(link_->sentCount(), 0u);
    EXPECT_EQ(engine_->publisher().getStats().time_syncs, 0u);

    engine_->stop();
}

} // namespace nocturne::engine::test
