#include <gtest/gtest.h>
#include <nocturne/protocol/command_dispatcher.hpp>
#include <nocturne/protocol/events.hpp>

#include <thread>

#include "support/recording_media.hpp"
#include "support/test_helpers.hpp"

namespace nocturne::protocol::test {

using core::ErrorCode;
using nocturne::test::EventRecorder;
using nocturne::test::RecordingMedia;
using nocturne::test::waitFor;
using namespace std::chrono_literals;

class CommandDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        scheduler_ = core::make_task_scheduler();
        scheduler_->start(2);
        loop_ = core::make_event_loop();
        emitter_ = core::make_event_emitter(*loop_);
        recorder_ = std::make_unique<EventRecorder>(*emitter_);
        loop_->start();

        publisher_ = std::make_unique<StatePublisher>(media_, *emitter_,
            [this](const std::string& line) -> core::Result<void> {
                std::lock_guard<std::mutex> lock(mutex_);
                lines_.push_back(line);
                return {};
            });
    }

    void TearDown() override {
        dispatcher_.reset();
        publisher_.reset();
        scheduler_->stop();
        loop_->stop();
        recorder_.reset();
        emitter_.reset();
        loop_.reset();
    }

    // Short waits keep the suite fast
    void createDispatcher(std::chrono::milliseconds grace = 50ms,
                          std::chrono::milliseconds settle = 10ms) {
        CommandDispatcher::Settings settings;
        settings.grace_period = grace;
        settings.settle_period = settle;
        dispatcher_ = std::make_unique<CommandDispatcher>(*scheduler_, media_, *publisher_, *emitter_, settings);
    }

    void drain() {
        ASSERT_TRUE(dispatcher_->waitIdle(5s));
        ASSERT_TRUE(loop_->waitIdle(2s));
    }

    std::vector<std::string> published() {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    RecordingMedia media_{15, 7};
    std::unique_ptr<core::TaskScheduler> scheduler_;
    std::unique_ptr<core::EventLoop> loop_;
    std::unique_ptr<core::EventEmitter> emitter_;
    std::unique_ptr<EventRecorder> recorder_;
    std::unique_ptr<StatePublisher> publisher_;
    std::unique_ptr<CommandDispatcher> dispatcher_;

    std::mutex mutex_;
    std::vector<std::string> lines_;
};

// Command valid menghasilkan tepat satu aksi dan satu publish
TEST_F(CommandDispatcherTest, PlayExecutesOnceThenPublishes) {
    createDispatcher();
    media_.bind();

    ASSERT_TRUE(dispatcher_->submit(R"({"command":"play"})"));
    drain();

    EXPECT_EQ(media_.calls(), std::vector<std::string>{"play"});
    EXPECT_EQ(published().size(), 1u);
    EXPECT_TRUE(recorder_->diagnostics().empty());

    auto notes = recorder_->notifications();
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_EQ(notes[0], "Executing: Play on com.example.player");

    EXPECT_EQ(recorder_->count(events::kRawInbound), 1u);
    auto commands = recorder_->all<Command>(events::kCommand);
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].kind, CommandKind::Play);

    auto stats = dispatcher_->getStats();
    EXPECT_EQ(stats.frames_received, 1u);
    EXPECT_EQ(stats.commands_executed, 1u);
    EXPECT_EQ(stats.commands_dropped, 0u);
}

TEST_F(CommandDispatcherTest, SeekPassesPosition) {
    createDispatcher();
    media_.bind();

    dispatcher_->submit(R"({"command":"seek_to","value_ms":1000})");
    drain();

    EXPECT_EQ(media_.calls(), std::vector<std::string>{"seek_to:1000"});
    EXPECT_EQ(recorder_->notifications().at(0), "Executing: Seek to 1000ms on com.example.player");
}

// Field wajib yang hilang: tidak ada aksi, satu diagnostic
TEST_F(CommandDispatcherTest, MissingFieldDroppedWithDiagnostic) {
    createDispatcher();
    media_.bind();

    dispatcher_->submit(R"({"command":"seek_to"})");
    drain();

    EXPECT_TRUE(media_.calls().empty());
    EXPECT_TRUE(published().empty());

    auto diagnostics = recorder_->diagnostics();
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].code, ErrorCode::MissingField);
    EXPECT_EQ(diagnostics[0].raw, R"({"command":"seek_to"})");
    EXPECT_EQ(dispatcher_->getStats().commands_dropped, 1u);
}

TEST_F(CommandDispatcherTest, MalformedJsonDiagnosed) {
    createDispatcher();
    media_.bind();

    dispatcher_->submit("{\"command\":");
    drain();

    auto diagnostics = recorder_->diagnostics();
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].code, ErrorCode::DecodeError);
    EXPECT_EQ(diagnostics[0].message, "Malformed JSON");
    EXPECT_EQ(diagnostics[0].raw, "{\"command\":");
    EXPECT_EQ(recorder_->count(events::kCommand), 0u);
    EXPECT_EQ(dispatcher_->getStats().decode_errors, 1u);
    EXPECT_TRUE(media_.calls().empty());
}

TEST_F(CommandDispatcherTest, WrongShapeDiagnosed) {
    createDispatcher();
    media_.bind();

    dispatcher_->submit(R"({"command":42})");
    dispatcher_->submit(R"([1,2,3])");
    drain();

    auto diagnostics = recorder_->diagnostics();
    ASSERT_EQ(diagnostics.size(), 2u);
    EXPECT_EQ(diagnostics[0].code, ErrorCode::InvalidCommand);
    EXPECT_EQ(diagnostics[1].code, ErrorCode::InvalidCommand);
    EXPECT_TRUE(media_.calls().empty());
}

TEST_F(CommandDispatcherTest, UnknownCommandNeverExecuted) {
    createDispatcher();
    media_.bind();

    dispatcher_->submit(R"({"command":"shuffle"})");
    drain();

    auto diagnostics = recorder_->diagnostics();
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].code, ErrorCode::UnknownCommand);
    EXPECT_TRUE(media_.calls().empty());
    EXPECT_TRUE(published().empty());
    EXPECT_EQ(recorder_->count(events::kCommand), 1u);
}

// Urutan eksekusi mengikuti urutan kedatangan walau command pertama lambat
TEST_F(CommandDispatcherTest, ProcessesInArrivalOrder) {
    createDispatcher();
    media_.bind();
    media_.setDelay("play", 100ms);

    dispatcher_->submit(R"({"command":"play"})");
    dispatcher_->submit(R"({"command":"pause"})");
    dispatcher_->submit(R"({"command":"next"})");
    drain();

    EXPECT_EQ(media_.calls(), (std::vector<std::string>{"play", "pause", "next"}));
    EXPECT_EQ(published().size(), 3u);
}

// Persen volume dipetakan ke langkah device, lalu dilaporkan kembali dalam persen
TEST_F(CommandDispatcherTest, SetVolumeMapsToDeviceSteps) {
    createDispatcher();
    media_.bind();

    dispatcher_->submit(R"({"command":"set_volume","value_percent":40})");
    drain();

    EXPECT_EQ(media_.calls(), std::vector<std::string>{"set_volume:6"});
    auto lines = published();
    ASSERT_EQ(lines.size(), 1u);
    auto state = parseStateUpdate(json::parse(lines[0]));
    ASSERT_TRUE(state.is_ok());
    EXPECT_EQ(state.value().volume_percent, 40);
}

TEST_F(CommandDispatcherTest, SetVolumeOutOfRangeRejected) {
    createDispatcher();
    media_.bind();

    dispatcher_->submit(R"({"command":"set_volume","value_percent":140})");
    drain();

    EXPECT_TRUE(media_.calls().empty());
    ASSERT_EQ(recorder_->diagnostics().size(), 1u);
    EXPECT_EQ(recorder_->diagnostics()[0].code, ErrorCode::InvalidCommand);
}

TEST_F(CommandDispatcherTest, NoControllerDropsAfterGrace) {
    createDispatcher(30ms);

    auto start = std::chrono::steady_clock::now();
    dispatcher_->submit(R"({"command":"play"})");
    drain();

    EXPECT_GE(std::chrono::steady_clock::now() - start, 30ms);
    EXPECT_TRUE(media_.calls().empty());
    auto diagnostics = recorder_->diagnostics();
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].code, ErrorCode::NoMediaTarget);
}

TEST_F(CommandDispatcherTest, ControllerBoundDuringGraceIsUsed) {
    createDispatcher(500ms);

    dispatcher_->submit(R"({"command":"pause"})");
    std::this_thread::sleep_for(50ms);
    media_.bind("com.example.late");
    drain();

    EXPECT_EQ(media_.calls(), std::vector<std::string>{"pause"});
    EXPECT_TRUE(recorder_->diagnostics().empty());
    EXPECT_EQ(recorder_->notifications().at(0), "Executing: Pause on com.example.late");
}

TEST_F(CommandDispatcherTest, FacadeFailureBecomesDiagnostic) {
    createDispatcher();
    media_.bind();
    media_.failWith(ErrorCode::IoError);

    dispatcher_->submit(R"({"command":"next"})");
    drain();

    EXPECT_EQ(media_.calls(), std::vector<std::string>{"next"});
    EXPECT_TRUE(published().empty());
    auto diagnostics = recorder_->diagnostics();
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].code, ErrorCode::IoError);
    EXPECT_EQ(diagnostics[0].message.rfind("Error executing next", 0), 0u);
    EXPECT_EQ(dispatcher_->getStats().commands_executed, 0u);
}

// cancelPending membuang antrian dan memotong settle wait
TEST_F(CommandDispatcherTest, CancelPendingDropsQueuedFrames) {
    createDispatcher(50ms, 2s);
    media_.bind();
    media_.setDelay("play", 100ms);

    dispatcher_->submit(R"({"command":"play"})");
    dispatcher_->submit(R"({"command":"pause"})");
    dispatcher_->submit(R"({"command":"next"})");
    std::this_thread::sleep_for(30ms);

    auto start = std::chrono::steady_clock::now();
    dispatcher_->cancelPending();
    drain();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

    EXPECT_EQ(media_.calls(), std::vector<std::string>{"play"});
    EXPECT_TRUE(published().empty());

    auto diagnostics = recorder_->diagnostics();
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].code, ErrorCode::Cancelled);
    EXPECT_EQ(diagnostics[0].message, "Dropped 2 queued commands");
    EXPECT_EQ(dispatcher_->getStats().cancelled, 2u);

    // Frames submitted after the cancel run normally
    media_.setDelay("play", 0ms);
    createDispatcher();
    dispatcher_->submit(R"({"command":"play"})");
    drain();
    EXPECT_EQ(media_.calls(), (std::vector<std::string>{"play", "play"}));
}

TEST_F(CommandDispatcherTest, SubmitAfterCancelUsesFreshToken) {
    createDispatcher();
    media_.bind();

    dispatcher_->cancelPending();
    dispatcher_->submit(R"({"command":"pause"})");
    drain();

    EXPECT_EQ(media_.calls(), std::vector<std::string>{"pause"});
    EXPECT_EQ(published().size(), 1u);
}

TEST_F(CommandDispatcherTest, CancelledTokenSkipsFrame) {
    createDispatcher();
    media_.bind();

    core::CancellationToken token;
    token.cancel();
    dispatcher_->process(R"({"command":"play"})", token);
    ASSERT_TRUE(loop_->waitIdle(2s));

    EXPECT_TRUE(media_.calls().empty());
    auto diagnostics = recorder_->diagnostics();
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].code, ErrorCode::Cancelled);
}

TEST_F(CommandDispatcherTest, ReportsControllerChanges) {
    createDispatcher();
    dispatcher_->attach();

    media_.bind("com.example.first");
    media_.bind("com.example.second");
    ASSERT_TRUE(loop_->waitIdle(2s));

    auto notes = recorder_->notifications();
    ASSERT_EQ(notes.size(), 2u);
    EXPECT_EQ(notes[0], "Media controller changed: none → com.example.first");
    EXPECT_EQ(notes[1], "Media controller changed: com.example.first → com.example.second");

    dispatcher_->detach();
    EXPECT_EQ(media_.subscriberCount(), 0u);
}

TEST_F(CommandDispatcherTest, RejectsNegativeDelays) {
    CommandDispatcher::Settings settings;
    settings.settle_period = -1ms;
    EXPECT_THROW(CommandDispatcher(*scheduler_, media_, *publisher_, *emitter_, settings), core::Error);
}

TEST_F(CommandDispatcherTest, SubmitFailsWhenSchedulerStopped) {
    createDispatcher();
    scheduler_->stop();
    EXPECT_FALSE(dispatcher_->submit(R"({"command":"play"})"));
}

} // namespace nocturne::protocol::test
