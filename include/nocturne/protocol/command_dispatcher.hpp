#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nocturne/core/error.hpp>
#include <nocturne/core/event.hpp>
#include <nocturne/core/task.hpp>
#include <nocturne/media/media_facade.hpp>
#include <nocturne/protocol/messages.hpp>
#include <nocturne/protocol/state_publisher.hpp>

namespace nocturne::protocol {

// Executes inbound frames against the media facade, strictly one at a time
// in arrival order. Every frame that does not end in a facade call produces
// at least one diagnostic event.
class CommandDispatcher {
public:
    struct Settings {
        // Wait once for a media app to bind before dropping a command
        std::chrono::milliseconds grace_period{250};
        // Delay between the side effect and the follow-up snapshot
        std::chrono::milliseconds settle_period{100};
    };

    CommandDispatcher(core::TaskScheduler& scheduler,
                      media::MediaFacade& facade,
                      StatePublisher& publisher,
                      core::EventEmitter& emitter,
                      Settings settings);
    ~CommandDispatcher();

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    // Watch controller changes for status notifications
    void attach();
    void detach();

    // Queue one decoded frame. Returns false when the scheduler is stopped.
    bool submit(std::string frame);

    // Drop queued frames and interrupt a pending grace or settle wait
    void cancelPending();

    bool waitIdle(std::chrono::milliseconds timeout);

    // Runs the whole pipeline for one frame on the calling thread
    void process(const std::string& frame, const core::CancellationToken& token);

    const Settings& settings() const { return settings_; }

    struct Stats {
        uint64_t frames_received = 0;
        uint64_t commands_executed = 0;
        uint64_t commands_dropped = 0;
        uint64_t decode_errors = 0;
        uint64_t cancelled = 0;
    };

    Stats getStats() const;

private:
    core::Result<void> execute(const Command& command, media::MediaController& controller);

    void diagnose(core::ErrorCode code, const std::string& message, const std::string& raw);
    void cancelled(const std::string& raw);
    void notify(const std::string& text);
    void handleMediaEvent(const media::MediaEvent& event);

    media::MediaFacade& facade_;
    StatePublisher& publisher_;
    core::EventEmitter& emitter_;
    Settings settings_;

    core::SerialQueue queue_;

    mutable std::mutex mutex_;
    core::CancellationTokenPtr token_;
    std::optional<media::SubscriptionId> subscription_;
    Stats stats_;
};

} // namespace nocturne::protocol
