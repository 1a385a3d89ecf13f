#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <nocturne/core/task.hpp>
#include <nocturne/protocol/messages.hpp>
#include <nocturne/protocol/state_publisher.hpp>

namespace nocturne::engine {

// IANA zone id of the host: $TZ, /etc/timezone, the /etc/localtime link, else "UTC"
std::string localTimezone();

// timeSync for the current wall clock
protocol::TimeSync currentTimeSync();

// Keeps the head unit's clock in step. sendNow() is used when a session
// connects; while started, a timer repeats the message every interval as
// long as a peer is connected.
class TimeSyncService {
public:
    using ClockSource = std::function<protocol::TimeSync()>;
    using ConnectedCheck = std::function<bool()>;

    TimeSyncService(core::TaskScheduler& scheduler,
                    protocol::StatePublisher& publisher,
                    ConnectedCheck connected,
                    std::chrono::milliseconds interval,
                    ClockSource clock = currentTimeSync);
    ~TimeSyncService();

    TimeSyncService(const TimeSyncService&) = delete;
    TimeSyncService& operator=(const TimeSyncService&) = delete;

    // Arms the periodic timer; no-op when the interval is 0
    void start();

    // Cancels the timer and waits for a tick that is already running
    void stop();

    bool running() const;

    void sendNow();

    std::chrono::milliseconds interval() const { return interval_; }

private:
    // Shared with queued timer jobs, which may outlive the service
    struct State {
        std::mutex mutex;
        std::condition_variable idle_cv;
        bool running = false;
        bool ticking = false;
        core::TimerId timer = 0;
    };

    // Caller holds state_->mutex
    void arm();
    void tick();

    core::TaskScheduler& scheduler_;
    protocol::StatePublisher& publisher_;
    ConnectedCheck connected_;
    std::chrono::milliseconds interval_;
    ClockSource clock_;
    std::shared_ptr<State> state_;
};

} // namespace nocturne::engine
