#pragma once

#include <memory>
#include <future>
#include <queue>
#include <deque>
#include <thread>
#include <functional>
#include <chrono>
#include <mutex>
#include <vector>
#include <cstdint>
#include <condition_variable>

#include <nocturne/core/error.hpp>

namespace nocturne::core {

// Task priority untuk scheduling
enum class TaskPriority {
    Low,
    Normal,
    High,
    Critical
};

using TimerId = std::uint64_t;

// Fixed-size worker pool. Tasks of equal priority run in submission order.
class TaskScheduler {
public:
    using Job = std::function<void()>;

    TaskScheduler();
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    // Returns false when the scheduler is not running
    bool schedule(Job job, TaskPriority priority = TaskPriority::Normal);

    // Queue the job once the delay has elapsed. Returns 0 when the scheduler
    // is not running. Timers still pending at stop() are dropped.
    TimerId scheduleAfter(std::chrono::milliseconds delay, Job job,
                          TaskPriority priority = TaskPriority::Normal);

    // False when the timer already fired or was cancelled
    bool cancelTimer(TimerId id);

    std::size_t pendingTimers() const;

    // Schedule and get a future for the result
    template<typename F>
    auto submit(F&& fn, TaskPriority priority = TaskPriority::Normal)
        -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto future = task->get_future();
        if (!schedule([task]() { (*task)(); }, priority)) {
            throw_error(ErrorCode::InvalidState, "Task scheduler is not running");
        }
        return future;
    }

    void start(std::size_t thread_count = std::thread::hardware_concurrency());

    // Runs the tasks still queued, then joins the workers.
    // Must not be called from a worker thread.
    void stop();

    bool isRunning() const noexcept;
    std::size_t queueSize() const;
    std::size_t threadCount() const;

    // True when the calling thread is one of this scheduler's workers
    bool onWorkerThread() const;

private:
    struct TaskEntry {
        Job job;
        TaskPriority priority;
        std::uint64_t sequence;

        // Compare untuk priority queue: higher priority first, then older first
        bool operator<(const TaskEntry& other) const {
            if (priority != other.priority) {
                return priority < other.priority;
            }
            return sequence > other.sequence;
        }
    };

    struct TimerEntry {
        TimerId id;
        std::chrono::steady_clock::time_point due;
        Job job;
        TaskPriority priority;
    };

    void run();

    // Caller holds mutex_
    void promoteDueTimers();

    std::priority_queue<TaskEntry> tasks_;
    std::vector<TimerEntry> timers_;
    TimerId next_timer_id_ = 1;
    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::uint64_t next_sequence_ = 0;
    bool running_ = false;
    bool stop_requested_ = false;
};

inline std::unique_ptr<TaskScheduler> make_task_scheduler() {
    return std::make_unique<TaskScheduler>();
}

// Runs posted jobs one at a time, in posting order, on a scheduler
class SerialQueue {
public:
    using Job = std::function<void()>;

    explicit SerialQueue(TaskScheduler& scheduler);
    ~SerialQueue();

    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    // Returns false if the job could not be scheduled
    bool post(Job job);

    // Drop jobs that have not started yet; returns how many were dropped
    std::size_t clear();

    bool waitIdle(std::chrono::milliseconds timeout);

    std::size_t pending() const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable idle_cv;
        std::deque<Job> jobs;
        bool draining = false;
    };

    static void drainOne(TaskScheduler& scheduler, const std::shared_ptr<State>& state);

    TaskScheduler& scheduler_;
    std::shared_ptr<State> state_;
};

// Cancellable waits for grace/settle periods
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();
    bool isCancelled() const;

    // Sleeps for the duration; returns false if cancelled before it elapsed
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

inline CancellationTokenPtr make_cancellation_token() {
    return std::make_shared<CancellationToken>();
}

} // namespace nocturne::core
