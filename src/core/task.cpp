#include <nocturne/core/task.hpp>
#include <nocturne/core/logger.hpp>

#include <algorithm>

namespace nocturne::core {

// TaskScheduler implementation

TaskScheduler::TaskScheduler() = default;

TaskScheduler::~TaskScheduler() {
    stop();
}

bool TaskScheduler::schedule(Job job, TaskPriority priority) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stop_requested_) {
            return false;
        }
        tasks_.push({std::move(job), priority, next_sequence_++});
    }
    cv_.notify_one();
    return true;
}

TimerId TaskScheduler::scheduleAfter(std::chrono::milliseconds delay, Job job, TaskPriority priority) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stop_requested_) {
            return 0;
        }
        id = next_timer_id_++;
        auto due = std::chrono::steady_clock::now() + std::max(delay, std::chrono::milliseconds(0));
        timers_.push_back({id, due, std::move(job), priority});
    }
    // A waiting worker has to recompute its deadline
    cv_.notify_one();
    return id;
}

bool TaskScheduler::cancelTimer(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(timers_.begin(), timers_.end(),
        [id](const TimerEntry& timer) { return timer.id == id; });
    if (it == timers_.end()) {
        return false;
    }
    timers_.erase(it);
    return true;
}

std::size_t TaskScheduler::pendingTimers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void TaskScheduler::promoteDueTimers() {
    auto now = std::chrono::steady_clock::now();
    auto it = timers_.begin();
    while (it != timers_.end()) {
        if (it->due <= now) {
            tasks_.push({std::move(it->job), it->priority, next_sequence_++});
            it = timers_.erase(it);
        } else {
            ++it;
        }
    }
}

void TaskScheduler::start(std::size_t thread_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;

    thread_count = std::max<std::size_t>(thread_count, 1);
    running_ = true;
    stop_requested_ = false;

    workers_.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back(&TaskScheduler::run, this);
    }

    Logger::info("Task scheduler started with {} worker threads", thread_count);
}

void TaskScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stop_requested_) return;

        stop_requested_ = true;
    }

    cv_.notify_all();

    // Wait untuk semua workers
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!timers_.empty()) {
        Logger::debug("Dropping {} pending timers", timers_.size());
        timers_.clear();
    }
    workers_.clear();
    running_ = false;
    stop_requested_ = false;

    Logger::info("Task scheduler stopped");
}

bool TaskScheduler::isRunning() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ && !stop_requested_;
}

std::size_t TaskScheduler::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

std::size_t TaskScheduler::threadCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

bool TaskScheduler::onWorkerThread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto self = std::this_thread::get_id();
    return std::any_of(workers_.begin(), workers_.end(),
        [self](const std::thread& worker) { return worker.get_id() == self; });
}

void TaskScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        promoteDueTimers();

        if (tasks_.empty()) {
            if (stop_requested_) break;

            // Wait untuk task, stop request atau timer berikutnya
            if (timers_.empty()) {
                cv_.wait(lock);
            } else {
                auto due = std::min_element(timers_.begin(), timers_.end(),
                    [](const TimerEntry& a, const TimerEntry& b) { return a.due < b.due; })->due;
                cv_.wait_until(lock, due);
            }
            continue;
        }

        // Get task dengan priority tertinggi
        TaskEntry entry = tasks_.top();
        tasks_.pop();

        // Release lock selama execution
        lock.unlock();

        try {
            entry.job();
        }
        catch (const std::exception& e) {
            Logger::error("Error executing task: {}", e.what());
        }

        lock.lock();
    }
}

// SerialQueue implementation

SerialQueue::SerialQueue(TaskScheduler& scheduler)
    : scheduler_(scheduler)
    , state_(std::make_shared<State>()) {}

SerialQueue::~SerialQueue() {
    clear();
    if (!waitIdle(std::chrono::seconds(5))) {
        Logger::warn("Serial queue destroyed while a job is still running");
    }
}

bool SerialQueue::post(Job job) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->jobs.push_back(std::move(job));
        if (state_->draining) {
            return true;
        }
        state_->draining = true;
    }

    auto state = state_;
    auto& scheduler = scheduler_;
    if (!scheduler_.schedule([&scheduler, state]() { drainOne(scheduler, state); })) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->jobs.clear();
        state_->draining = false;
        state_->idle_cv.notify_all();
        return false;
    }
    return true;
}

std::size_t SerialQueue::clear() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::size_t dropped = state_->jobs.size();
    state_->jobs.clear();
    return dropped;
}

bool SerialQueue::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->idle_cv.wait_for(lock, timeout, [this] {
        return !state_->draining && state_->jobs.empty();
    });
}

std::size_t SerialQueue::pending() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->jobs.size();
}

void SerialQueue::drainOne(TaskScheduler& scheduler, const std::shared_ptr<State>& state) {
    Job job;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->jobs.empty()) {
            state->draining = false;
            state->idle_cv.notify_all();
            return;
        }
        job = std::move(state->jobs.front());
        state->jobs.pop_front();
    }

    try {
        job();
    }
    catch (const std::exception& e) {
        Logger::error("Error executing queued job: {}", e.what());
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->jobs.empty()) {
            state->draining = false;
            state->idle_cv.notify_all();
            return;
        }
    }

    // One job per turn so other tasks get a worker in between
    if (!scheduler.schedule([&scheduler, state]() { drainOne(scheduler, state); })) {
        std::lock_guard<std::mutex> lock(state->mutex);
        Logger::warn("Scheduler stopped, dropping {} queued jobs", state->jobs.size());
        state->jobs.clear();
        state->draining = false;
        state->idle_cv.notify_all();
    }
}

// CancellationToken implementation

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::isCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return cancelled_; });
}

} // namespace nocturne::core
