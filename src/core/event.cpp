#include <nocturne/core/event.hpp>
#include <nocturne/core/logger.hpp>

#include <algorithm>

namespace nocturne::core {

// EventLoop implementation

EventLoop::EventLoop() = default;

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;

    running_ = true;
    stop_requested_ = false;
    worker_ = std::thread(&EventLoop::run, this);
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        stop_requested_ = true;
    }

    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

void EventLoop::post(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(job));
    }
    cv_.notify_one();
}

bool EventLoop::processOne() {
    Job job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        job = std::move(queue_.front());
        queue_.pop_front();
        ++active_;
    }

    execute(job);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
    }
    idle_cv_.notify_all();
    return true;
}

void EventLoop::processAll() {
    while (processOne()) {}
}

bool EventLoop::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return queue_.empty() && active_ == 0;
    });
}

bool EventLoop::isRunning() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::size_t EventLoop::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void EventLoop::execute(Job& job) {
    try {
        job();
    }
    catch (const std::exception& e) {
        Logger::error("Error processing event: {}", e.what());
    }
}

void EventLoop::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        // Wait untuk event atau stop request
        cv_.wait(lock, [this] {
            return !queue_.empty() || stop_requested_;
        });

        // Drain what is left before honouring the stop request
        if (queue_.empty() && stop_requested_) break;

        Job job = std::move(queue_.front());
        queue_.pop_front();
        ++active_;

        // Release lock selama processing
        lock.unlock();
        execute(job);
        lock.lock();

        --active_;
        if (queue_.empty() && active_ == 0) {
            idle_cv_.notify_all();
        }
    }
}

// EventEmitter implementation

EventEmitter::EventEmitter(EventLoop& loop)
    : loop_(loop)
    , registry_(std::make_shared<Registry>()) {}

EventEmitter::~EventEmitter() {
    removeAllListeners();
}

void EventEmitter::emit(Event event) {
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        event.id_ = registry_->next_event_id++;
    }

    loop_.post([registry = registry_, event = std::move(event)]() {
        deliver(registry, event);
    });
}

void EventEmitter::emit(std::string type, std::any data) {
    emit(Event(std::move(type), std::move(data)));
}

ListenerId EventEmitter::addListener(const std::string& type, EventCallback callback) {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    ListenerId id = registry_->next_listener_id++;
    registry_->listeners.push_back(
        std::make_shared<const EventListener>(id, type, std::move(callback)));
    return id;
}

ListenerId EventEmitter::addListener(EventCallback callback, EventFilter filter) {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    ListenerId id = registry_->next_listener_id++;
    registry_->listeners.push_back(
        std::make_shared<const EventListener>(id, std::string(), std::move(callback), std::move(filter)));
    return id;
}

bool EventEmitter::removeListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    auto& listeners = registry_->listeners;
    auto it = std::find_if(listeners.begin(), listeners.end(),
        [id](const auto& listener) { return listener->id() == id; });
    if (it == listeners.end()) {
        return false;
    }
    listeners.erase(it);
    return true;
}

void EventEmitter::removeListeners(const std::string& type) {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    auto& listeners = registry_->listeners;
    listeners.erase(std::remove_if(listeners.begin(), listeners.end(),
        [&type](const auto& listener) { return listener->type() == type; }),
        listeners.end());
}

void EventEmitter::removeAllListeners() {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    registry_->listeners.clear();
}

std::size_t EventEmitter::listenerCount() const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->listeners.size();
}

void EventEmitter::deliver(const std::shared_ptr<Registry>& registry, const Event& event) {
    // Snapshot so listeners may (un)register while being called
    std::vector<std::shared_ptr<const EventListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(registry->mutex);
        listeners = registry->listeners;
    }

    for (const auto& listener : listeners) {
        if (!listener->accepts(event)) continue;
        try {
            listener->handle(event);
        }
        catch (const std::exception& e) {
            Logger::error("Listener {} failed on event {}: {}", listener->id(), event.type(), e.what());
        }
    }
}

} // namespace nocturne::core
