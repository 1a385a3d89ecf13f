#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <mutex>
#include <any>
#include <chrono>
#include <deque>
#include <thread>
#include <cstdint>
#include <condition_variable>

#include <nocturne/core/error.hpp>

namespace nocturne::core {

// Forward declarations
class EventLoop;
class Event;
class EventEmitter;

using EventCallback = std::function<void(const Event&)>;
using EventFilter = std::function<bool(const Event&)>;
using EventId = std::uint64_t;
using ListenerId = std::uint64_t;

// Event class untuk menyimpan data event
class Event {
public:
    Event(std::string type, std::any data = std::any())
        : type_(std::move(type))
        , data_(std::move(data))
        , timestamp_(std::chrono::system_clock::now()) {}

    const std::string& type() const noexcept { return type_; }
    const std::any& data() const noexcept { return data_; }
    auto timestamp() const noexcept { return timestamp_; }
    EventId id() const noexcept { return id_; }

    // Data access dengan type checking
    template<typename T>
    const T& get() const {
        const T* value = std::any_cast<T>(&data_);
        if (!value) {
            throw_error(ErrorCode::InvalidArgument,
                "Invalid event data type cast for event " + type_);
        }
        return *value;
    }

private:
    friend class EventEmitter;

    std::string type_;
    std::any data_;
    std::chrono::system_clock::time_point timestamp_;
    EventId id_ = 0;
};

// Event listener untuk menerima events
class EventListener {
public:
    EventListener(ListenerId id, std::string type, EventCallback callback, EventFilter filter = nullptr)
        : id_(id)
        , type_(std::move(type))
        , callback_(std::move(callback))
        , filter_(std::move(filter)) {}

    ListenerId id() const noexcept { return id_; }
    const std::string& type() const noexcept { return type_; }

    // Empty type means the listener receives every event
    bool accepts(const Event& event) const {
        if (!type_.empty() && type_ != event.type()) return false;
        return !filter_ || filter_(event);
    }

    void handle(const Event& event) const {
        callback_(event);
    }

private:
    ListenerId id_;
    std::string type_;
    EventCallback callback_;
    EventFilter filter_;
};

// Event loop: one dispatch thread, deliveries run in posting order
class EventLoop {
public:
    using Job = std::function<void()>;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void start();

    // Delivers everything already queued, then joins the dispatch thread
    void stop();

    void post(Job job);

    // Process single job on the calling thread
    bool processOne();

    void processAll();

    // Blocks until the queue is empty and no job is running
    bool waitIdle(std::chrono::milliseconds timeout);

    bool isRunning() const noexcept;
    std::size_t queueSize() const;

private:
    void run();
    void execute(Job& job);

    std::deque<Job> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::thread worker_;
    std::size_t active_ = 0;
    bool running_ = false;
    bool stop_requested_ = false;
};

// Event emitter untuk mengirim events
class EventEmitter {
public:
    explicit EventEmitter(EventLoop& loop);
    ~EventEmitter();

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    void emit(Event event);
    void emit(std::string type, std::any data = std::any());

    // Add/remove listeners. Safe to call from any thread, including from a listener.
    ListenerId addListener(const std::string& type, EventCallback callback);
    ListenerId addListener(EventCallback callback, EventFilter filter = nullptr);
    bool removeListener(ListenerId id);
    void removeListeners(const std::string& type);
    void removeAllListeners();

    std::size_t listenerCount() const;

private:
    // Shared with queued deliveries so the emitter can die before the loop drains
    struct Registry {
        mutable std::mutex mutex;
        std::vector<std::shared_ptr<const EventListener>> listeners;
        ListenerId next_listener_id = 1;
        EventId next_event_id = 1;
    };

    static void deliver(const std::shared_ptr<Registry>& registry, const Event& event);

    EventLoop& loop_;
    std::shared_ptr<Registry> registry_;
};

inline std::unique_ptr<EventEmitter> make_event_emitter(EventLoop& loop) {
    return std::make_unique<EventEmitter>(loop);
}

inline std::unique_ptr<EventLoop> make_event_loop() {
    return std::make_unique<EventLoop>();
}

} // namespace nocturne::core
