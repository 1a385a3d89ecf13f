#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include <nocturne/core/event.hpp>
#include <nocturne/core/task.hpp>
#include <nocturne/engine/notification_sink.hpp>
#include <nocturne/engine/settings.hpp>
#include <nocturne/engine/time_sync.hpp>
#include <nocturne/media/media_facade.hpp>
#include <nocturne/protocol/command_dispatcher.hpp>
#include <nocturne/protocol/state_publisher.hpp>
#include <nocturne/session/session_manager.hpp>
#include <nocturne/transport/transport.hpp>

namespace nocturne::engine {

// Host-level switch
enum class EngineCommand {
    Start,
    Stop
};

// "START" / "STOP", case-insensitive
std::optional<EngineCommand> parseEngineCommand(std::string_view text);

// Transport for the configured type, one per connection attempt
transport::TransportFactory makeTransportFactory(const EngineSettings& settings);

// Wires session, dispatcher and publisher around one media facade.
// Observers subscribe on events(); deliveries run on the engine's event loop.
class Engine {
public:
    Engine(EngineSettings settings,
           media::MediaFacade& facade,
           transport::TransportFactory factory = nullptr,
           TimeSyncService::ClockSource clock = currentTimeSync);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Attach to the media source and open a session. Also re-opens the
    // session after it ended, as long as the engine is running.
    bool start();

    // Close the session, cancel pending commands, detach from the media
    // source. No-op when stopped.
    void stop();

    void handle(EngineCommand command);

    bool isRunning() const;
    session::ConnectionStatus status() const;

    void setNotificationSink(std::shared_ptr<NotificationSink> sink);

    core::EventEmitter& events() { return *emitter_; }
    session::SessionManager& session() { return *session_; }
    protocol::StatePublisher& publisher() { return *publisher_; }
    protocol::CommandDispatcher& dispatcher() { return *dispatcher_; }
    TimeSyncService& timeSync() { return *time_sync_; }
    const EngineSettings& settings() const { return settings_; }

    // Wait for queued commands and event deliveries to finish
    bool waitIdle(std::chrono::milliseconds timeout);

private:
    void registerObservers();

    EngineSettings settings_;
    media::MediaFacade& facade_;

    std::unique_ptr<core::EventLoop> loop_;
    std::unique_ptr<core::EventEmitter> emitter_;
    std::unique_ptr<core::TaskScheduler> scheduler_;
    std::unique_ptr<session::SessionManager> session_;
    std::unique_ptr<protocol::StatePublisher> publisher_;
    std::unique_ptr<protocol::CommandDispatcher> dispatcher_;
    std::unique_ptr<TimeSyncService> time_sync_;

    mutable std::mutex mutex_;
    bool running_ = false;
    std::shared_ptr<NotificationSink> sink_;
    std::vector<core::ListenerId> listeners_;
};

} // namespace nocturne::engine
