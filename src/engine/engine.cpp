#include "nocturne/engine/engine.hpp"
#include "nocturne/protocol/events.hpp"
#include "nocturne/transport/tcp_stream_transport.hpp"
#include "nocturne/transport/udp_message_transport.hpp"
#include "nocturne/core/logger.hpp"

#include <algorithm>
#include <cctype>

namespace nocturne::engine {

using core::ErrorCode;
namespace events = protocol::events;

namespace {

// One line per protocol event for the debug log
std::string describe(const core::Event& event) {
    const auto& type = event.type();
    if (type == events::kRawInbound || type == events::kStateUpdate ||
        type == events::kTimeSync || type == events::kNotification) {
        return event.get<std::string>();
    }
    if (type == events::kCommand) {
        return protocol::toJson(event.get<protocol::Command>()).dump();
    }
    if (type == events::kDiagnostic) {
        return event.get<protocol::Diagnostic>().toString();
    }
    if (type == events::kConnectionStatus) {
        return event.get<session::ConnectionStatus>().toString();
    }
    return "(no description)";
}

} // namespace

std::optional<EngineCommand> parseEngineCommand(std::string_view text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    auto last = text.find_last_not_of(" \t\r\n");

    std::string word(text.substr(first, last - first + 1));
    std::transform(word.begin(), word.end(), word.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (word == "START") return EngineCommand::Start;
    if (word == "STOP") return EngineCommand::Stop;
    return std::nullopt;
}

transport::TransportFactory makeTransportFactory(const EngineSettings& settings) {
    if (settings.transport_type == TransportType::Udp) {
        auto max_payload = settings.max_payload_size;
        return [max_payload]() -> std::unique_ptr<transport::Transport> {
            return std::make_unique<transport::UdpMessageTransport>(max_payload);
        };
    }
    return []() -> std::unique_ptr<transport::Transport> {
        return std::make_unique<transport::TcpStreamTransport>();
    };
}

Engine::Engine(EngineSettings settings,
               media::MediaFacade& facade,
               transport::TransportFactory factory,
               TimeSyncService::ClockSource clock)
    : settings_(std::move(settings))
    , facade_(facade) {
    if (auto valid = validate(settings_); !valid) {
        throw valid.error();
    }
    if (!factory) {
        factory = makeTransportFactory(settings_);
    }

    loop_ = core::make_event_loop();
    loop_->start();
    emitter_ = core::make_event_emitter(*loop_);

    scheduler_ = core::make_task_scheduler();
    scheduler_->start(settings_.workers);

    session_ = std::make_unique<session::SessionManager>(*scheduler_, *emitter_, std::move(factory),
        session::SessionManager::Settings{settings_.target, settings_.max_frame_size});

    publisher_ = std::make_unique<protocol::StatePublisher>(facade_, *emitter_,
        [this](const std::string& line) { return session_->send(line); });

    dispatcher_ = std::make_unique<protocol::CommandDispatcher>(*scheduler_, facade_, *publisher_, *emitter_,
        protocol::CommandDispatcher::Settings{settings_.grace_period, settings_.settle_period});

    time_sync_ = std::make_unique<TimeSyncService>(*scheduler_, *publisher_,
        [this] { return session_->status().isConnected(); },
        settings_.time_sync_interval, std::move(clock));

    session_->setFrameHandler([this](std::string frame) {
        dispatcher_->submit(std::move(frame));
    });
    session_->setConnectedHandler([this](const std::string& peer) {
        if (settings_.publish_on_connect) {
            core::Logger::debug("Sending initial state to {}", peer);
            publisher_->publishSnapshot();
        }
        if (settings_.time_sync_on_connect) {
            time_sync_->sendNow();
        }
    });

    registerObservers();
}

Engine::~Engine() {
    stop();

    // Teardown order: nothing may call into a component after it is gone.
    // The dispatcher drains first since a finishing command still publishes
    // through the session.
    session_->stop();
    time_sync_.reset();
    dispatcher_.reset();
    publisher_.reset();
    session_.reset();
    scheduler_->stop();

    for (auto id : listeners_) {
        emitter_->removeListener(id);
    }
    loop_->stop();
}

void Engine::registerObservers() {
    listeners_.push_back(emitter_->addListener([](const core::Event& event) {
        core::Logger::debug("[event] {}: {}", event.type(), describe(event));
    }));

    listeners_.push_back(emitter_->addListener(events::kConnectionStatus, [this](const core::Event& event) {
        std::shared_ptr<NotificationSink> sink;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sink = sink_;
        }
        if (!sink) return;

        const auto& status = event.get<session::ConnectionStatus>();
        sink->onStatusChanged(status);
        sink->onStatusText(status.toString());
    }));

    listeners_.push_back(emitter_->addListener(events::kNotification, [this](const core::Event& event) {
        std::shared_ptr<NotificationSink> sink;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sink = sink_;
        }
        if (sink) {
            sink->onStatusText(event.get<std::string>());
        }
    }));

    listeners_.push_back(emitter_->addListener(events::kDiagnostic, [this](const core::Event& event) {
        std::shared_ptr<NotificationSink> sink;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sink = sink_;
        }
        if (sink) {
            sink->onStatusText("Error: " + event.get<protocol::Diagnostic>().message);
        }
    }));
}

bool Engine::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            publisher_->attach();
            dispatcher_->attach();
            time_sync_->start();
            running_ = true;
            core::Logger::info("Engine started ({} transport, {})",
                transportTypeName(settings_.transport_type), settings_.target.toString());
        }
    }
    return session_->start();
}

void Engine::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }

    session_->stop();
    time_sync_->stop();
    dispatcher_->cancelPending();
    dispatcher_->detach();
    publisher_->detach();

    auto session_stats = session_->getStats();
    auto dispatcher_stats = dispatcher_->getStats();
    core::Logger::info("Engine stopped: {} frames in, {} frames out, {} commands executed, {} dropped",
        session_stats.frames_received, session_stats.frames_sent,
        dispatcher_stats.commands_executed, dispatcher_stats.commands_dropped);
}

void Engine::handle(EngineCommand command) {
    switch (command) {
        case EngineCommand::Start:
            start();
            break;
        case EngineCommand::Stop:
            stop();
            break;
    }
}

bool Engine::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

session::ConnectionStatus Engine::status() const {
    return session_->status();
}

void Engine::setNotificationSink(std::shared_ptr<NotificationSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

bool Engine::waitIdle(std::chrono::milliseconds timeout) {
    return dispatcher_->waitIdle(timeout) && loop_->waitIdle(timeout);
}

} // namespace nocturne::engine
