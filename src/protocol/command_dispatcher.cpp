#include "nocturne/protocol/command_dispatcher.hpp"
#include "nocturne/protocol/events.hpp"
#include "nocturne/protocol/frame_codec.hpp"
#include "nocturne/core/logger.hpp"

#include <cmath>

namespace nocturne::protocol {

using core::ErrorCode;
using core::Result;

namespace {

std::string controllerName(const std::string& package_name) {
    return package_name.empty() ? std::string("none") : package_name;
}

} // namespace

CommandDispatcher::CommandDispatcher(core::TaskScheduler& scheduler,
                                     media::MediaFacade& facade,
                                     StatePublisher& publisher,
                                     core::EventEmitter& emitter,
                                     Settings settings)
    : facade_(facade)
    , publisher_(publisher)
    , emitter_(emitter)
    , settings_(settings)
    , queue_(scheduler)
    , token_(core::make_cancellation_token()) {
    if (settings_.grace_period.count() < 0 || settings_.settle_period.count() < 0) {
        core::throw_error(ErrorCode::InvalidArgument, "Dispatcher delays must not be negative");
    }
}

CommandDispatcher::~CommandDispatcher() {
    detach();
    cancelPending();
    if (!queue_.waitIdle(std::chrono::seconds(5))) {
        core::Logger::warn("Command dispatcher destroyed while a command is running");
    }
}

void CommandDispatcher::attach() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (subscription_) return;

    subscription_ = facade_.subscribe([this](const media::MediaEvent& event) {
        handleMediaEvent(event);
    });
}

void CommandDispatcher::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!subscription_) return;

    facade_.unsubscribe(*subscription_);
    subscription_.reset();
}

void CommandDispatcher::handleMediaEvent(const media::MediaEvent& event) {
    if (const auto* changed = std::get_if<media::ControllerChanged>(&event)) {
        notify("Media controller changed: " + controllerName(changed->previous) +
               " → " + controllerName(changed->current));
    }
}

bool CommandDispatcher::submit(std::string frame) {
    core::CancellationTokenPtr token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.frames_received++;
        token = token_;
    }

    bool queued = queue_.post([this, token, frame = std::move(frame)]() {
        process(frame, *token);
    });
    if (!queued) {
        core::Logger::warn("Dispatcher queue rejected a frame, scheduler not running");
    }
    return queued;
}

void CommandDispatcher::cancelPending() {
    core::CancellationTokenPtr previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = token_;
        token_ = core::make_cancellation_token();
    }
    previous->cancel();

    auto dropped = queue_.clear();
    if (dropped > 0) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.cancelled += dropped;
        }
        core::Logger::info("Dropped {} queued commands", dropped);
        emitter_.emit(events::kDiagnostic, Diagnostic{ErrorCode::Cancelled,
            "Dropped " + std::to_string(dropped) + " queued commands", ""});
    }
}

bool CommandDispatcher::waitIdle(std::chrono::milliseconds timeout) {
    return queue_.waitIdle(timeout);
}

void CommandDispatcher::process(const std::string& frame, const core::CancellationToken& token) {
    emitter_.emit(events::kRawInbound, frame);

    if (token.isCancelled()) {
        cancelled(frame);
        return;
    }

    // 1. Parse
    auto parsed = decodeJson(frame);
    if (!parsed) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.decode_errors++;
        }
        diagnose(ErrorCode::DecodeError, "Malformed JSON", frame);
        return;
    }

    auto command = parseCommand(parsed.value());
    if (!command) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.decode_errors++;
        }
        diagnose(command.code(), command.error().what(), frame);
        return;
    }

    const Command& cmd = command.value();
    emitter_.emit(events::kCommand, cmd);
    core::Logger::debug("Handling command: {}", cmd.name);

    // 2. Media target, with a single grace wait
    auto controller = facade_.activeController();
    if (!controller) {
        core::Logger::debug("No media controller, waiting {}ms", settings_.grace_period.count());
        if (!token.sleepFor(settings_.grace_period)) {
            cancelled(frame);
            return;
        }
        controller = facade_.activeController();
    }
    if (!controller) {
        diagnose(ErrorCode::NoMediaTarget, "No active media controller for '" + cmd.name + "'", frame);
        return;
    }

    // 3. Kind-specific fields
    if (auto valid = validateCommand(cmd); !valid) {
        diagnose(valid.code(), valid.error().what(), frame);
        return;
    }

    // 4. Exactly one side effect
    notify("Executing: " + cmd.displayName() + " on " + controller->packageName());
    if (auto executed = execute(cmd, *controller); !executed) {
        diagnose(executed.code(), "Error executing " + cmd.name + ": " + executed.error().what(), frame);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.commands_executed++;
    }

    // 5. The media source may apply the change asynchronously
    if (!token.sleepFor(settings_.settle_period)) {
        core::Logger::debug("Settle wait cancelled after {}", cmd.name);
        return;
    }
    publisher_.publishSnapshot();
}

Result<void> CommandDispatcher::execute(const Command& command, media::MediaController& controller) {
    switch (command.kind) {
        case CommandKind::Play:
            return controller.play();
        case CommandKind::Pause:
            return controller.pause();
        case CommandKind::Next:
            return controller.skipToNext();
        case CommandKind::Previous:
            return controller.skipToPrevious();
        case CommandKind::SeekTo:
            return controller.seekTo(*command.value_ms);
        case CommandKind::SetVolume: {
            auto max = facade_.volume().max;
            auto level = static_cast<int>(std::lround(max * (*command.value_percent) / 100.0));
            core::Logger::debug("Setting volume to {}/{} ({}%)", level, max, *command.value_percent);
            return facade_.setVolume(level);
        }
        case CommandKind::Unknown:
            break;
    }
    return {ErrorCode::UnknownCommand, "Unknown command '" + command.name + "'"};
}

void CommandDispatcher::diagnose(ErrorCode code, const std::string& message, const std::string& raw) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.commands_dropped++;
    }
    core::Logger::warn("Command dropped: {}", message);
    emitter_.emit(events::kDiagnostic, Diagnostic{code, message, raw});
}

void CommandDispatcher::cancelled(const std::string& raw) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.cancelled++;
    }
    emitter_.emit(events::kDiagnostic, Diagnostic{ErrorCode::Cancelled, "Command cancelled", raw});
}

void CommandDispatcher::notify(const std::string& text) {
    core::Logger::info("{}", text);
    emitter_.emit(events::kNotification, text);
}

CommandDispatcher::Stats CommandDispatcher::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace nocturne::protocol
