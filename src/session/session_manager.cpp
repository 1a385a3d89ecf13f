#include "nocturne/session/session_manager.hpp"
#include "nocturne/protocol/events.hpp"
#include "nocturne/core/logger.hpp"

namespace nocturne::session {

using core::ErrorCode;
using core::Result;
namespace events = protocol::events;

namespace {

// Upper bound for stop() to wait on the receive task
constexpr std::chrono::seconds kStopTimeout{5};

} // namespace

SessionManager::SessionManager(core::TaskScheduler& scheduler,
                               core::EventEmitter& emitter,
                               transport::TransportFactory factory,
                               Settings settings)
    : scheduler_(scheduler)
    , emitter_(emitter)
    , factory_(std::move(factory))
    , settings_(std::move(settings)) {
    if (!factory_) {
        core::throw_error(ErrorCode::InvalidArgument, "Session manager needs a transport factory");
    }
}

SessionManager::~SessionManager() {
    stop();

    // A receive task that tore itself down may still be unwinding
    std::shared_future<void> done;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        done = loop_done_;
    }
    if (done.valid() && !scheduler_.onWorkerThread() &&
        done.wait_for(kStopTimeout) != std::future_status::ready) {
        core::Logger::warn("Session destroyed with its receive task still running");
    }
}

void SessionManager::setFrameHandler(FrameHandler handler) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    frame_handler_ = std::move(handler);
}

void SessionManager::setConnectedHandler(ConnectedHandler handler) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    connected_handler_ = std::move(handler);
}

bool SessionManager::start() {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (status_.state() == ConnectionState::Connecting || status_.isConnected()) {
        core::Logger::debug("Session already {}, ignoring start", connectionStateName(status_.state()));
        return false;
    }

    std::shared_ptr<transport::Transport> transport = factory_();
    if (!transport) {
        core::throw_error(ErrorCode::InvalidState, "Transport factory returned no transport");
    }

    uint64_t generation = ++generation_;
    transport_ = transport;
    encoder_ = protocol::makeFrameEncoder(transport->kind(), transport->maxPayloadSize());
    stats_.connection_attempts++;

    core::Logger::info("Starting session ({} transport, {})",
        transport::transportKindName(transport->kind()), settings_.target.toString());
    setStatusLocked(ConnectionStatus::connecting());

    auto task = std::make_shared<std::packaged_task<void()>>([this, generation, transport]() {
        runConnection(generation, transport);
    });
    loop_done_ = task->get_future().share();

    if (!scheduler_.schedule([task]() { (*task)(); }, core::TaskPriority::High)) {
        core::Logger::error("Cannot start session: task scheduler is not running");
        transport_.reset();
        encoder_.reset();
        loop_done_ = {};
        setStatusLocked(ConnectionStatus::failed("task scheduler is not running"));
        setStatusLocked(ConnectionStatus::disconnected());
        return false;
    }
    return true;
}

void SessionManager::runConnection(uint64_t generation, std::shared_ptr<transport::Transport> transport) {
    auto opened = transport->open(settings_.target);

    ConnectedHandler on_connected;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!isCurrentLocked(generation)) {
            // Stopped while opening; stop() already published Disconnected
            transport->close();
            return;
        }

        if (!opened) {
            std::string reason = opened.error().what();
            core::Logger::warn("Connection attempt failed: {}", reason);
            transport_.reset();
            encoder_.reset();
            ++generation_;
            transport->close();
            setStatusLocked(ConnectionStatus::failed(reason));
            setStatusLocked(ConnectionStatus::disconnected());
            return;
        }

        stats_.connections++;
        setStatusLocked(ConnectionStatus::connected(opened.value()));
        on_connected = connected_handler_;
    }

    if (on_connected) {
        on_connected(opened.value());
    }

    receiveLoop(generation, *transport);
}

void SessionManager::receiveLoop(uint64_t generation, transport::Transport& transport) {
    auto decoder = protocol::makeFrameDecoder(transport.kind(), settings_.max_frame_size);

    FrameHandler on_frame;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        on_frame = frame_handler_;
    }

    while (true) {
        auto data = transport.receive();
        if (!data) {
            teardown(generation, data.error().what());
            return;
        }

        auto decoded = decoder->feed(data.value());
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            stats_.bytes_received += data.value().size();
            stats_.frames_received += decoded.frames.size();
            stats_.decode_errors += decoded.issues.size();
        }

        for (auto& issue : decoded.issues) {
            core::Logger::warn("Decode error: {}", issue.message);
            emitter_.emit(events::kDiagnostic, protocol::Diagnostic{issue.code, issue.message, issue.raw});
        }

        for (auto& frame : decoded.frames) {
            core::Logger::debug("Received frame: {}", frame);
            if (on_frame) {
                on_frame(std::move(frame));
            } else {
                emitter_.emit(events::kDiagnostic, protocol::Diagnostic{
                    ErrorCode::InvalidState, "No handler for inbound frame", frame});
            }
        }
    }
}

void SessionManager::teardown(uint64_t generation, const std::string& reason) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!isCurrentLocked(generation) || status_.isDisconnected()) {
        return;
    }

    core::Logger::info("Session ended: {}", reason);
    ++generation_;
    auto transport = std::move(transport_);
    encoder_.reset();
    if (transport) {
        transport->close();
    }
    setStatusLocked(ConnectionStatus::disconnected());
}

void SessionManager::stop() {
    std::shared_future<void> done;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_.isDisconnected()) {
            return;
        }

        core::Logger::info("Stopping session");
        ++generation_;
        auto transport = std::move(transport_);
        encoder_.reset();
        if (transport) {
            transport->close();
        }
        setStatusLocked(ConnectionStatus::disconnected());
        done = std::move(loop_done_);
        loop_done_ = {};
    }

    // The receive task wakes up from close() and exits on its own
    if (done.valid() && !scheduler_.onWorkerThread()) {
        if (done.wait_for(kStopTimeout) != std::future_status::ready) {
            core::Logger::warn("Receive task did not exit within {}s", kStopTimeout.count());
        }
    }
}

Result<void> SessionManager::send(const std::string& text) {
    std::shared_ptr<transport::Transport> transport;
    std::shared_ptr<protocol::FrameEncoder> encoder;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!status_.isConnected() || !transport_ || !encoder_) {
            return {ErrorCode::NotConnected, "Session is not connected"};
        }
        transport = transport_;
        encoder = encoder_;
        generation = generation_;
    }

    std::lock_guard<std::mutex> write_lock(write_mutex_);

    auto units = encoder->encode(text);
    if (!units) {
        return units.error();
    }

    std::size_t bytes = 0;
    for (const auto& unit : units.value()) {
        auto sent = transport->send(unit);
        if (!sent) {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                stats_.send_failures++;
            }
            core::Logger::warn("Send failed: {}", sent.error().what());
            if (sent.code() != ErrorCode::NotConnected) {
                teardown(generation, sent.error().what());
            }
            return sent;
        }
        bytes += unit.size();
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    stats_.frames_sent++;
    stats_.bytes_sent += bytes;
    return {};
}

ConnectionStatus SessionManager::status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_;
}

SessionManager::Stats SessionManager::getStats() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return stats_;
}

void SessionManager::setStatusLocked(ConnectionStatus status) {
    status_ = std::move(status);
    core::Logger::info("Session status: {}", status_.toString());
    emitter_.emit(events::kConnectionStatus, status_);
}

bool SessionManager::isCurrentLocked(uint64_t generation) const {
    return generation == generation_;
}

} // namespace nocturne::session
