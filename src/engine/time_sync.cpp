#include "nocturne/engine/time_sync.hpp"
#include "nocturne/core/logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string_view>

namespace nocturne::engine {

using core::ErrorCode;

namespace {

bool looksLikeZoneId(const std::string& zone) {
    return !zone.empty() && zone.find_first_of(" \t\r\n") == std::string::npos;
}

} // namespace

std::string localTimezone() {
    if (const char* tz = std::getenv("TZ")) {
        std::string zone(tz);
        // POSIX allows a leading ':' before a zone file name
        if (!zone.empty() && zone.front() == ':') {
            zone.erase(0, 1);
        }
        if (looksLikeZoneId(zone)) {
            return zone;
        }
    }

    std::ifstream timezone_file("/etc/timezone");
    std::string zone;
    if (timezone_file && std::getline(timezone_file, zone) && looksLikeZoneId(zone)) {
        return zone;
    }

    // /etc/localtime -> /usr/share/zoneinfo/Europe/Berlin
    std::error_code ec;
    auto target = std::filesystem::read_symlink("/etc/localtime", ec);
    if (!ec) {
        auto path = target.generic_string();
        constexpr std::string_view kMarker = "zoneinfo/";
        auto pos = path.find(kMarker);
        if (pos != std::string::npos && pos + kMarker.size() < path.size()) {
            return path.substr(pos + kMarker.size());
        }
    }

    return "UTC";
}

protocol::TimeSync currentTimeSync() {
    protocol::TimeSync sync;
    sync.timestamp_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    sync.timezone = localTimezone();
    return sync;
}

TimeSyncService::TimeSyncService(core::TaskScheduler& scheduler,
                                 protocol::StatePublisher& publisher,
                                 ConnectedCheck connected,
                                 std::chrono::milliseconds interval,
                                 ClockSource clock)
    : scheduler_(scheduler)
    , publisher_(publisher)
    , connected_(std::move(connected))
    , interval_(interval)
    , clock_(std::move(clock))
    , state_(std::make_shared<State>()) {
    if (!connected_ || !clock_) {
        core::throw_error(ErrorCode::InvalidArgument, "Time sync needs a connection check and a clock");
    }
    if (interval_.count() < 0) {
        core::throw_error(ErrorCode::InvalidArgument, "Time sync interval must not be negative");
    }
}

TimeSyncService::~TimeSyncService() {
    stop();
}

void TimeSyncService::start() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->running || interval_.count() == 0) {
        return;
    }
    state_->running = true;
    arm();
    core::Logger::debug("Time sync every {}ms", interval_.count());
}

void TimeSyncService::stop() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (!state_->running) {
        return;
    }
    state_->running = false;
    if (state_->timer != 0) {
        scheduler_.cancelTimer(state_->timer);
        state_->timer = 0;
    }
    state_->idle_cv.wait(lock, [this] { return !state_->ticking; });
}

bool TimeSyncService::running() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->running;
}

void TimeSyncService::sendNow() {
    auto sync = clock_();
    core::Logger::debug("Sending time sync {} ({})", sync.timestamp_ms, sync.timezone);
    publisher_.publishTimeSync(sync);
}

void TimeSyncService::arm() {
    // The job only touches the service while running is set; stop() waits for it
    state_->timer = scheduler_.scheduleAfter(interval_, [this, state = state_] {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (!state->running) return;
            state->ticking = true;
            state->timer = 0;
        }

        tick();

        std::lock_guard<std::mutex> lock(state->mutex);
        state->ticking = false;
        if (state->running) {
            arm();
        }
        state->idle_cv.notify_all();
    });

    if (state_->timer == 0) {
        core::Logger::warn("Time sync timer not armed, scheduler is not running");
    }
}

void TimeSyncService::tick() {
    if (!connected_()) {
        core::Logger::debug("Periodic time sync skipped, not connected");
        return;
    }
    sendNow();
}

} // namespace nocturne::engine
