#pragma once

#include <string>

#include <nocturne/session/connection_status.hpp>

namespace nocturne::engine {

// Display surface of the host (status bar, notification, console).
// Observational only; called on the event loop thread.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual void onStatusText(const std::string& text) = 0;
    virtual void onStatusChanged(const session::ConnectionStatus& status) = 0;
};

} // namespace nocturne::engine
