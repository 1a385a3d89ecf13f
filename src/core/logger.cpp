#include "nocturne/core/logger.hpp"

#include <algorithm>
#include <cctype>

namespace nocturne::core {

std::atomic<LogLevel> Logger::current_level_{LogLevel::INFO};
std::mutex Logger::mutex_;
LogSink Logger::sink_;

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::ERROR;
    return std::nullopt;
}

void Logger::setLevel(LogLevel level) {
    current_level_.store(level);
}

LogLevel Logger::getLevel() {
    return current_level_.load();
}

void Logger::setSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

} // namespace nocturne::core
