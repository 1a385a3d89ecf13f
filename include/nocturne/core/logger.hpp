#pragma once

#include <string>
#include <string_view>
#include <iostream>
#include <sstream>
#include <mutex>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <functional>
#include <optional>

namespace nocturne::core {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Sink untuk output log; default ke stdout
using LogSink = std::function<void(LogLevel, const std::string&)>;

const char* logLevelName(LogLevel level);
std::optional<LogLevel> parseLogLevel(std::string_view name);

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Replace stdout output. Passing an empty sink restores stdout.
    static void setSink(LogSink sink);

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(const std::string& format, Args&&... args) {
        log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

private:
    static std::atomic<LogLevel> current_level_;
    static std::mutex mutex_;
    static LogSink sink_;

    template<typename... Args>
    static void log(LogLevel level, const std::string& format, Args&&... args) {
        if (level < current_level_.load()) return;

        std::string message = formatString(format, std::forward<Args>(args)...);

        std::lock_guard<std::mutex> lock(mutex_);
        if (sink_) {
            sink_(level, message);
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::ostringstream oss;
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();

        std::cout << "[" << oss.str() << "] [" << logLevelName(level) << "] "
                  << message << std::endl;
    }

    template<typename T>
    static std::string formatString(const std::string& format, T&& value) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string result = format;
            result.replace(pos, 2, oss.str());
            return result;
        }
        return format;
    }

    template<typename T, typename... Args>
    static std::string formatString(const std::string& format, T&& value, Args&&... args) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            // Continue after the substituted text so values containing "{}" stay intact
            std::string head = format.substr(0, pos) + oss.str();
            return head + formatString(format.substr(pos + 2), std::forward<Args>(args)...);
        }
        return format;
    }

    static std::string formatString(const std::string& format) {
        return format;
    }
};

} // namespace nocturne::core
