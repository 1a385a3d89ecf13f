#include <nocturne/core/config.hpp>
#include <nocturne/core/logger.hpp>
#include <nocturne/engine/engine.hpp>
#include <nocturne/engine/settings.hpp>
#include <nocturne/media/local_media_facade.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <chrono>
#include <csignal>
#include <atomic>
#include <poll.h>
#include <unistd.h>

using namespace nocturne;

// Global flag for signal handling
std::atomic<bool> g_running = true;

// Signal handler
void signalHandler(int) {
    g_running = false;
}

namespace {

// Prints status to the console, the way the phone shows it in its notification
class ConsoleNotificationSink : public engine::NotificationSink {
public:
    void onStatusText(const std::string& text) override {
        std::cout << "[status] " << text << std::endl;
    }

    void onStatusChanged(const session::ConnectionStatus& status) override {
        if (status.isDisconnected()) {
            std::cout << "[status] Session closed; type START to accept a new connection" << std::endl;
        }
    }
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <file>] [--start]\n"
              << "\n"
              << "Commands on stdin:\n"
              << "  START   open a session (waits for the head unit)\n"
              << "  STOP    close the session\n"
              << "  QUIT    stop and exit\n";
}

// Demo content for the in-process media source
std::vector<media::TrackMetadata> demoPlaylist() {
    return {
        {std::string("Boards of Canada"), std::string("Music Has the Right to Children"), std::string("Roygbiv"), 151000},
        {std::string("Aphex Twin"), std::string("Selected Ambient Works 85-92"), std::string("Xtal"), 294000},
        {std::string("Tycho"), std::string("Dive"), std::string("A Walk"), 318000},
    };
}

// Wait for a line on stdin, waking up regularly to check the running flag
bool readCommandLine(std::string& line) {
    while (g_running) {
        pollfd pfd{};
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, 200);
        if (ready > 0) {
            return static_cast<bool>(std::getline(std::cin, line));
        }
    }
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string config_path;
    bool start_now = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--start") {
            start_now = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    core::Config config;
    if (!config_path.empty()) {
        auto loaded = config.loadFromFile(config_path);
        if (!loaded) {
            std::cerr << "Failed to load config " << config_path << ": " << loaded.error().what() << std::endl;
            return 1;
        }
    }

    auto settings = engine::loadEngineSettings(config);
    if (!settings) {
        std::cerr << "Invalid configuration: " << settings.error().what() << std::endl;
        return 1;
    }

    core::Logger::setLevel(settings.value().log_level);
    core::Logger::info("Starting Nocturne companion");

    try {
        media::LocalMediaFacade facade;
        facade.setPlaylist(demoPlaylist());
        facade.bindController("local.player");

        engine::Engine engine(settings.value(), facade);
        engine.setNotificationSink(std::make_shared<ConsoleNotificationSink>());

        if (start_now) {
            engine.handle(engine::EngineCommand::Start);
        } else {
            std::cout << "Type START to wait for the head unit" << std::endl;
        }

        std::string line;
        while (g_running && readCommandLine(line)) {
            if (line.empty()) continue;

            if (line == "QUIT" || line == "quit" || line == "EXIT" || line == "exit") {
                break;
            }

            auto command = engine::parseEngineCommand(line);
            if (!command) {
                std::cerr << "Unknown command: " << line << " (expected START, STOP or QUIT)" << std::endl;
                continue;
            }
            engine.handle(*command);
        }

        core::Logger::info("Shutting down");
        engine.handle(engine::EngineCommand::Stop);
    }
    catch (const core::Error& e) {
        core::Logger::error("Fatal error: {}", e.what());
        return 1;
    }
    catch (const std::exception& e) {
        core::Logger::error("Unexpected error: {}", e.what());
        return 1;
    }

    core::Logger::info("Nocturne companion stopped");
    return 0;
}
