// Emulates the head unit: connects to the companion, sends commands typed on
// stdin and prints every state update it receives.
#include <nocturne/core/logger.hpp>
#include <nocturne/protocol/frame_codec.hpp>
#include <nocturne/protocol/messages.hpp>
#include <nocturne/transport/tcp_stream_transport.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <atomic>
#include <csignal>

using namespace nocturne;

std::atomic<bool> g_running = true;

void signalHandler(int signal) {
    core::Logger::info("Received signal {}, terminating...", signal);
    g_running = false;
}

namespace {

void printHelp() {
    std::cout << "Commands:\n"
              << "  play | pause | next | previous\n"
              << "  seek <ms>\n"
              << "  volume <percent>\n"
              << "  raw <json>       send a line as-is\n"
              << "  quit\n";
}

// Turns "seek 30000" into the wire command; raw lines pass through unchanged
core::Result<std::string> buildCommand(const std::string& input) {
    std::istringstream in(input);
    std::string word;
    in >> word;

    if (word == "raw") {
        std::string rest;
        std::getline(in, rest);
        return rest;
    }

    protocol::json command;
    if (word == "play" || word == "pause" || word == "next" || word == "previous") {
        command["command"] = word;
    } else if (word == "seek") {
        int64_t ms = 0;
        if (!(in >> ms)) {
            return {core::ErrorCode::InvalidArgument, "usage: seek <ms>"};
        }
        command = {{"command", "seek_to"}, {"value_ms", ms}};
    } else if (word == "volume" || word == "vol") {
        int percent = 0;
        if (!(in >> percent)) {
            return {core::ErrorCode::InvalidArgument, "usage: volume <percent>"};
        }
        command = {{"command", "set_volume"}, {"value_percent", percent}};
    } else {
        return {core::ErrorCode::UnknownCommand, "unknown command '" + word + "'"};
    }
    return command.dump();
}

void printState(const std::string& frame) {
    auto parsed = protocol::decodeJson(frame);
    if (!parsed) {
        std::cout << "<< (malformed) " << frame << std::endl;
        return;
    }

    if (auto sync = protocol::parseTimeSync(parsed.value())) {
        std::cout << "<< clock " << sync.value().timestamp_ms << " (" << sync.value().timezone << ")" << std::endl;
        return;
    }

    auto state = protocol::parseStateUpdate(parsed.value());
    if (!state) {
        std::cout << "<< " << frame << std::endl;
        return;
    }

    const auto& s = state.value();
    std::cout << "<< " << (s.is_playing ? "playing " : "paused  ")
              << s.artist.value_or("?") << " - " << s.track.value_or("?")
              << " [" << s.position_ms / 1000 << "s/" << s.duration_ms / 1000 << "s]"
              << " vol " << s.volume_percent << "%" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string host = argc > 1 ? argv[1] : "127.0.0.1";
    uint16_t port = static_cast<uint16_t>(argc > 2 ? std::stoi(argv[2]) : 5757);

    transport::TcpStreamTransport link;
    transport::TransportTarget target;
    target.mode = transport::TransportTarget::Mode::Connect;
    target.remote = transport::SocketAddress(host, port);

    auto peer = link.open(target);
    if (!peer) {
        core::Logger::error("Cannot reach companion at {}: {}", target.remote.toString(), peer.error().what());
        return 1;
    }
    core::Logger::info("Connected to companion at {}", peer.value());
    printHelp();

    std::thread reader([&link]() {
        protocol::LineFrameDecoder decoder;
        while (g_running) {
            auto data = link.receive();
            if (!data) {
                core::Logger::info("Link closed: {}", data.error().what());
                g_running = false;
                return;
            }
            auto decoded = decoder.feed(data.value());
            for (const auto& frame : decoded.frames) {
                printState(frame);
            }
            for (const auto& issue : decoded.issues) {
                core::Logger::warn("Decode error: {}", issue.message);
            }
        }
    });

    protocol::LineFrameEncoder encoder;
    std::string input;
    while (g_running && std::getline(std::cin, input)) {
        if (input.empty()) continue;
        if (input == "quit") break;

        auto command = buildCommand(input);
        if (!command) {
            std::cout << "!! " << command.error().what() << std::endl;
            continue;
        }

        auto lines = encoder.encode(command.value());
        if (!lines) {
            std::cout << "!! " << lines.error().what() << std::endl;
            continue;
        }
        for (const auto& line : lines.value()) {
            if (auto sent = link.send(line); !sent) {
                core::Logger::error("Send failed: {}", sent.error().what());
                g_running = false;
                break;
            }
        }
        std::cout << ">> " << command.value() << std::endl;
    }

    g_running = false;
    link.close();
    reader.join();
    return 0;
}
