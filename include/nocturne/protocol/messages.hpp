#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <nocturne/core/error.hpp>

namespace nocturne::protocol {

using json = nlohmann::json;

enum class CommandKind {
    Play,
    Pause,
    Next,
    Previous,
    SeekTo,
    SetVolume,
    Unknown
};

const char* commandKindName(CommandKind kind);
CommandKind parseCommandKind(std::string_view name);

// Inbound message from the head unit
struct Command {
    CommandKind kind = CommandKind::Unknown;
    std::string name;                       // as received, also for unknown kinds
    std::optional<int64_t> value_ms;        // seek_to
    std::optional<int64_t> value_percent;   // set_volume, 0..100
    std::optional<json> payload;            // extension slot, always an object

    // "Play", "Seek to", ... for status notifications
    std::string displayName() const;
};

// Shape check only: the object must carry a string "command", and the optional
// fields must have the right JSON types. Kind-specific requirements are left
// to validateCommand() so a dispatcher can report them separately.
core::Result<Command> parseCommand(const json& message);

// Kind-specific field check
core::Result<void> validateCommand(const Command& command);

json toJson(const Command& command);

// Outbound snapshot of the playback state
struct StateUpdate {
    static constexpr const char* kType = "stateUpdate";

    std::optional<std::string> artist;
    std::optional<std::string> album;
    std::optional<std::string> track;
    int64_t duration_ms = 0;
    int64_t position_ms = 0;
    bool is_playing = false;
    int volume_percent = 0;

    bool operator==(const StateUpdate& other) const = default;
};

void to_json(json& j, const StateUpdate& state);

// Throws nlohmann::json::exception on a malformed object
void from_json(const json& j, StateUpdate& state);

core::Result<StateUpdate> parseStateUpdate(const json& message);

// Compact single-line encoding
std::string serialize(const StateUpdate& state);

// Wall clock for the head unit, which has no clock source of its own
struct TimeSync {
    static constexpr const char* kType = "timeSync";

    int64_t timestamp_ms = 0;   // Unix epoch
    std::string timezone;       // IANA zone id, e.g. "Europe/Berlin"

    bool operator==(const TimeSync& other) const = default;
};

void to_json(json& j, const TimeSync& sync);
void from_json(const json& j, TimeSync& sync);

core::Result<TimeSync> parseTimeSync(const json& message);

std::string serialize(const TimeSync& sync);

} // namespace nocturne::protocol
