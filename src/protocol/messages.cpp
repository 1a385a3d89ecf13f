#include "nocturne/protocol/messages.hpp"

namespace nocturne::protocol {

using core::ErrorCode;
using core::Result;

namespace {

Result<std::optional<int64_t>> optionalInteger(const json& message, const char* field) {
    auto it = message.find(field);
    if (it == message.end() || it->is_null()) {
        return std::optional<int64_t>{};
    }
    if (!it->is_number_integer()) {
        return {ErrorCode::InvalidCommand, std::string("Field '") + field + "' must be an integer"};
    }
    return std::optional<int64_t>{it->get<int64_t>()};
}

void putOptionalString(json& j, const char* field, const std::optional<std::string>& value) {
    if (value) {
        j[field] = *value;
    } else {
        j[field] = nullptr;
    }
}

std::optional<std::string> getOptionalString(const json& j, const char* field) {
    const auto& value = j.at(field);
    if (value.is_null()) {
        return std::nullopt;
    }
    return value.get<std::string>();
}

} // namespace

const char* commandKindName(CommandKind kind) {
    switch (kind) {
        case CommandKind::Play:      return "play";
        case CommandKind::Pause:     return "pause";
        case CommandKind::Next:      return "next";
        case CommandKind::Previous:  return "previous";
        case CommandKind::SeekTo:    return "seek_to";
        case CommandKind::SetVolume: return "set_volume";
        case CommandKind::Unknown:   return "unknown";
    }
    return "unknown";
}

CommandKind parseCommandKind(std::string_view name) {
    if (name == "play") return CommandKind::Play;
    if (name == "pause") return CommandKind::Pause;
    if (name == "next") return CommandKind::Next;
    if (name == "previous") return CommandKind::Previous;
    if (name == "seek_to") return CommandKind::SeekTo;
    if (name == "set_volume") return CommandKind::SetVolume;
    return CommandKind::Unknown;
}

std::string Command::displayName() const {
    switch (kind) {
        case CommandKind::Play:     return "Play";
        case CommandKind::Pause:    return "Pause";
        case CommandKind::Next:     return "Next";
        case CommandKind::Previous: return "Previous";
        case CommandKind::SeekTo:
            return "Seek to " + (value_ms ? std::to_string(*value_ms) : std::string("?")) + "ms";
        case CommandKind::SetVolume:
            return "Set volume to " + (value_percent ? std::to_string(*value_percent) : std::string("?")) + "%";
        case CommandKind::Unknown:
            break;
    }
    return "Unknown: " + name;
}

Result<Command> parseCommand(const json& message) {
    if (!message.is_object()) {
        return {ErrorCode::InvalidCommand, "Command must be a JSON object"};
    }

    auto name = message.find("command");
    if (name == message.end()) {
        return {ErrorCode::InvalidCommand, "Missing 'command' field"};
    }
    if (!name->is_string()) {
        return {ErrorCode::InvalidCommand, "Field 'command' must be a string"};
    }

    Command command;
    command.name = name->get<std::string>();
    command.kind = parseCommandKind(command.name);

    auto value_ms = optionalInteger(message, "value_ms");
    if (!value_ms) {
        return value_ms.error();
    }
    command.value_ms = value_ms.value();

    auto value_percent = optionalInteger(message, "value_percent");
    if (!value_percent) {
        return value_percent.error();
    }
    command.value_percent = value_percent.value();

    auto payload = message.find("payload");
    if (payload != message.end() && !payload->is_null()) {
        if (!payload->is_object()) {
            return {ErrorCode::InvalidCommand, "Field 'payload' must be an object"};
        }
        command.payload = *payload;
    }

    return command;
}

Result<void> validateCommand(const Command& command) {
    switch (command.kind) {
        case CommandKind::SeekTo:
            if (!command.value_ms) {
                return {ErrorCode::MissingField, "seek_to requires 'value_ms'"};
            }
            if (*command.value_ms < 0) {
                return {ErrorCode::InvalidCommand, "seek_to 'value_ms' must not be negative"};
            }
            break;

        case CommandKind::SetVolume:
            if (!command.value_percent) {
                return {ErrorCode::MissingField, "set_volume requires 'value_percent'"};
            }
            if (*command.value_percent < 0 || *command.value_percent > 100) {
                return {ErrorCode::InvalidCommand,
                    "set_volume 'value_percent' out of range: " + std::to_string(*command.value_percent)};
            }
            break;

        case CommandKind::Unknown:
            return {ErrorCode::UnknownCommand, "Unknown command '" + command.name + "'"};

        default:
            break;
    }
    return {};
}

json toJson(const Command& command) {
    json j = {{"command", command.name}};
    if (command.value_ms) j["value_ms"] = *command.value_ms;
    if (command.value_percent) j["value_percent"] = *command.value_percent;
    if (command.payload) j["payload"] = *command.payload;
    return j;
}

void to_json(json& j, const StateUpdate& state) {
    j = json::object();
    j["type"] = StateUpdate::kType;
    putOptionalString(j, "artist", state.artist);
    putOptionalString(j, "album", state.album);
    putOptionalString(j, "track", state.track);
    j["duration_ms"] = state.duration_ms;
    j["position_ms"] = state.position_ms;
    j["is_playing"] = state.is_playing;
    j["volume_percent"] = state.volume_percent;
}

void from_json(const json& j, StateUpdate& state) {
    state.artist = getOptionalString(j, "artist");
    state.album = getOptionalString(j, "album");
    state.track = getOptionalString(j, "track");
    state.duration_ms = j.at("duration_ms").get<int64_t>();
    state.position_ms = j.at("position_ms").get<int64_t>();
    state.is_playing = j.at("is_playing").get<bool>();
    state.volume_percent = j.at("volume_percent").get<int>();
}

Result<StateUpdate> parseStateUpdate(const json& message) {
    if (!message.is_object()) {
        return {ErrorCode::InvalidData, "Not a stateUpdate message"};
    }
    auto type = message.find("type");
    if (type == message.end() || !type->is_string() || type->get<std::string>() != StateUpdate::kType) {
        return {ErrorCode::InvalidData, "Not a stateUpdate message"};
    }
    try {
        return message.get<StateUpdate>();
    }
    catch (const json::exception& e) {
        return {ErrorCode::InvalidData, std::string("Malformed stateUpdate: ") + e.what()};
    }
}

std::string serialize(const StateUpdate& state) {
    // Compact dump never emits a raw newline; invalid UTF-8 from the media
    // source is replaced instead of throwing
    return json(state).dump(-1, ' ', false, json::error_handler_t::replace);
}

void to_json(json& j, const TimeSync& sync) {
    j = json::object();
    j["type"] = TimeSync::kType;
    j["timestamp_ms"] = sync.timestamp_ms;
    j["timezone"] = sync.timezone;
}

void from_json(const json& j, TimeSync& sync) {
    sync.timestamp_ms = j.at("timestamp_ms").get<int64_t>();
    sync.timezone = j.at("timezone").get<std::string>();
}

Result<TimeSync> parseTimeSync(const json& message) {
    if (!message.is_object()) {
        return {ErrorCode::InvalidData, "Not a timeSync message"};
    }
    auto type = message.find("type");
    if (type == message.end() || !type->is_string() || type->get<std::string>() != TimeSync::kType) {
        return {ErrorCode::InvalidData, "Not a timeSync message"};
    }
    try {
        return message.get<TimeSync>();
    }
    catch (const json::exception& e) {
        return {ErrorCode::InvalidData, std::string("Malformed timeSync: ") + e.what()};
    }
}

std::string serialize(const TimeSync& sync) {
    return json(sync).dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace nocturne::protocol
