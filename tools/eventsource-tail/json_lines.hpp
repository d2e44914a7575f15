#pragma once

// JSON Lines rendering for eventsource-tail --json

#include <nlohmann/json.hpp>

#include "eventsource/client/event_source_error.hpp"
#include "eventsource/protocol/message.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace eventsource::tail {

using Json = nlohmann::json;

inline Json optional_field(const std::optional<std::string_view>& field) {
    if (field.has_value() == false) {
        return nullptr;
    }
    return std::string(*field);
}

/// Field values are server bytes; invalid UTF-8 is written as U+FFFD.
inline std::string dump_line(const Json& line) {
    return line.dump(-1, ' ', false, Json::error_handler_t::replace);
}

inline std::string message_line(const Message& message) {
    const Json line = {
        {"id", optional_field(message.id)},
        {"event", optional_field(message.event)},
        {"data", optional_field(message.data)}
    };
    return dump_line(line);
}

inline std::string error_line(const EventSourceError& error) {
    Json line = {
        {"error", std::string(to_string(error.code))},
        {"message", error.message}
    };
    if (error.http_status.has_value()) {
        line["status"] = *error.http_status;
    }
    return dump_line(line);
}

}  // namespace eventsource::tail
