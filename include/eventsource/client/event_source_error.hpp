#ifndef EVENTSOURCE_CLIENT_EVENT_SOURCE_ERROR_HPP
#define EVENTSOURCE_CLIENT_EVENT_SOURCE_ERROR_HPP

#include "eventsource/protocol/message.hpp"
#include "eventsource/protocol/message_assembler.hpp"
#include "eventsource/stream/byte_source.hpp"
#include "eventsource/transport/http_client.hpp"

#include <tl/expected.hpp>

#include <format>
#include <functional>
#include <optional>
#include <string>

namespace eventsource {

// ─────────────────────────────────────────────────────────────────────────────
// EventSourceError
// ─────────────────────────────────────────────────────────────────────────────
// Everything the consumer callback can be told about. Every code except
// Internal is followed by an automatic reconnect (or, for FieldTooLong, by
// the next message on the same connection).

struct EventSourceError {
    enum class Code {
        TransportFailed,     // Connect failed (not caused by cancellation)
        InvalidStatus,       // Response status was not 2xx
        InvalidContentType,  // Response was not text/event-stream
        FieldTooLong,        // A field exceeded its cap; message discarded
        ReadFailed,          // Body read failed mid-stream
        BufferFull,          // A line exceeded the line buffer cap
        NoProgress,          // Body kept returning empty reads
        Internal             // Contract violation; the worker stops
    };

    Code code;
    std::string message;
    std::optional<int> http_status;  // For InvalidStatus / InvalidContentType

    static EventSourceError transport_failed(const HttpClientError& err) {
        return {Code::TransportFailed, err.message, std::nullopt};
    }

    static EventSourceError invalid_status(int status) {
        return {Code::InvalidStatus, std::format("invalid HTTP status {}", status), status};
    }

    static EventSourceError invalid_content_type(int status, const std::string& content_type) {
        return {Code::InvalidContentType,
                std::format("invalid content type '{}'", content_type), status};
    }

    static EventSourceError field_too_long(const FieldTooLongError& err) {
        return {Code::FieldTooLong, err.message(), std::nullopt};
    }

    static EventSourceError from_stream_error(const StreamError& err) {
        switch (err.code) {
            case StreamError::Code::BufferFull:
                return {Code::BufferFull, err.message, std::nullopt};
            case StreamError::Code::NoProgress:
                return {Code::NoProgress, err.message, std::nullopt};
            default:
                return {Code::ReadFailed, err.message, std::nullopt};
        }
    }

    static EventSourceError internal(const std::string& msg) {
        return {Code::Internal, msg, std::nullopt};
    }

    /// Scoped to a single message; the connection stays up.
    [[nodiscard]] bool is_per_message() const noexcept {
        return code == Code::FieldTooLong;
    }
};

[[nodiscard]] constexpr std::string_view to_string(EventSourceError::Code code) noexcept {
    switch (code) {
        case EventSourceError::Code::TransportFailed:    return "TransportFailed";
        case EventSourceError::Code::InvalidStatus:      return "InvalidStatus";
        case EventSourceError::Code::InvalidContentType: return "InvalidContentType";
        case EventSourceError::Code::FieldTooLong:       return "FieldTooLong";
        case EventSourceError::Code::ReadFailed:         return "ReadFailed";
        case EventSourceError::Code::BufferFull:         return "BufferFull";
        case EventSourceError::Code::NoProgress:         return "NoProgress";
        case EventSourceError::Code::Internal:           return "Internal";
    }
    return "Unknown";
}

/// Exactly one of a message or an error. The message's views are only valid
/// for the duration of the callback.
using EventResult = tl::expected<Message, EventSourceError>;

/// Invoked on the worker thread. Must not block for long.
using EventCallback = std::function<void(const EventResult&)>;

}  // namespace eventsource

#endif  // EVENTSOURCE_CLIENT_EVENT_SOURCE_ERROR_HPP
