#ifndef EVENTSOURCE_CLIENT_EVENT_SOURCE_CONFIG_HPP
#define EVENTSOURCE_CLIENT_EVENT_SOURCE_CONFIG_HPP

#include "eventsource/client/event_source_error.hpp"
#include "eventsource/core/cancellation.hpp"
#include "eventsource/protocol/buffer_limits.hpp"
#include "eventsource/transport/http_types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace eventsource {

// ─────────────────────────────────────────────────────────────────────────────
// EventSource Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Everything needed to subscribe to one event stream.

struct EventSourceConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Request Target
    // ─────────────────────────────────────────────────────────────────────────
    // Either `url` (a GET is built from it) or a caller-built `request`
    // prototype. The prototype wins when both are set.

    // Example: "https://example.com/events"
    std::string url;

    // Cloned for every connection attempt. Must carry an absolute URL.
    std::optional<HttpRequest> request;

    // Merged into every request; headers already on the prototype win.
    HeaderMap default_headers;

    // ─────────────────────────────────────────────────────────────────────────
    // Transport
    // ─────────────────────────────────────────────────────────────────────────

    std::chrono::milliseconds connect_timeout{10'000};  // 10 seconds

    // WARNING: Setting to false is a security risk!
    bool verify_ssl{true};

    // ─────────────────────────────────────────────────────────────────────────
    // Stream Behaviour
    // ─────────────────────────────────────────────────────────────────────────

    // Delay before each reconnect until the server sends a "retry" field.
    std::chrono::milliseconds initial_retry_delay{1'000};

    // Zero fields take their defaults.
    BufferLimits buffer_limits;

    // Parent cancellation. Cancelling it stops the stream like close().
    CancellationToken cancellation;

    // Receives every message and error. May be empty.
    EventCallback callback;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────
    //   EventSourceConfig{}.with_url("https://host/events").with_callback(cb)

    EventSourceConfig& with_url(const std::string& target);
    EventSourceConfig& with_request(HttpRequest prototype);
    EventSourceConfig& with_header(const std::string& name, const std::string& value);
    EventSourceConfig& with_bearer_token(const std::string& token);
    EventSourceConfig& with_connect_timeout(std::chrono::milliseconds timeout);
    EventSourceConfig& with_verify_ssl(bool verify);
    EventSourceConfig& with_retry_delay(std::chrono::milliseconds delay);
    EventSourceConfig& with_buffer_limits(const BufferLimits& limits);
    EventSourceConfig& with_cancellation(CancellationToken token);
    EventSourceConfig& with_callback(EventCallback cb);

    /// The request prototype every attempt is cloned from.
    /// Throws std::invalid_argument if no target is set or the URL is not a
    /// valid http(s) URL.
    [[nodiscard]] HttpRequest build_request() const;
};

}  // namespace eventsource

#endif  // EVENTSOURCE_CLIENT_EVENT_SOURCE_CONFIG_HPP
