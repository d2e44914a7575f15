#include "eventsource/client/event_source_config.hpp"

#include <stdexcept>

namespace eventsource {

EventSourceConfig& EventSourceConfig::with_url(const std::string& target) {
    url = target;
    return *this;
}

EventSourceConfig& EventSourceConfig::with_request(HttpRequest prototype) {
    request = std::move(prototype);
    return *this;
}

EventSourceConfig& EventSourceConfig::with_header(const std::string& name, const std::string& value) {
    set_header(default_headers, name, value);
    return *this;
}

EventSourceConfig& EventSourceConfig::with_bearer_token(const std::string& token) {
    // Format: "Bearer <token>"
    set_header(default_headers, "Authorization", "Bearer " + token);
    return *this;
}

EventSourceConfig& EventSourceConfig::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

EventSourceConfig& EventSourceConfig::with_verify_ssl(bool verify) {
    verify_ssl = verify;
    return *this;
}

EventSourceConfig& EventSourceConfig::with_retry_delay(std::chrono::milliseconds delay) {
    initial_retry_delay = delay;
    return *this;
}

EventSourceConfig& EventSourceConfig::with_buffer_limits(const BufferLimits& limits) {
    buffer_limits = limits;
    return *this;
}

EventSourceConfig& EventSourceConfig::with_cancellation(CancellationToken token) {
    cancellation = std::move(token);
    return *this;
}

EventSourceConfig& EventSourceConfig::with_callback(EventCallback cb) {
    callback = std::move(cb);
    return *this;
}

HttpRequest EventSourceConfig::build_request() const {
    HttpRequest prototype;
    if (request.has_value()) {
        prototype = *request;
    } else {
        prototype.method = HttpMethod::Get;
        prototype.url = url;
    }

    if (prototype.url.empty()) {
        throw std::invalid_argument("EventSourceConfig: no URL or request set");
    }
    auto normalized = normalize_stream_url(prototype.url);
    if (normalized.has_value() == false) {
        throw std::invalid_argument("EventSourceConfig: invalid http(s) URL: " + prototype.url);
    }
    prototype.url = std::move(*normalized);

    // Prototype headers win over defaults
    for (const auto& [name, value] : default_headers) {
        if (has_header(prototype.headers, name) == false) {
            prototype.headers[name] = value;
        }
    }

    if (has_header(prototype.headers, "Accept") == false) {
        prototype.headers["Accept"] = std::string(event_stream_media_type);
    }
    if (has_header(prototype.headers, "Cache-Control") == false) {
        prototype.headers["Cache-Control"] = "no-cache";
    }

    return prototype;
}

}  // namespace eventsource
