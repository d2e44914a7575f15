#pragma once

#include "eventsource/client/event_source_config.hpp"
#include "eventsource/client/event_source_error.hpp"
#include "eventsource/core/cancellation.hpp"
#include "eventsource/protocol/message_assembler.hpp"
#include "eventsource/transport/http_client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace eventsource {

// ─────────────────────────────────────────────────────────────────────────────
// Connection State
// ─────────────────────────────────────────────────────────────────────────────
///
///        ┌────────────┐  connected, 2xx, text/event-stream  ┌───────────┐
///   ┌───▶│ Connecting │────────────────────────────────────▶│ Streaming │
///   │    └─────┬──────┘                                     └─────┬─────┘
///   │          │ transport error / bad status / bad type          │ end of stream
///   │          ▼                                                  │ read error
///   │    ┌────────────┐◀────────────────────────────────────────────┘
///   └────│ BackingOff │
///        └────────────┘
///
///   Any state ──(cancellation)──▶ Stopped (terminal)
///
enum class ConnectionState {
    Connecting,   ///< Request in flight, waiting for response headers
    Streaming,    ///< Reading the response body
    BackingOff,   ///< Waiting out the reconnect delay
    Stopped       ///< Cancelled; the worker is done
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Connecting:  return "Connecting";
        case ConnectionState::Streaming:   return "Streaming";
        case ConnectionState::BackingOff:  return "BackingOff";
        case ConnectionState::Stopped:     return "Stopped";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// ReconnectController
// ─────────────────────────────────────────────────────────────────────────────
// Drives connect -> stream -> back off -> connect until cancelled. Runs on a
// single thread (EventSource's worker); the callback is invoked on it.
//
// Failures never end the loop: each one is reported through the callback
// (except a clean end of stream, which is expected) and followed by a
// reconnect after the current delay. Only cancellation stops it.
//
// Usage:
//   ReconnectController controller(config, *http_client, token);
//   controller.run();  // returns after token is cancelled

class ReconnectController {
public:
    enum class Outcome {
        Retry,  // Back off, then connect again
        Stop    // Cancelled
    };

    /// Throws std::invalid_argument on an invalid request target.
    ReconnectController(const EventSourceConfig& config,
                        IHttpClient& client,
                        CancellationToken token);

    ReconnectController(const ReconnectController&) = delete;
    ReconnectController& operator=(const ReconnectController&) = delete;

    /// Loop until cancelled. Exceptions (contract violations) are reported
    /// as an Internal error and end the loop.
    void run();

    /// One connection attempt, from request to the end of the body.
    [[nodiscard]] Outcome connect_and_stream();

    /// Wait out the reconnect delay. Returns Stop if cancelled meanwhile.
    [[nodiscard]] Outcome back_off();

    [[nodiscard]] ConnectionState state() const noexcept { return state_.load(); }
    [[nodiscard]] std::optional<std::string> last_event_id() const;
    [[nodiscard]] std::chrono::milliseconds reconnect_delay() const;
    [[nodiscard]] std::uint64_t attempts() const noexcept { return attempts_.load(); }

    /// Deliver a result to the callback unless cancellation was requested.
    /// Exceptions escaping the callback are logged and dropped.
    void dispatch(const EventResult& result);

private:
    Outcome stream(IByteSource& body);
    Outcome on_read_error(const StreamError& error);
    void on_message_boundary();
    void set_state(ConnectionState next);

    HttpRequest prototype_;
    IHttpClient& client_;
    CancellationToken token_;
    EventCallback callback_;
    MessageAssembler assembler_;

    std::atomic<ConnectionState> state_{ConnectionState::Connecting};
    std::atomic<std::uint64_t> attempts_{0};

    // Session state, persisted across reconnects
    mutable std::mutex session_mutex_;
    std::optional<std::string> last_event_id_;
    std::chrono::milliseconds reconnect_delay_;
};

}  // namespace eventsource
