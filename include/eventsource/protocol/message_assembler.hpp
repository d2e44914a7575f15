#pragma once

#include "eventsource/protocol/buffer_limits.hpp"
#include "eventsource/protocol/field_parser.hpp"
#include "eventsource/protocol/message.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace eventsource {

/// A field value did not fit in its buffer.
struct FieldTooLongError {
    FieldKind field;
    std::size_t limit;

    [[nodiscard]] std::string message() const;
};

using AssembledMessage = tl::expected<Message, FieldTooLongError>;

// ─────────────────────────────────────────────────────────────────────────────
// MessageAssembler
// ─────────────────────────────────────────────────────────────────────────────
// Per-message state machine fed one line at a time.
//
//   Collecting ──(field too long)──▶ Draining
//       │                               │
//       └──────(empty line)──────┬──────┘
//                                ▼
//                              Ready ──end_message()──▶ Collecting
//
// In Collecting, "id" and "event" replace their buffer, "data" appends with a
// '\n' separator, "retry" updates the reconnect hint. In Draining every line
// up to the boundary is skipped. At the boundary, message() yields either the
// assembled message or the error that sent us to Draining.
//
// Usage:
//   switch (assembler.feed(line)) {
//       case FeedResult::MessageReady:
//           deliver(assembler.message());
//           assembler.end_message();
//           break;
//       case FeedResult::RetryUpdated:
//           delay = *assembler.retry();
//           break;
//       case FeedResult::Continue:
//           break;
//   }

class MessageAssembler {
public:
    enum class FeedResult {
        Continue,      // Line absorbed (or skipped)
        MessageReady,  // Boundary reached; read message() then call end_message()
        RetryUpdated   // A valid "retry" field was seen; read retry()
    };

    /// Ceiling for server retry hints. Larger values are clamped, which also
    /// keeps the delay convertible to any clock's duration.
    static constexpr std::chrono::milliseconds max_retry_delay = std::chrono::hours{24};

    explicit MessageAssembler(const BufferLimits& limits);

    [[nodiscard]] FeedResult feed(std::string_view line);

    /// The message (or error) completed by the last boundary. Views stay
    /// valid until end_message() or reset().
    [[nodiscard]] AssembledMessage message() const;

    /// Truncate field buffers (keeping their allocation) and clear the
    /// per-message error.
    void end_message();

    /// Start over for a new connection: end_message() and release the
    /// field buffers' storage.
    void reset();

    /// Last valid retry hint seen, if any, clamped to max_retry_delay.
    [[nodiscard]] std::optional<std::chrono::milliseconds> retry() const noexcept { return retry_; }

    [[nodiscard]] bool is_draining() const noexcept { return error_.has_value(); }
    [[nodiscard]] const BufferLimits& limits() const noexcept { return limits_; }

private:
    void apply(const Field& field);

    BufferLimits limits_;

    std::string id_;
    std::string event_;
    std::string data_;
    bool has_id_{false};
    bool has_event_{false};
    bool has_data_{false};

    std::optional<FieldTooLongError> error_;
    std::optional<std::chrono::milliseconds> retry_;
};

}  // namespace eventsource
