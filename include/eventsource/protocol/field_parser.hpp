#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace eventsource {

/// Field names understood by the event-stream protocol.
enum class FieldKind : std::uint8_t {
    Id,       // "id"    - resumption identifier
    Event,    // "event" - message type
    Data,     // "data"  - payload line
    Retry,    // "retry" - reconnect delay in milliseconds
    Comment,  // line starting with ':'
    Unknown   // anything else, ignored
};

[[nodiscard]] constexpr std::string_view to_string(FieldKind kind) noexcept {
    switch (kind) {
        case FieldKind::Id:      return "id";
        case FieldKind::Event:   return "event";
        case FieldKind::Data:    return "data";
        case FieldKind::Retry:   return "retry";
        case FieldKind::Comment: return "comment";
        case FieldKind::Unknown: return "unknown";
    }
    return "unknown";
}

/// One non-empty line split into name and value. Views into the line.
struct Field {
    FieldKind kind{FieldKind::Unknown};
    std::string_view name;
    std::optional<std::string_view> value;  // nullopt when the line has no ':'

    [[nodiscard]] std::string_view value_or_empty() const noexcept {
        return value.value_or(std::string_view{});
    }
};

/// Split at the first ':'. One leading space of the value is dropped:
///   "data: x"  -> {Data, "data", "x"}
///   "data:x"   -> {Data, "data", "x"}
///   "data:  x" -> {Data, "data", " x"}
///   "data"     -> {Data, "data", nullopt}
///   ": ping"   -> {Comment, "", "ping"}
[[nodiscard]] Field parse_field(std::string_view line) noexcept;

/// Map a field name to its kind (exact, case-sensitive match).
[[nodiscard]] FieldKind classify_field(std::string_view name) noexcept;

/// Parse a retry value: ASCII digits only, no sign, no whitespace.
[[nodiscard]] std::optional<std::uint64_t> parse_retry_millis(std::string_view value) noexcept;

}  // namespace eventsource
