#include "eventsource/protocol/field_parser.hpp"

#include <charconv>

namespace eventsource {

Field parse_field(std::string_view line) noexcept {
    Field field;

    const std::size_t colon_pos = line.find(':');
    const bool has_colon = (colon_pos != std::string_view::npos);

    if (has_colon == false) {
        field.name = line;
        field.kind = classify_field(field.name);
        return field;
    }

    field.name = line.substr(0, colon_pos);

    std::size_t value_start = colon_pos + 1;
    const bool has_space_after_colon =
        (value_start < line.size()) && (line[value_start] == ' ');
    if (has_space_after_colon) {
        value_start += 1;
    }
    field.value = line.substr(value_start);

    if (field.name.empty()) {
        field.kind = FieldKind::Comment;
    } else {
        field.kind = classify_field(field.name);
    }
    return field;
}

FieldKind classify_field(std::string_view name) noexcept {
    if (name == "id") {
        return FieldKind::Id;
    }
    if (name == "event") {
        return FieldKind::Event;
    }
    if (name == "data") {
        return FieldKind::Data;
    }
    if (name == "retry") {
        return FieldKind::Retry;
    }
    return FieldKind::Unknown;
}

std::optional<std::uint64_t> parse_retry_millis(std::string_view value) noexcept {
    // Unsigned from_chars rejects signs, whitespace and empty input
    std::uint64_t millis = 0;
    const char* const end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), end, millis);
    const bool parsed_everything = (ec == std::errc{}) && (ptr == end);
    if (parsed_everything == false) {
        return std::nullopt;
    }
    return millis;
}

}  // namespace eventsource
