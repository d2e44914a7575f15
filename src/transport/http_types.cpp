#include "eventsource/transport/http_types.hpp"

#include <ada.h>

namespace eventsource {

namespace {

std::string_view trim(std::string_view value) noexcept {
    constexpr std::string_view whitespace = " \t";
    const auto first = value.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

}  // namespace

std::string_view media_type(std::string_view content_type) noexcept {
    const auto semicolon = content_type.find(';');
    return trim(content_type.substr(0, semicolon));
}

bool is_event_stream_content_type(std::string_view content_type) noexcept {
    return iequals(media_type(content_type), event_stream_media_type);
}

std::optional<std::string> normalize_stream_url(std::string_view url) {
    const auto parsed = ada::parse<ada::url_aggregator>(url);
    if (parsed.has_value() == false) {
        return std::nullopt;
    }

    // ada keeps the trailing colon: "https:"
    const std::string_view protocol = parsed->get_protocol();
    const bool http_family = (protocol == "http:") || (protocol == "https:");
    if (http_family == false) {
        return std::nullopt;
    }
    if (parsed->get_hostname().empty()) {
        return std::nullopt;
    }
    return std::string(parsed->get_href());
}

}  // namespace eventsource
