#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace eventsource {

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────
// HTTP header names are case-insensitive per RFC 7230.

using HeaderMap = std::unordered_map<std::string, std::string>;

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::ranges::equal(a, b, [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

/// headers.end() when absent.
[[nodiscard]] inline HeaderMap::const_iterator find_header(const HeaderMap& headers, std::string_view name) {
    return std::ranges::find_if(headers, [name](const auto& entry) { return iequals(entry.first, name); });
}

[[nodiscard]] inline bool has_header(const HeaderMap& headers, std::string_view name) {
    return find_header(headers, name) != headers.end();
}

[[nodiscard]] inline std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name) {
    const auto it = find_header(headers, name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

/// Set a header, replacing any entry whose name differs only in case.
inline void set_header(HeaderMap& headers, const std::string& name, const std::string& value) {
    std::erase_if(headers, [&name](const auto& pair) { return iequals(pair.first, name); });
    headers[name] = value;
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method Enum
// ─────────────────────────────────────────────────────────────────────────────
// Event streams are normally opened with GET; a caller-built prototype may
// use POST (with a body) when the server expects it.

enum class HttpMethod {
    Get,
    Post
};

[[nodiscard]] constexpr std::string_view to_string(HttpMethod method) noexcept {
    return (method == HttpMethod::Post) ? "POST" : "GET";
}

// ─────────────────────────────────────────────────────────────────────────────
// HttpRequest
// ─────────────────────────────────────────────────────────────────────────────
// Outgoing request. Plain value type: copying it is how a prototype is cloned
// for each connection attempt.

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;            // Absolute, e.g. "https://example.com/events"
    HeaderMap headers;
    std::optional<std::string> body;

    HttpRequest& with_header(const std::string& name, const std::string& value) {
        set_header(headers, name, value);
        return *this;
    }

    HttpRequest& with_body(const std::string& content) {
        body = content;
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Content-Type
// ─────────────────────────────────────────────────────────────────────────────

inline constexpr std::string_view event_stream_media_type = "text/event-stream";

/// Media type of a Content-Type value: the part before any ';' parameter,
/// with surrounding whitespace removed.
[[nodiscard]] std::string_view media_type(std::string_view content_type) noexcept;

/// True for "text/event-stream", ignoring case and parameters
/// ("text/event-stream; charset=utf-8").
[[nodiscard]] bool is_event_stream_content_type(std::string_view content_type) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Stream URL
// ─────────────────────────────────────────────────────────────────────────────

/// Validate and normalize an absolute http(s) URL with ada-url (WHATWG
/// parsing: IDN, percent-encoding, default ports dropped). Returns the
/// normalized href, or nullopt for an invalid URL, another scheme or an
/// empty host.
[[nodiscard]] std::optional<std::string> normalize_stream_url(std::string_view url);

}  // namespace eventsource
