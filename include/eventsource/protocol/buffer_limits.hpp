#ifndef EVENTSOURCE_PROTOCOL_BUFFER_LIMITS_HPP
#define EVENTSOURCE_PROTOCOL_BUFFER_LIMITS_HPP

#include <cstddef>
#include <string_view>

namespace eventsource {

// ─────────────────────────────────────────────────────────────────────────────
// Buffer Limits
// ─────────────────────────────────────────────────────────────────────────────
// Every message is assembled in three field buffers (id, event, data) fed
// from one raw line buffer. Each buffer grows as needed but never past its
// limit, so memory stays bounded however hostile the stream is.
//
// A zero field means "use the default". Fixed for the life of a session.

struct BufferLimits {
    static constexpr std::size_t default_max_id = 256;
    static constexpr std::size_t default_max_event = 256;
    static constexpr std::size_t default_max_data = 4 * 1024 * 1024;

    // Longest field prefix plus a CRLF terminator: "event: \r\n"
    static constexpr std::size_t line_framing_overhead = std::string_view("event: \r\n").size() + 1;

    std::size_t max_id{0};
    std::size_t max_event{0};
    std::size_t max_data{0};

    // Raw line buffer. Defaults to the largest field limit plus framing.
    std::size_t max_line{0};

    /// Copy with every zero field replaced by its default.
    [[nodiscard]] BufferLimits resolved() const noexcept;
};

}  // namespace eventsource

#endif  // EVENTSOURCE_PROTOCOL_BUFFER_LIMITS_HPP
