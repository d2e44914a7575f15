#pragma once

#include "eventsource/stream/byte_source.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace eventsource {

/// A line as returned by LineReader::read_line().
///
/// `line` points into the reader's buffer and is valid only until the next
/// call on the reader. When `error` is set, `line` holds whatever was left
/// before the condition (possibly empty); for BufferFull it is the full
/// buffer contents.
struct LineResult {
    std::string_view line;
    std::optional<StreamError> error;
};

// ─────────────────────────────────────────────────────────────────────────────
// LineReader
// ─────────────────────────────────────────────────────────────────────────────
// Buffered line reader with event-stream line semantics: a line ends with
// LF, CR, or CRLF (one terminator, even when the CR and LF arrive in
// different reads).
//
// The backing buffer starts at min(max_size, 4096) bytes and doubles on
// demand, but never beyond max_size. A line that does not fit is returned
// in max_size pieces, each tagged with StreamError::BufferFull.
//
// Usage:
//   LineReader reader(body, limits.max_line);
//   for (;;) {
//       auto [line, error] = reader.read_line();
//       if (error) break;
//       handle(line);
//   }

class LineReader {
public:
    static constexpr std::size_t default_buffer_size = 4096;
    static constexpr int max_consecutive_empty_reads = 100;

    /// Throws std::invalid_argument if max_size is zero.
    LineReader(IByteSource& source, std::size_t max_size);

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    /// Return the next line without its terminator.
    /// Throws std::logic_error if the source reports a negative byte count.
    [[nodiscard]] LineResult read_line();

    [[nodiscard]] std::size_t capacity() const noexcept { return buffer_.size(); }
    [[nodiscard]] std::size_t max_size() const noexcept { return max_size_; }
    [[nodiscard]] std::size_t buffered() const noexcept { return write_pos_ - read_pos_; }

private:
    bool grow();
    void fill();
    std::optional<StreamError> take_error();

    IByteSource& source_;
    std::vector<char> buffer_;
    std::size_t read_pos_{0};
    std::size_t write_pos_{0};
    std::size_t max_size_;
    std::optional<StreamError> pending_error_;
    bool last_line_ended_with_cr_{false};
};

}  // namespace eventsource
