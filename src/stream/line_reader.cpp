#include "eventsource/stream/line_reader.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace eventsource {

namespace {

constexpr bool is_line_terminator(char c) noexcept {
    return (c == '\r') || (c == '\n');
}

}  // namespace

LineReader::LineReader(IByteSource& source, std::size_t max_size)
    : source_(source)
    , max_size_(max_size)
{
    if (max_size == 0) {
        throw std::invalid_argument("LineReader: max_size must be greater than zero");
    }
    buffer_.resize(std::min(max_size, default_buffer_size));
}

LineResult LineReader::read_line() {
    // Bytes already searched for a terminator; not rescanned after a fill
    std::size_t scanned = 0;

    for (;;) {
        // The previous line ended with a bare CR. If the next byte is the LF
        // of a CRLF pair, it belongs to that terminator. `scanned` is always
        // zero here: either we entered with data buffered, or the fill below
        // just produced the first bytes after an empty buffer.
        const bool has_unread = (write_pos_ > read_pos_);
        if (last_line_ended_with_cr_ && has_unread) {
            last_line_ended_with_cr_ = false;
            if (buffer_[read_pos_] == '\n') {
                ++read_pos_;
            }
        }

        const char* const start = buffer_.data() + read_pos_;
        const char* const end = buffer_.data() + write_pos_;
        const char* const found = std::find_if(start + scanned, end, is_line_terminator);
        if (found != end) {
            const auto length = static_cast<std::size_t>(found - start);
            last_line_ended_with_cr_ = (*found == '\r');
            read_pos_ += length + 1;
            return LineResult{std::string_view(start, length), std::nullopt};
        }

        if (pending_error_.has_value()) {
            const std::string_view rest(start, write_pos_ - read_pos_);
            read_pos_ = write_pos_;
            return LineResult{rest, take_error()};
        }

        scanned = write_pos_ - read_pos_;
        fill();
    }
}

bool LineReader::grow() {
    if (buffer_.size() >= max_size_) {
        return false;
    }
    buffer_.resize(std::min(max_size_, buffer_.size() * 2));
    return true;
}

void LineReader::fill() {
    // Compact: move unread bytes to the front
    if (read_pos_ > 0) {
        std::copy(buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_),
                  buffer_.begin() + static_cast<std::ptrdiff_t>(write_pos_),
                  buffer_.begin());
        write_pos_ -= read_pos_;
        read_pos_ = 0;
    }

    if (write_pos_ >= buffer_.size()) {
        if (grow() == false) {
            pending_error_ = StreamError::buffer_full();
            return;
        }
    }

    for (int attempts = max_consecutive_empty_reads; attempts > 0; --attempts) {
        const std::size_t available = buffer_.size() - write_pos_;
        auto result = source_.read(std::span<char>(buffer_.data() + write_pos_, available));

        const bool count_invalid =
            (result.bytes < 0) || (static_cast<std::size_t>(result.bytes) > available);
        if (count_invalid) {
            throw std::logic_error("eventsource: byte source returned an invalid count from read");
        }

        write_pos_ += static_cast<std::size_t>(result.bytes);
        if (result.error.has_value()) {
            pending_error_ = std::move(result.error);
            return;
        }
        if (result.bytes > 0) {
            return;
        }
    }

    pending_error_ = StreamError::no_progress();
}

std::optional<StreamError> LineReader::take_error() {
    return std::exchange(pending_error_, std::nullopt);
}

}  // namespace eventsource
