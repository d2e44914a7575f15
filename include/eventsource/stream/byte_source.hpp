#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>

namespace eventsource {

// ─────────────────────────────────────────────────────────────────────────────
// Stream Error
// ─────────────────────────────────────────────────────────────────────────────
// Conditions reported by a byte source or by the LineReader on top of it.

struct StreamError {
    enum class Code {
        EndOfStream,   // Source closed cleanly
        BufferFull,    // Line longer than the reader's maximum capacity
        NoProgress,    // Too many consecutive empty reads
        Cancelled,     // Cancellation requested while reading
        ReadFailed     // Any other I/O failure
    };

    Code code;
    std::string message;

    static StreamError end_of_stream() {
        return {Code::EndOfStream, "end of stream"};
    }
    static StreamError buffer_full() {
        return {Code::BufferFull, "line buffer full"};
    }
    static StreamError no_progress() {
        return {Code::NoProgress, "multiple reads returned no data and no error"};
    }
    static StreamError cancelled() {
        return {Code::Cancelled, "read cancelled"};
    }
    static StreamError read_failed(const std::string& msg) {
        return {Code::ReadFailed, msg};
    }

    [[nodiscard]] bool is(Code c) const noexcept { return code == c; }
};

// ─────────────────────────────────────────────────────────────────────────────
// ReadResult
// ─────────────────────────────────────────────────────────────────────────────
// `bytes` were written to the front of the caller's buffer. They are valid
// even when `error` is set (a final chunk may arrive together with the end of
// stream). A result with zero bytes and no error is legal but must not repeat
// forever.

struct ReadResult {
    std::ptrdiff_t bytes{0};
    std::optional<StreamError> error;
};

// ─────────────────────────────────────────────────────────────────────────────
// IByteSource
// ─────────────────────────────────────────────────────────────────────────────
// Sequential byte source, e.g. an HTTP response body. Owned by a single
// connection attempt.

class IByteSource {
public:
    virtual ~IByteSource() = default;

    /// Read up to buffer.size() bytes. Blocks until at least one byte, an
    /// error, or (for misbehaving sources) an empty result is available.
    /// Must never report a negative count.
    [[nodiscard]] virtual ReadResult read(std::span<char> buffer) = 0;
};

}  // namespace eventsource
