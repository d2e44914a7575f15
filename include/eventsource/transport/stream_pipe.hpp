#pragma once

#include "eventsource/stream/byte_source.hpp"
#include "eventsource/transport/http_client.hpp"
#include "eventsource/transport/http_types.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace eventsource {

// ─────────────────────────────────────────────────────────────────────────────
// Header block parsing
// ─────────────────────────────────────────────────────────────────────────────
// curl hands every header line to the header callback, including the status
// line and the blank line ending each block. Interim (1xx) responses and
// followed redirects produce extra blocks before the final one.

class HeaderBlockParser {
public:
    /// Returns true when `line` completes the final header block.
    bool feed(std::string_view line);

    [[nodiscard]] int status_code() const noexcept { return status_code_; }
    [[nodiscard]] HeaderMap take_headers() { return std::move(headers_); }

private:
    [[nodiscard]] bool is_final_block() const;

    int status_code_{0};
    HeaderMap headers_;
};

// ─────────────────────────────────────────────────────────────────────────────
// StreamPipe
// ─────────────────────────────────────────────────────────────────────────────
// Hand-off between the transfer thread (producer) and the reader of the
// response body (consumer). Every method may be called from either thread.
//
// The producer blocks in push_body() while more than `max_buffered` bytes are
// unread. Consumed bytes are dropped from the front of the buffer once they
// pass `compact_threshold`, so storage stays near
// `max_buffered + compact_threshold + one chunk` for the life of the stream.

struct ResponseHead {
    int status_code{0};
    HeaderMap headers;
};

class StreamPipe {
public:
    static constexpr std::size_t default_max_buffered = 1024 * 1024;
    static constexpr std::size_t compact_threshold = 64 * 1024;

    explicit StreamPipe(std::size_t max_buffered = default_max_buffered)
        : max_buffered_(max_buffered)
    {}

    StreamPipe(const StreamPipe&) = delete;
    StreamPipe& operator=(const StreamPipe&) = delete;

    // Producer side. Each returns false once the pipe is aborted, which tells
    // curl to stop the transfer.

    /// Feed one raw header line. Trailers after the final block are ignored.
    bool push_header_line(std::string_view line);

    /// Append body bytes, waiting for the consumer while the pipe is full.
    bool push_body(std::string_view data);

    /// The transfer returned. `error` is dropped if the pipe was aborted.
    void finish(std::optional<HttpClientError> error);

    [[nodiscard]] bool is_aborted() const;

    // Consumer side

    /// Wait for the final response head, the end of the transfer or an abort.
    [[nodiscard]] HttpClientResult<ResponseHead> wait_for_head();

    /// Copy buffered body bytes into `buffer`, waiting until some are
    /// available. Reports Cancelled after abort(), then the transfer error or
    /// EndOfStream once the buffer is drained.
    ReadResult read(std::span<char> buffer);

    /// Wake both sides and make every later call fail fast.
    void abort();

    [[nodiscard]] std::size_t unread_bytes() const;

    /// Bytes held in storage, consumed prefix included.
    [[nodiscard]] std::size_t stored_bytes() const;

private:
    [[nodiscard]] std::size_t unread() const noexcept { return data_.size() - read_offset_; }
    void maybe_compact();

    const std::size_t max_buffered_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    HeaderBlockParser header_parser_;
    bool headers_done_{false};
    ResponseHead head_;

    // Body bytes not yet consumed: data_[read_offset_, size)
    std::string data_;
    std::size_t read_offset_{0};

    bool finished_{false};
    bool aborted_{false};
    std::optional<HttpClientError> transfer_error_;
};

}  // namespace eventsource
