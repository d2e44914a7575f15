#include "eventsource/transport/stream_pipe.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>

namespace eventsource {

namespace {

int parse_status(std::string_view status_line) {
    // "HTTP/1.1 200 OK", "HTTP/2 200"
    const auto space = status_line.find(' ');
    if (space == std::string_view::npos) {
        return 0;
    }
    const std::string_view rest = status_line.substr(space + 1);
    int code = 0;
    std::from_chars(rest.data(), rest.data() + rest.size(), code);
    return code;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// HeaderBlockParser
// ─────────────────────────────────────────────────────────────────────────────

bool HeaderBlockParser::feed(std::string_view line) {
    while ((line.empty() == false) && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }

    if (line.empty()) {
        return is_final_block();
    }

    if (line.starts_with("HTTP/")) {
        status_code_ = parse_status(line);
        headers_.clear();
        return false;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return false;
    }
    std::string_view value = line.substr(colon + 1);
    while ((value.empty() == false) && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    set_header(headers_, std::string(line.substr(0, colon)), std::string(value));
    return false;
}

bool HeaderBlockParser::is_final_block() const {
    const bool is_interim = (status_code_ >= 100) && (status_code_ < 200);
    const bool is_followed_redirect = (status_code_ >= 300) && (status_code_ < 400) &&
                                      (find_header(headers_, "Location") != headers_.end());
    return (status_code_ != 0) && (is_interim == false) && (is_followed_redirect == false);
}

// ─────────────────────────────────────────────────────────────────────────────
// StreamPipe - producer side
// ─────────────────────────────────────────────────────────────────────────────

bool StreamPipe::push_header_line(std::string_view line) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (aborted_) {
        return false;
    }
    if (headers_done_) {
        return true;  // Trailers
    }
    if (header_parser_.feed(line)) {
        head_.status_code = header_parser_.status_code();
        head_.headers = header_parser_.take_headers();
        headers_done_ = true;
        lock.unlock();
        cv_.notify_all();
    }
    return true;
}

bool StreamPipe::push_body(std::string_view data) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return aborted_ || (unread() <= max_buffered_); });
    if (aborted_) {
        return false;
    }
    maybe_compact();
    data_.append(data);
    lock.unlock();
    cv_.notify_all();
    return true;
}

void StreamPipe::finish(std::optional<HttpClientError> error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
        if (error.has_value() && (aborted_ == false)) {
            transfer_error_ = std::move(error);
        }
    }
    cv_.notify_all();
}

bool StreamPipe::is_aborted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aborted_;
}

void StreamPipe::maybe_compact() {
    if (read_offset_ == data_.size()) {
        data_.clear();
        read_offset_ = 0;
    } else if (read_offset_ > compact_threshold) {
        data_.erase(0, read_offset_);
        read_offset_ = 0;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// StreamPipe - consumer side
// ─────────────────────────────────────────────────────────────────────────────

HttpClientResult<ResponseHead> StreamPipe::wait_for_head() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return headers_done_ || finished_ || aborted_; });

    if (aborted_) {
        return tl::unexpected(HttpClientError::cancelled());
    }
    if (headers_done_ == false) {
        if (transfer_error_.has_value()) {
            return tl::unexpected(*transfer_error_);
        }
        return tl::unexpected(HttpClientError::unknown("Transfer ended without a response"));
    }
    return head_;
}

ReadResult StreamPipe::read(std::span<char> buffer) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return aborted_ || finished_ || (unread() > 0); });

    if (aborted_) {
        return ReadResult{0, StreamError::cancelled()};
    }

    const std::size_t count = std::min(buffer.size(), unread());
    if (count > 0) {
        std::memcpy(buffer.data(), data_.data() + read_offset_, count);
        read_offset_ += count;
        lock.unlock();
        cv_.notify_all();
        return ReadResult{static_cast<std::ptrdiff_t>(count), std::nullopt};
    }

    if (transfer_error_.has_value()) {
        return ReadResult{0, StreamError::read_failed(transfer_error_->message)};
    }
    return ReadResult{0, StreamError::end_of_stream()};
}

void StreamPipe::abort() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted_ = true;
    }
    cv_.notify_all();
}

std::size_t StreamPipe::unread_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unread();
}

std::size_t StreamPipe::stored_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

}  // namespace eventsource
