#include <catch2/catch_test_macros.hpp>

#include "eventsource/transport/stream_pipe.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace eventsource;
using namespace std::chrono_literals;

namespace {

// Feeds a header block line by line, the way curl delivers it
bool feed_block(HeaderBlockParser& parser, const std::vector<std::string>& lines) {
    bool final_block = false;
    for (const auto& line : lines) {
        final_block = parser.feed(line);
    }
    return final_block;
}

std::string read_string(StreamPipe& pipe, std::size_t max) {
    std::string out(max, '\0');
    const ReadResult result = pipe.read(std::span<char>(out.data(), out.size()));
    REQUIRE(result.error.has_value() == false);
    out.resize(static_cast<std::size_t>(result.bytes));
    return out;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// HeaderBlockParser
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("HeaderBlockParser completes a plain response head", "[pipe][headers]") {
    HeaderBlockParser parser;

    REQUIRE(parser.feed("HTTP/1.1 200 OK\r\n") == false);
    REQUIRE(parser.feed("Content-Type:  text/event-stream\r\n") == false);
    REQUIRE(parser.feed("X-Empty:\r\n") == false);
    REQUIRE(parser.feed("\r\n"));

    REQUIRE(parser.status_code() == 200);
    const HeaderMap headers = parser.take_headers();
    REQUIRE(get_header(headers, "content-type") == "text/event-stream");
    REQUIRE(get_header(headers, "X-Empty") == "");
}

TEST_CASE("HeaderBlockParser skips interim and redirect blocks", "[pipe][headers]") {
    HeaderBlockParser parser;

    SECTION("100 Continue precedes the final block") {
        REQUIRE(feed_block(parser, {"HTTP/1.1 100 Continue\r\n", "\r\n"}) == false);
        REQUIRE(feed_block(parser, {"HTTP/1.1 200 OK\r\n", "A: 1\r\n", "\r\n"}));
        REQUIRE(parser.status_code() == 200);
    }

    SECTION("A followed redirect is not final and its headers are dropped") {
        REQUIRE(feed_block(parser, {"HTTP/1.1 301 Moved\r\n",
                                    "Location: /elsewhere\r\n",
                                    "X-Hop: first\r\n",
                                    "\r\n"}) == false);
        REQUIRE(feed_block(parser, {"HTTP/1.1 200 OK\r\n", "A: 1\r\n", "\r\n"}));
        REQUIRE(parser.status_code() == 200);

        const HeaderMap headers = parser.take_headers();
        REQUIRE(get_header(headers, "X-Hop").has_value() == false);
        REQUIRE(get_header(headers, "A") == "1");
    }

    SECTION("A 3xx without Location is final") {
        REQUIRE(feed_block(parser, {"HTTP/1.1 304 Not Modified\r\n", "\r\n"}));
        REQUIRE(parser.status_code() == 304);
    }
}

TEST_CASE("HeaderBlockParser reads HTTP/2 status lines", "[pipe][headers]") {
    HeaderBlockParser parser;
    REQUIRE(feed_block(parser, {"HTTP/2 204\r\n", "\r\n"}));
    REQUIRE(parser.status_code() == 204);
}

TEST_CASE("HeaderBlockParser ignores a blank line before any status", "[pipe][headers]") {
    HeaderBlockParser parser;
    REQUIRE(parser.feed("\r\n") == false);
    REQUIRE(parser.feed("not a header\r\n") == false);
    REQUIRE(parser.status_code() == 0);
}

// ─────────────────────────────────────────────────────────────────────────────
// Response head
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("StreamPipe publishes the final head and ignores trailers", "[pipe]") {
    StreamPipe pipe;

    std::thread producer([&pipe]() {
        std::this_thread::sleep_for(10ms);
        pipe.push_header_line("HTTP/1.1 100 Continue\r\n");
        pipe.push_header_line("\r\n");
        pipe.push_header_line("HTTP/1.1 200 OK\r\n");
        pipe.push_header_line("Content-Type: text/event-stream\r\n");
        pipe.push_header_line("\r\n");
        pipe.push_header_line("X-Trailer: late\r\n");
    });

    const auto head = pipe.wait_for_head();
    producer.join();

    REQUIRE(head.has_value());
    REQUIRE(head->status_code == 200);
    REQUIRE(get_header(head->headers, "Content-Type") == "text/event-stream");
    REQUIRE(get_header(head->headers, "X-Trailer").has_value() == false);
}

TEST_CASE("StreamPipe reports a transfer that ends without a head", "[pipe]") {
    StreamPipe pipe;

    SECTION("The transfer error is passed through") {
        pipe.finish(HttpClientError::timeout("connect timed out"));
        const auto head = pipe.wait_for_head();
        REQUIRE(head.has_value() == false);
        REQUIRE(head.error().code == HttpClientError::Code::Timeout);
        REQUIRE(head.error().message == "connect timed out");
    }

    SECTION("No error still fails") {
        pipe.finish(std::nullopt);
        const auto head = pipe.wait_for_head();
        REQUIRE(head.has_value() == false);
        REQUIRE(head.error().code == HttpClientError::Code::Unknown);
    }

    SECTION("Abort wins over a later error") {
        pipe.abort();
        pipe.finish(HttpClientError::connection_failed("aborted by callback"));
        const auto head = pipe.wait_for_head();
        REQUIRE(head.has_value() == false);
        REQUIRE(head.error().is_cancelled());
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Body
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("StreamPipe drains buffered body before reporting the end", "[pipe]") {
    StreamPipe pipe;
    REQUIRE(pipe.push_body("data: one\n\n"));

    SECTION("Clean end") {
        pipe.finish(std::nullopt);
        REQUIRE(read_string(pipe, 6) == "data: ");
        REQUIRE(read_string(pipe, 64) == "one\n\n");

        char byte = 0;
        const ReadResult end = pipe.read(std::span<char>(&byte, 1));
        REQUIRE(end.bytes == 0);
        REQUIRE(end.error->code == StreamError::Code::EndOfStream);
    }

    SECTION("Transfer error after the data") {
        pipe.finish(HttpClientError::connection_failed("connection reset"));
        REQUIRE(read_string(pipe, 64) == "data: one\n\n");

        char byte = 0;
        const ReadResult failed = pipe.read(std::span<char>(&byte, 1));
        REQUIRE(failed.error->code == StreamError::Code::ReadFailed);
        REQUIRE(failed.error->message == "connection reset");
    }

    SECTION("Abort discards what is left") {
        pipe.abort();
        char byte = 0;
        const ReadResult cancelled = pipe.read(std::span<char>(&byte, 1));
        REQUIRE(cancelled.bytes == 0);
        REQUIRE(cancelled.error->code == StreamError::Code::Cancelled);
        REQUIRE(pipe.push_body("more") == false);
        REQUIRE(pipe.push_header_line("HTTP/1.1 200 OK\r\n") == false);
    }
}

TEST_CASE("StreamPipe storage stays bounded under a lagging reader", "[pipe][memory]") {
    StreamPipe pipe;
    constexpr std::size_t chunk_size = 16 * 1024;
    constexpr int chunks = 1000;

    std::size_t written = 0;
    std::size_t consumed = 0;
    std::size_t peak_stored = 0;
    bool in_order = true;
    std::vector<char> buffer(chunk_size - 1);

    for (int i = 0; i < chunks; ++i) {
        std::string chunk(chunk_size, '\0');
        for (auto& c : chunk) {
            c = static_cast<char>(written++ % 251);
        }
        REQUIRE(pipe.push_body(chunk));
        peak_stored = std::max(peak_stored, pipe.stored_bytes());

        // Reads one byte less than was written, so the pipe is never empty
        const ReadResult result = pipe.read(buffer);
        REQUIRE(result.error.has_value() == false);
        for (std::ptrdiff_t j = 0; j < result.bytes; ++j) {
            in_order = in_order && (buffer[static_cast<std::size_t>(j)] == static_cast<char>(consumed++ % 251));
        }
    }

    REQUIRE(in_order);
    REQUIRE(pipe.unread_bytes() == static_cast<std::size_t>(chunks));
    REQUIRE(peak_stored <= StreamPipe::compact_threshold + 3 * chunk_size);
}

TEST_CASE("StreamPipe holds the producer while the buffer is full", "[pipe][backpressure]") {
    StreamPipe pipe(8);
    REQUIRE(pipe.push_body("0123456789"));

    std::atomic<bool> pushed{false};
    std::atomic<bool> accepted{false};
    std::thread producer([&]() {
        accepted = pipe.push_body("abc");
        pushed = true;
    });

    std::this_thread::sleep_for(50ms);
    REQUIRE(pushed == false);
    REQUIRE(pipe.unread_bytes() == 10);

    SECTION("Reading makes room") {
        REQUIRE(read_string(pipe, 2) == "01");
        producer.join();
        REQUIRE(accepted);
        REQUIRE(read_string(pipe, 64) == "23456789abc");
    }

    SECTION("Abort releases the producer") {
        pipe.abort();
        producer.join();
        REQUIRE(pushed);
        REQUIRE(accepted == false);
    }
}

TEST_CASE("StreamPipe abort wakes a waiting reader", "[pipe]") {
    StreamPipe pipe;

    std::thread aborter([&pipe]() {
        std::this_thread::sleep_for(20ms);
        pipe.abort();
    });

    char byte = 0;
    const ReadResult result = pipe.read(std::span<char>(&byte, 1));
    aborter.join();

    REQUIRE(result.error->code == StreamError::Code::Cancelled);
    REQUIRE(pipe.wait_for_head().error().is_cancelled());
}
