#pragma once

#include "eventsource/core/cancellation.hpp"
#include "eventsource/stream/byte_source.hpp"
#include "eventsource/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace eventsource {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        Cancelled,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError cancelled() {
        return {Code::Cancelled, "Request cancelled"};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }

    [[nodiscard]] bool is_cancelled() const noexcept { return code == Code::Cancelled; }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Stream Response
// ─────────────────────────────────────────────────────────────────────────────
// Status and headers of the final response, plus the body as a byte source
// that yields data as it arrives. Destroying `body` aborts the transfer.

struct HttpStreamResponse {
    int status_code{0};
    HeaderMap headers;
    std::unique_ptr<IByteSource> body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    [[nodiscard]] std::optional<std::string> content_type() const {
        return get_header(headers, "Content-Type");
    }

    [[nodiscard]] bool is_event_stream() const {
        const auto value = content_type();
        const bool found = value.has_value();
        if (found == false) {
            return false;
        }
        return is_event_stream_content_type(*value);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient Interface
// ─────────────────────────────────────────────────────────────────────────────
// Abstract HTTP capability used by the reconnect controller. Allows swapping
// the backend and mocking in tests.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;
    virtual void set_verify_ssl(bool verify) = 0;

    /// Send `request` and return once the final response headers are in.
    /// The body stays open until the returned source is destroyed or `token`
    /// is cancelled; after cancellation its read() reports Cancelled.
    /// A connect aborted by `token` yields HttpClientError::cancelled().
    [[nodiscard]] virtual HttpClientResult<HttpStreamResponse> open_stream(
        const HttpRequest& request,
        const CancellationToken& token
    ) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Function
// ─────────────────────────────────────────────────────────────────────────────
// Default implementation, built on cpr.

std::unique_ptr<IHttpClient> make_http_client();

}  // namespace eventsource
