#include "eventsource/transport/http_client.hpp"

#include "eventsource/log/logger.hpp"
#include "eventsource/transport/stream_pipe.hpp"

#include <cpr/cpr.h>

#include <optional>
#include <thread>

namespace eventsource {

namespace {

// Map cpr errors to our error type
HttpClientError map_error(const cpr::Error& error) {
    const std::string& msg = error.message;
    const bool is_ssl_error =
        (msg.find("SSL") != std::string::npos) ||
        (msg.find("ssl") != std::string::npos) ||
        (msg.find("certificate") != std::string::npos) ||
        (msg.find("TLS") != std::string::npos);

    if (is_ssl_error) {
        return HttpClientError::ssl_error(msg);
    }

    switch (error.code) {
        case cpr::ErrorCode::OK:
            return HttpClientError::unknown("No error");

        case cpr::ErrorCode::OPERATION_TIMEDOUT:
            return HttpClientError::timeout(msg);

        case cpr::ErrorCode::SSL_CONNECT_ERROR:
            return HttpClientError::ssl_error(msg);

        default:
            // Most other errors are connection-related
            return HttpClientError::connection_failed(msg);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Transfer
// ─────────────────────────────────────────────────────────────────────────────
// One request running on its own thread. Destruction aborts the transfer and
// joins the thread.

class Transfer {
public:
    Transfer(const HttpRequest& request,
             std::chrono::milliseconds connect_timeout,
             bool verify_ssl,
             const CancellationToken& token)
        : pipe_(std::make_shared<StreamPipe>())
    {
        cancel_registration_ = token.on_cancel([pipe = pipe_]() { pipe->abort(); });
        thread_ = std::thread(&Transfer::run, pipe_, request, connect_timeout, verify_ssl);
    }

    ~Transfer() {
        cancel_registration_.unregister();
        pipe_->abort();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;

    [[nodiscard]] StreamPipe& pipe() noexcept { return *pipe_; }

private:
    static void run(std::shared_ptr<StreamPipe> pipe,
                    HttpRequest request,
                    std::chrono::milliseconds connect_timeout,
                    bool verify_ssl) {
        cpr::Session session;
        session.SetUrl(cpr::Url{request.url});
        cpr::Header cpr_headers;
        for (const auto& [name, value] : request.headers) {
            cpr_headers[name] = value;
        }
        session.SetHeader(cpr_headers);
        session.SetConnectTimeout(cpr::ConnectTimeout{connect_timeout});
        session.SetVerifySsl(cpr::VerifySsl{verify_ssl});
        if (request.body.has_value()) {
            session.SetBody(cpr::Body{*request.body});
        }

        session.SetHeaderCallback(cpr::HeaderCallback{
            [pipe](std::string_view line, intptr_t) { return pipe->push_header_line(line); }});

        session.SetWriteCallback(cpr::WriteCallback{
            [pipe](std::string_view data, intptr_t) { return pipe->push_body(data); }});

        // Lets an abort interrupt connect and quiet periods, not only writes
        session.SetProgressCallback(cpr::ProgressCallback{
            [pipe](auto, auto, auto, auto, auto) { return pipe->is_aborted() == false; }});

        const cpr::Response response =
            (request.method == HttpMethod::Post) ? session.Post() : session.Get();

        std::optional<HttpClientError> error;
        if (response.error.code != cpr::ErrorCode::OK) {
            error = map_error(response.error);
        }
        pipe->finish(std::move(error));
    }

    std::shared_ptr<StreamPipe> pipe_;
    CancellationRegistration cancel_registration_;
    std::thread thread_;
};

// ─────────────────────────────────────────────────────────────────────────────
// CprBodySource
// ─────────────────────────────────────────────────────────────────────────────

class CprBodySource : public IByteSource {
public:
    explicit CprBodySource(std::unique_ptr<Transfer> transfer)
        : transfer_(std::move(transfer))
    {}

    ReadResult read(std::span<char> buffer) override {
        return transfer_->pipe().read(buffer);
    }

private:
    std::unique_ptr<Transfer> transfer_;
};

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// cpr (C++ Requests) over libcurl. Each open_stream() runs its transfer on a
// dedicated thread so the body can be consumed incrementally.

class CprHttpClient : public IHttpClient {
public:
    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpStreamResponse> open_stream(
        const HttpRequest& request,
        const CancellationToken& token
    ) override {
        if (token.is_cancelled()) {
            return tl::unexpected(HttpClientError::cancelled());
        }

        get_logger().debug_fmt("{} {}", to_string(request.method), request.url);

        auto transfer = std::make_unique<Transfer>(request, connect_timeout_, verify_ssl_, token);
        auto head = transfer->pipe().wait_for_head();
        if (head.has_value() == false) {
            return tl::unexpected(head.error());
        }

        HttpStreamResponse response;
        response.status_code = head->status_code;
        response.headers = std::move(head->headers);
        response.body = std::make_unique<CprBodySource>(std::move(transfer));
        return response;
    }

private:
    std::chrono::milliseconds connect_timeout_{10000};
    bool verify_ssl_{true};
};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Factory Function
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace eventsource
