#include "eventsource/client/reconnect_controller.hpp"

#include "eventsource/log/logger.hpp"
#include "eventsource/stream/line_reader.hpp"

namespace eventsource {

namespace {

constexpr std::string_view last_event_id_header = "Last-Event-Id";

}  // namespace

ReconnectController::ReconnectController(const EventSourceConfig& config,
                                         IHttpClient& client,
                                         CancellationToken token)
    : prototype_(config.build_request())
    , client_(client)
    , token_(std::move(token))
    , callback_(config.callback)
    , assembler_(config.buffer_limits)
    , reconnect_delay_(config.initial_retry_delay)
{}

void ReconnectController::run() {
    try {
        for (;;) {
            if (connect_and_stream() == Outcome::Stop) {
                break;
            }
            if (back_off() == Outcome::Stop) {
                break;
            }
        }
    } catch (const std::exception& e) {
        // Contract violation (e.g. a byte source reporting a negative count)
        get_logger().fatal_fmt("Event stream stopped: {}", e.what());
        dispatch(tl::unexpected(EventSourceError::internal(e.what())));
    } catch (...) {
        get_logger().fatal("Event stream stopped: unknown exception");
        dispatch(tl::unexpected(EventSourceError::internal("unknown exception")));
    }
    set_state(ConnectionState::Stopped);
}

ReconnectController::Outcome ReconnectController::connect_and_stream() {
    if (token_.is_cancelled()) {
        return Outcome::Stop;
    }

    set_state(ConnectionState::Connecting);
    attempts_.fetch_add(1);

    HttpRequest request = prototype_;
    const auto resume_from = last_event_id();
    if (resume_from.has_value()) {
        request.with_header(std::string(last_event_id_header), *resume_from);
        get_logger().debug_fmt("Connecting to {} (resuming from id '{}')", request.url, *resume_from);
    } else {
        get_logger().debug_fmt("Connecting to {}", request.url);
    }

    auto result = client_.open_stream(request, token_);
    if (result.has_value() == false) {
        const bool cancelled = result.error().is_cancelled() || token_.is_cancelled();
        if (cancelled) {
            EVENTSOURCE_LOG_DEBUG("Connect aborted by cancellation");
            return Outcome::Stop;
        }
        get_logger().warn_fmt("Connect failed: {}", result.error().message);
        dispatch(tl::unexpected(EventSourceError::transport_failed(result.error())));
        return Outcome::Retry;
    }

    HttpStreamResponse& response = *result;

    if (response.is_success() == false) {
        get_logger().warn_fmt("Unexpected HTTP status {}", response.status_code);
        dispatch(tl::unexpected(EventSourceError::invalid_status(response.status_code)));
        return Outcome::Retry;
    }

    if (response.is_event_stream() == false) {
        const std::string content_type = response.content_type().value_or("");
        get_logger().warn_fmt("Unexpected content type '{}'", content_type);
        dispatch(tl::unexpected(
            EventSourceError::invalid_content_type(response.status_code, content_type)));
        return Outcome::Retry;
    }

    if (response.body == nullptr) {
        const StreamError missing_body = StreamError::read_failed("response has no body");
        get_logger().warn_fmt("Response {} has no body", response.status_code);
        dispatch(tl::unexpected(EventSourceError::from_stream_error(missing_body)));
        return Outcome::Retry;
    }

    return stream(*response.body);
}

ReconnectController::Outcome ReconnectController::stream(IByteSource& body) {
    set_state(ConnectionState::Streaming);
    assembler_.reset();

    LineReader reader(body, assembler_.limits().max_line);
    for (;;) {
        const LineResult result = reader.read_line();
        if (result.error.has_value()) {
            // An unterminated trailing line belongs to an incomplete message
            return on_read_error(*result.error);
        }

        switch (assembler_.feed(result.line)) {
            case MessageAssembler::FeedResult::MessageReady:
                on_message_boundary();
                break;

            case MessageAssembler::FeedResult::RetryUpdated: {
                const auto delay = *assembler_.retry();
                {
                    std::lock_guard<std::mutex> lock(session_mutex_);
                    reconnect_delay_ = delay;
                }
                get_logger().debug_fmt("Server set reconnect delay to {}ms", delay.count());
                break;
            }

            case MessageAssembler::FeedResult::Continue:
                break;
        }
    }
}

void ReconnectController::on_message_boundary() {
    const AssembledMessage assembled = assembler_.message();

    if (assembled.has_value()) {
        const Message& message = *assembled;
        const bool has_id = message.id.has_value() && (message.id->empty() == false);
        if (has_id) {
            std::lock_guard<std::mutex> lock(session_mutex_);
            last_event_id_ = std::string(*message.id);
        }
        EVENTSOURCE_LOG_TRACE("Dispatching message");
        dispatch(message);
    } else {
        get_logger().warn_fmt("Discarding message: {}", assembled.error().message());
        dispatch(tl::unexpected(EventSourceError::field_too_long(assembled.error())));
    }

    assembler_.end_message();
}

ReconnectController::Outcome ReconnectController::on_read_error(const StreamError& error) {
    if (error.is(StreamError::Code::Cancelled) || token_.is_cancelled()) {
        EVENTSOURCE_LOG_DEBUG("Stream read aborted by cancellation");
        return Outcome::Stop;
    }

    if (error.is(StreamError::Code::EndOfStream)) {
        EVENTSOURCE_LOG_DEBUG("Stream ended, reconnecting");
        return Outcome::Retry;
    }

    get_logger().warn_fmt("Stream read failed: {}", error.message);
    dispatch(tl::unexpected(EventSourceError::from_stream_error(error)));
    return Outcome::Retry;
}

ReconnectController::Outcome ReconnectController::back_off() {
    set_state(ConnectionState::BackingOff);
    const auto delay = reconnect_delay();
    get_logger().debug_fmt("Reconnecting in {}ms", delay.count());

    const bool cancelled = token_.wait_for(delay);
    if (cancelled) {
        EVENTSOURCE_LOG_DEBUG("Back-off interrupted by cancellation");
        return Outcome::Stop;
    }
    return Outcome::Retry;
}

void ReconnectController::dispatch(const EventResult& result) {
    if (token_.is_cancelled()) {
        return;
    }
    if (callback_ == nullptr) {
        return;
    }
    try {
        callback_(result);
    } catch (const std::exception& e) {
        get_logger().error_fmt("Event callback threw: {}", e.what());
    } catch (...) {
        get_logger().error("Event callback threw a non-standard exception");
    }
}

std::optional<std::string> ReconnectController::last_event_id() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return last_event_id_;
}

std::chrono::milliseconds ReconnectController::reconnect_delay() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return reconnect_delay_;
}

void ReconnectController::set_state(ConnectionState next) {
    const ConnectionState previous = state_.exchange(next);
    if (previous != next) {
        get_logger().debug_fmt("Connection state: {} -> {}", to_string(previous), to_string(next));
    }
}

}  // namespace eventsource
