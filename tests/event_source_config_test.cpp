#include <catch2/catch_test_macros.hpp>

#include "eventsource/client/event_source_config.hpp"

#include <stdexcept>

using namespace eventsource;
using namespace std::chrono_literals;

TEST_CASE("EventSourceConfig has sensible defaults", "[config]") {
    EventSourceConfig config;

    REQUIRE(config.url.empty());
    REQUIRE(config.request.has_value() == false);
    REQUIRE(config.connect_timeout == 10'000ms);
    REQUIRE(config.verify_ssl);
    REQUIRE(config.initial_retry_delay == 1'000ms);
    REQUIRE(config.buffer_limits.max_id == 0);
    REQUIRE(config.cancellation.is_cancelled() == false);
    REQUIRE(config.callback == nullptr);
}

TEST_CASE("EventSourceConfig builder helpers chain", "[config]") {
    CancellationSource source;
    BufferLimits limits;
    limits.max_data = 1024;

    EventSourceConfig config;
    config.with_url("https://example.com/events")
          .with_bearer_token("secret")
          .with_header("X-Client", "tests")
          .with_connect_timeout(2s)
          .with_verify_ssl(false)
          .with_retry_delay(250ms)
          .with_buffer_limits(limits)
          .with_cancellation(source.get_token())
          .with_callback([](const EventResult&) {});

    REQUIRE(config.url == "https://example.com/events");
    REQUIRE(get_header(config.default_headers, "Authorization") == "Bearer secret");
    REQUIRE(get_header(config.default_headers, "x-client") == "tests");
    REQUIRE(config.connect_timeout == 2s);
    REQUIRE(config.verify_ssl == false);
    REQUIRE(config.initial_retry_delay == 250ms);
    REQUIRE(config.buffer_limits.max_data == 1024);
    REQUIRE(config.callback != nullptr);

    source.cancel();
    REQUIRE(config.cancellation.is_cancelled());
}

TEST_CASE("build_request makes a GET from the URL", "[config]") {
    EventSourceConfig config;
    config.with_url("http://localhost:8080/events").with_header("X-Trace", "1");

    const HttpRequest request = config.build_request();

    REQUIRE(request.method == HttpMethod::Get);
    REQUIRE(request.url == "http://localhost:8080/events");
    REQUIRE(request.body.has_value() == false);
    REQUIRE(get_header(request.headers, "Accept") == "text/event-stream");
    REQUIRE(get_header(request.headers, "Cache-Control") == "no-cache");
    REQUIRE(get_header(request.headers, "X-Trace") == "1");
}

TEST_CASE("build_request uses the prototype when given", "[config]") {
    HttpRequest prototype;
    prototype.method = HttpMethod::Post;
    prototype.url = "https://example.com/subscribe";
    prototype.with_header("accept", "text/event-stream; q=1").with_body("{\"topic\":\"a\"}");

    EventSourceConfig config;
    config.with_url("https://ignored.example.com/")
          .with_request(prototype)
          .with_header("Accept", "*/*")
          .with_header("X-Extra", "yes");

    const HttpRequest request = config.build_request();

    REQUIRE(request.method == HttpMethod::Post);
    REQUIRE(request.url == "https://example.com/subscribe");
    REQUIRE(request.body == "{\"topic\":\"a\"}");
    // Prototype headers win over defaults
    REQUIRE(get_header(request.headers, "Accept") == "text/event-stream; q=1");
    REQUIRE(get_header(request.headers, "X-Extra") == "yes");
}

TEST_CASE("build_request rejects a missing or invalid target", "[config]") {
    SECTION("No target") {
        EventSourceConfig config;
        REQUIRE_THROWS_AS(config.build_request(), std::invalid_argument);
    }

    SECTION("Unparsable URL") {
        EventSourceConfig config;
        config.with_url("::not a url::");
        REQUIRE_THROWS_AS(config.build_request(), std::invalid_argument);
    }

    SECTION("Unsupported scheme") {
        EventSourceConfig config;
        config.with_url("ws://example.com/events");
        REQUIRE_THROWS_AS(config.build_request(), std::invalid_argument);
    }
}
