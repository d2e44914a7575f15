// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "eventsource/client/reconnect_controller.hpp"
#include "eventsource/log/spdlog_logger.hpp"

#include "mocks/mock_http_client.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace eventsource;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

// spdlog logger writing into a string stream, wrapped as an ILogger
struct StreamCapture {
    std::ostringstream stream;
    std::unique_ptr<SpdlogLogger> logger;

    explicit StreamCapture(LogLevel level) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
        logger = std::make_unique<SpdlogLogger>(std::vector<spdlog::sink_ptr>{sink}, level);
        logger->set_pattern("%l|%v");
    }

    [[nodiscard]] std::string text() {
        logger->flush();
        return stream.str();
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Levels
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger respects minimum log level", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Warn);

    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));
    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Warn));
    REQUIRE(logger->should_log(LogLevel::Fatal));

    logger->set_level(LogLevel::Debug);
    REQUIRE(logger->should_log(LogLevel::Debug));
    REQUIRE(logger->get_spdlog_logger()->level() == spdlog::level::debug);
}

TEST_CASE("SpdlogLogger level mapping", "[log][spdlog]") {
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Fatal) == spdlog::level::critical);
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Error) == spdlog::level::err);
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Off) == spdlog::level::off);
    REQUIRE(SpdlogLogger::from_spdlog_level(spdlog::level::critical) == LogLevel::Fatal);
    REQUIRE(SpdlogLogger::from_spdlog_level(spdlog::level::trace) == LogLevel::Trace);
}

TEST_CASE("Wrapped spdlog logger keeps its level", "[log][spdlog]") {
    auto inner = std::make_shared<spdlog::logger>("wrapped_test_logger");
    inner->set_level(spdlog::level::err);

    SpdlogLogger logger(inner);
    REQUIRE(logger.should_log(LogLevel::Warn) == false);
    REQUIRE(logger.should_log(LogLevel::Error));
}

TEST_CASE("SpdlogLogger writes records through its sinks", "[log][spdlog]") {
    StreamCapture capture(LogLevel::Info);

    capture.logger->debug("hidden");
    capture.logger->info("visible");
    capture.logger->warn_fmt("retry in {}ms", 250);
    capture.logger->fatal("stopped");

    const std::string text = capture.text();
    REQUIRE(text.find("hidden") == std::string::npos);
    REQUIRE(text.find("info|visible") != std::string::npos);
    REQUIRE(text.find("warning|retry in 250ms") != std::string::npos);
    REQUIRE(text.find("critical|stopped") != std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════
// File and async sinks
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger file logger respects log level", "[log][spdlog][file]") {
    const std::string test_file = "test_eventsource_spdlog.log";
    std::filesystem::remove(test_file);

    {
        auto logger = make_spdlog_file_logger(test_file, LogLevel::Warn);
        logger->info("This should not appear");
        logger->warn("This should appear");
        logger->flush();
    }

    REQUIRE(std::filesystem::exists(test_file));
    const std::string content = read_file(test_file);
    REQUIRE(content.find("This should not appear") == std::string::npos);
    REQUIRE(content.find("This should appear") != std::string::npos);

    std::filesystem::remove(test_file);
}

TEST_CASE("Console and file logger writes to the file", "[log][spdlog][file]") {
    const std::string test_file = "test_eventsource_console_file.log";
    std::filesystem::remove(test_file);

    {
        auto logger = make_spdlog_console_file_logger(test_file, LogLevel::Info);
        logger->error_fmt("Stream read failed: {}", "reset by peer");
        logger->flush();
    }

    REQUIRE(read_file(test_file).find("Stream read failed: reset by peer") != std::string::npos);
    std::filesystem::remove(test_file);
}

TEST_CASE("SpdlogLogger async console logger works", "[log][spdlog][async]") {
    auto logger = make_spdlog_async_console_logger(LogLevel::Info);
    REQUIRE(logger != nullptr);

    for (int i = 0; i < 10; ++i) {
        logger->info_fmt("Async message {}", i);
    }
    logger->flush();

    REQUIRE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Debug) == false);
}

// ═══════════════════════════════════════════════════════════════════════════
// Integration with the global logger
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger as global logger receives stream diagnostics", "[log][spdlog][integration]") {
    auto capture = std::make_unique<StreamCapture>(LogLevel::Debug);
    auto* spdlog_ptr = capture->logger.get();
    set_logger(std::move(capture->logger));

    {
        eventsource::testing::MockHttpClient client;
        CancellationSource cancel;
        EventSourceConfig config;
        config.with_url("http://localhost/events");
        ReconnectController controller(config, client, cancel.get_token());

        client.queue_status(404);
        REQUIRE(controller.connect_and_stream() == ReconnectController::Outcome::Retry);
    }

    spdlog_ptr->flush();
    const std::string text = capture->stream.str();
    set_logger(nullptr);

    REQUIRE(text.find("debug|Connecting to http://localhost/events") != std::string::npos);
    REQUIRE(text.find("warning|Unexpected HTTP status 404") != std::string::npos);
}
