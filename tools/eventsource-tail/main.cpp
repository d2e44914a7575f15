// ─────────────────────────────────────────────────────────────────────────────
// eventsource-tail - print a Server-Sent Events stream
// ─────────────────────────────────────────────────────────────────────────────
// Subscribes to an event stream and prints every message until interrupted.
// Reconnects on failure, resuming from the last seen event id.
//
// Usage:
//   eventsource-tail --url "https://example.com/events"
//   eventsource-tail -u "https://example.com/events" \
//                    -H "Authorization: Bearer xxx" --json
//   eventsource-tail -u "http://localhost:8080/stream" --retry-ms 250 \
//                    --log-level debug

#include <cxxopts.hpp>
#include <spdlog/sinks/stderr_color_sinks.h>

#include "eventsource/client/event_source.hpp"
#include "eventsource/log/spdlog_logger.hpp"

#include "json_lines.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace eventsource;

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void on_signal(int /*signal*/) {
    g_stop_requested = 1;
}

// ═══════════════════════════════════════════════════════════════════════════
// Output
// ═══════════════════════════════════════════════════════════════════════════

std::mutex g_output_mutex;

void print_message(const Message& message, bool json_output) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    if (json_output) {
        std::cout << tail::message_line(message) << std::endl;
        return;
    }

    if (message.event.has_value()) {
        std::cout << "event: " << *message.event << "\n";
    }
    if (message.id.has_value()) {
        std::cout << "id: " << *message.id << "\n";
    }
    if (message.data.has_value()) {
        std::cout << "data: " << *message.data << "\n";
    }
    std::cout << std::endl;
}

void print_error(const EventSourceError& error, bool json_output) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    if (json_output) {
        std::cerr << tail::error_line(error) << std::endl;
        return;
    }
    std::cerr << "Error [" << to_string(error.code) << "]: " << error.message << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

// "Name: Value" -> pair; value has leading whitespace trimmed
std::pair<std::string, std::string> parse_header(const std::string& header) {
    const auto colon_pos = header.find(':');
    if (colon_pos == std::string::npos) {
        return {header, ""};
    }
    std::string name = header.substr(0, colon_pos);
    std::string value = header.substr(colon_pos + 1);
    const auto start = value.find_first_not_of(" \t");
    value = (start == std::string::npos) ? std::string() : value.substr(start);
    return {name, value};
}

void install_logger(LogLevel level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    set_logger(std::make_unique<SpdlogLogger>(std::vector<spdlog::sink_ptr>{sink}, level));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("eventsource-tail", "Print a Server-Sent Events stream");

    options.add_options()
        ("u,url", "Event stream URL", cxxopts::value<std::string>())
        ("H,header", "Request header (can be repeated, format: 'Name: Value')",
            cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("bearer", "Bearer token for the Authorization header", cxxopts::value<std::string>())
        ("max-data", "Maximum size of a message's data in bytes (0 = default)",
            cxxopts::value<std::size_t>()->default_value("0"))
        ("retry-ms", "Initial reconnect delay in milliseconds",
            cxxopts::value<long>()->default_value("1000"))
        ("connect-timeout-ms", "Connect timeout in milliseconds",
            cxxopts::value<long>()->default_value("10000"))
        ("insecure", "Skip TLS certificate verification")
        ("j,json", "Print each message as a JSON line")
        ("l,log-level", "trace, debug, info, warn, error, fatal or off",
            cxxopts::value<std::string>()->default_value("warn"))
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        if (result.count("url") == 0) {
            std::cerr << "Error: --url is required\n\n" << options.help() << "\n";
            return 1;
        }

        const auto level = parse_log_level(result["log-level"].as<std::string>());
        if (level.has_value() == false) {
            std::cerr << "Error: unknown log level '" << result["log-level"].as<std::string>() << "'\n";
            return 1;
        }
        install_logger(*level);

        const long retry_ms = result["retry-ms"].as<long>();
        const long connect_timeout_ms = result["connect-timeout-ms"].as<long>();
        if (retry_ms < 0 || connect_timeout_ms < 0) {
            std::cerr << "Error: delays must not be negative\n";
            return 1;
        }

        const bool json_output = result.count("json") > 0;

        BufferLimits limits;
        limits.max_data = result["max-data"].as<std::size_t>();

        EventSourceConfig config;
        config.with_url(result["url"].as<std::string>())
              .with_buffer_limits(limits)
              .with_retry_delay(std::chrono::milliseconds(retry_ms))
              .with_connect_timeout(std::chrono::milliseconds(connect_timeout_ms))
              .with_verify_ssl(result.count("insecure") == 0)
              .with_callback([json_output](const EventResult& event) {
                  if (event.has_value()) {
                      print_message(*event, json_output);
                  } else {
                      print_error(event.error(), json_output);
                  }
              });

        if (result.count("bearer")) {
            config.with_bearer_token(result["bearer"].as<std::string>());
        }
        for (const auto& header : result["header"].as<std::vector<std::string>>()) {
            if (header.empty() == false) {
                auto [name, value] = parse_header(header);
                config.with_header(name, value);
            }
        }

        EventSource source(std::move(config));

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        source.start();
        while (g_stop_requested == 0 && source.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        source.close();

        if (auto id = source.last_event_id(); id.has_value()) {
            get_logger().info_fmt("Last event id: {}", *id);
        }
        set_logger(nullptr);
        return 0;

    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
