// Example 01: Basic Stream
//
// Subscribe to an event stream, print ten messages, then close.

#include <eventsource/client/event_source.hpp>
#include <eventsource/log/spdlog_logger.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

using namespace eventsource;

int main() {
    std::cout << "=== Basic Stream Example ===\n\n";

    const char* url_env = std::getenv("SSE_URL");
    if (!url_env) {
        std::cerr << "Please set SSE_URL environment variable\n";
        std::cerr << "Example: export SSE_URL=\"http://localhost:8080/events\"\n";
        return 1;
    }

    // 1. Route library diagnostics through spdlog
    set_logger(make_spdlog_console_logger(LogLevel::Info));

    // 2. Configure the stream
    std::mutex mutex;
    std::condition_variable cv;
    int received = 0;

    EventSourceConfig config;
    config.with_url(url_env)
          .with_retry_delay(std::chrono::milliseconds(500))
          .with_callback([&](const EventResult& event) {
              if (!event) {
                  std::cerr << "Stream error: " << event.error().message << "\n";
                  return;
              }
              // Views are only valid inside the callback
              std::cout << "[" << event->event.value_or("message") << "] "
                        << event->data.value_or("") << "\n";
              {
                  std::lock_guard<std::mutex> lock(mutex);
                  ++received;
              }
              cv.notify_one();
          });

    // 3. Start the worker and wait for some messages
    EventSource source(std::move(config));
    source.start();

    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, std::chrono::seconds(30), [&]() { return received >= 10; });
    }

    // 4. No callback runs once close() has returned
    source.close();

    std::cout << "\nReceived " << received << " messages";
    if (auto id = source.last_event_id()) {
        std::cout << ", last id " << *id;
    }
    std::cout << "\n";

    set_logger(nullptr);
    return 0;
}
