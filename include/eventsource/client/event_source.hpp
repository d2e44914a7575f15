#pragma once

#include "eventsource/client/event_source_config.hpp"
#include "eventsource/client/reconnect_controller.hpp"
#include "eventsource/core/cancellation.hpp"
#include "eventsource/transport/http_client.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

namespace eventsource {

// ─────────────────────────────────────────────────────────────────────────────
// EventSource
// ─────────────────────────────────────────────────────────────────────────────
// A subscription to one Server-Sent Events stream, consumed on a dedicated
// worker thread that reconnects automatically until closed.
//
// Shutdown is two-phase: cancel() (or cancelling the parent token) asks the
// worker to stop; close() additionally waits until it has exited. Once
// close() returns the callback will not be invoked again.
//
// Usage:
//   EventSourceConfig config;
//   config.with_url("https://example.com/events")
//         .with_callback([](const EventResult& result) {
//             if (result) {
//                 std::cout << result->data.value_or("") << "\n";
//             }
//         });
//
//   EventSource source(config);
//   source.start();
//   ...
//   source.close();

class EventSource {
public:
    /// Uses the default HTTP client. Throws std::invalid_argument on an
    /// invalid request target.
    explicit EventSource(EventSourceConfig config);

    /// Custom HTTP client (for testing or alternative backends).
    EventSource(EventSourceConfig config, std::unique_ptr<IHttpClient> client);

    ~EventSource();

    // Non-copyable, non-movable (owns a thread)
    EventSource(const EventSource&) = delete;
    EventSource& operator=(const EventSource&) = delete;
    EventSource(EventSource&&) = delete;
    EventSource& operator=(EventSource&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Spawn the worker. Has no effect if already started or closed.
    void start();

    /// Request shutdown without waiting. Safe from any thread, including the
    /// callback.
    void cancel();

    /// cancel(), then block until the worker has exited. Idempotent. From
    /// the callback it only cancels; the worker exits once the callback
    /// returns. Destroying the EventSource from its own callback is allowed.
    void close();

    [[nodiscard]] bool is_running() const noexcept { return state_->running.load(); }
    [[nodiscard]] ConnectionState state() const noexcept { return state_->controller->state(); }
    [[nodiscard]] std::optional<std::string> last_event_id() const { return state_->controller->last_event_id(); }
    [[nodiscard]] std::chrono::milliseconds reconnect_delay() const { return state_->controller->reconnect_delay(); }

private:
    // Everything the worker touches. The worker holds its own reference, so
    // it outlives an EventSource destroyed from the callback.
    struct WorkerState {
        std::unique_ptr<IHttpClient> client;
        std::unique_ptr<ReconnectController> controller;
        std::atomic<bool> running{false};
    };

    static void worker(std::shared_ptr<WorkerState> state);

    std::shared_ptr<WorkerState> state_;
    CancellationSource cancel_source_;
    CancellationRegistration parent_registration_;

    std::mutex lifecycle_mutex_;
    std::thread worker_;
    bool started_{false};
};

}  // namespace eventsource
