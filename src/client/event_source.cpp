#include "eventsource/client/event_source.hpp"

#include "eventsource/log/logger.hpp"

#include <stdexcept>

namespace eventsource {

EventSource::EventSource(EventSourceConfig config)
    : EventSource(std::move(config), make_http_client())
{}

EventSource::EventSource(EventSourceConfig config, std::unique_ptr<IHttpClient> client)
    : state_(std::make_shared<WorkerState>())
{
    if (client == nullptr) {
        throw std::invalid_argument("EventSource: HTTP client is null");
    }
    client->set_connect_timeout(config.connect_timeout);
    client->set_verify_ssl(config.verify_ssl);
    state_->client = std::move(client);

    // Parent cancellation stops this stream too
    parent_registration_ = config.cancellation.on_cancel(
        [source = cancel_source_]() mutable { source.cancel(); });

    state_->controller = std::make_unique<ReconnectController>(config, *state_->client, cancel_source_.get_token());
}

EventSource::~EventSource() {
    close();
    if (worker_.joinable()) {
        // Destroyed from the callback; the worker finishes on its own
        worker_.detach();
    }
}

void EventSource::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_) {
        EVENTSOURCE_LOG_WARN("EventSource already started or closed");
        return;
    }
    started_ = true;
    state_->running.store(true);

    worker_ = std::thread(&EventSource::worker, state_);
    EVENTSOURCE_LOG_INFO("EventSource started");
}

void EventSource::cancel() {
    cancel_source_.cancel();
}

void EventSource::close() {
    cancel();

    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        // A never-started source can't be started after close()
        started_ = true;

        if (worker_.get_id() == std::this_thread::get_id()) {
            EVENTSOURCE_LOG_WARN("close() called from the event callback; not waiting for the worker");
            return;
        }
        worker = std::move(worker_);
    }

    if (worker.joinable() == false) {
        // Started and being joined by a concurrent close(), or never started
        state_->running.wait(true);
        return;
    }
    worker.join();
    EVENTSOURCE_LOG_INFO("EventSource closed");
}

void EventSource::worker(std::shared_ptr<WorkerState> state) {
    state->controller->run();
    state->running.store(false);
    state->running.notify_all();
}

}  // namespace eventsource
