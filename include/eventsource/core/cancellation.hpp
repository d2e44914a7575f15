#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace eventsource {

namespace detail {

/// Shared state behind a CancellationSource and all of its tokens.
struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::pair<std::uint64_t, std::function<void()>>> callbacks;
    std::uint64_t next_id = 1;

    /// Returns 0 when the callback was run inline (already cancelled).
    std::uint64_t add_callback(std::function<void()> callback) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled.load(std::memory_order_relaxed) == false) {
                const std::uint64_t id = next_id++;
                callbacks.emplace_back(id, std::move(callback));
                return id;
            }
        }
        callback();
        return 0;
    }

    void remove_callback(std::uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        std::erase_if(callbacks, [id](const auto& entry) { return entry.first == id; });
    }

    void trigger() {
        std::vector<std::function<void()>> to_invoke;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled.exchange(true, std::memory_order_release)) {
                return;
            }
            for (auto& [id, callback] : callbacks) {
                to_invoke.push_back(std::move(callback));
            }
            callbacks.clear();
        }
        cv.notify_all();
        for (auto& callback : to_invoke) {
            callback();
        }
    }

    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [this]() {
            return cancelled.load(std::memory_order_acquire);
        });
    }
};

}  // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// CancellationRegistration
// ─────────────────────────────────────────────────────────────────────────────
// RAII handle returned by CancellationToken::on_cancel(). The callback is
// unregistered when the handle is destroyed.

class CancellationRegistration {
public:
    CancellationRegistration() = default;

    CancellationRegistration(CancellationRegistration&& other) noexcept
        : state_(std::move(other.state_))
        , id_(std::exchange(other.id_, 0))
    {}

    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept {
        if (this != &other) {
            unregister();
            state_ = std::move(other.state_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    ~CancellationRegistration() { unregister(); }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    void unregister() {
        if (state_ && id_ != 0) {
            state_->remove_callback(id_);
            id_ = 0;
        }
    }

private:
    friend class CancellationToken;

    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, std::uint64_t id)
        : state_(std::move(state))
        , id_(id)
    {}

    std::shared_ptr<detail::CancellationState> state_;
    std::uint64_t id_ = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// CancellationToken
// ─────────────────────────────────────────────────────────────────────────────
// Cheap, copyable view of a cancellation signal. Checked at every blocking
// point of an event stream: before a request, while reading the body and
// while waiting out a reconnect delay.
//
// A default-constructed token is never cancelled.

class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const noexcept {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    /// Register a callback to run on cancellation. Runs immediately (on the
    /// calling thread) if cancellation was already requested.
    template <typename F>
    [[nodiscard]] CancellationRegistration on_cancel(F&& callback) const {
        if (state_ == nullptr) {
            return CancellationRegistration{};
        }
        const auto id = state_->add_callback(std::function<void()>(std::forward<F>(callback)));
        return CancellationRegistration{state_, id};
    }

    /// Block for up to `timeout`. Returns true if cancellation was requested
    /// before the timeout elapsed (returns as soon as it is).
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        if (state_ == nullptr) {
            std::this_thread::sleep_for(timeout);
            return false;
        }
        return state_->wait_for(timeout);
    }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state))
    {}

    std::shared_ptr<detail::CancellationState> state_;
};

// ─────────────────────────────────────────────────────────────────────────────
// CancellationSource
// ─────────────────────────────────────────────────────────────────────────────
// Owner side of the signal. Copies share the same state.
//
// Usage:
//   CancellationSource source;
//   config.with_cancellation(source.get_token());
//   ...
//   source.cancel();   // every token observes it

class CancellationSource {
public:
    CancellationSource()
        : state_(std::make_shared<detail::CancellationState>())
    {}

    [[nodiscard]] CancellationToken get_token() const noexcept {
        return CancellationToken{state_};
    }

    /// Idempotent. Registered callbacks run once, on the calling thread.
    void cancel() {
        state_->trigger();
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return state_->cancelled.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace eventsource
