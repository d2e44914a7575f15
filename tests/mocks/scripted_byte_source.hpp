#ifndef EVENTSOURCE_TESTS_MOCKS_SCRIPTED_BYTE_SOURCE_HPP
#define EVENTSOURCE_TESTS_MOCKS_SCRIPTED_BYTE_SOURCE_HPP

#include "eventsource/core/cancellation.hpp"
#include "eventsource/stream/byte_source.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <deque>
#include <optional>
#include <string>

namespace eventsource::testing {

// ─────────────────────────────────────────────────────────────────────────────
// ScriptedByteSource - Test double for IByteSource
// ─────────────────────────────────────────────────────────────────────────────
// Replays a fixed script of reads:
// - chunk(): bytes, split across reads if the caller's buffer is smaller
// - empty_reads(): zero bytes, no error
// - fail(): an error with no bytes
// - negative_count(): a broken source reporting a negative byte count
// - block_until_cancelled(): hold the connection open until `token` fires
//
// Once the script is exhausted every read reports EndOfStream.

class ScriptedByteSource final : public IByteSource {
public:
    ScriptedByteSource() = default;

    explicit ScriptedByteSource(std::string data) {
        chunk(std::move(data));
    }

    ScriptedByteSource& chunk(std::string data) {
        Step step;
        step.kind = StepKind::Chunk;
        step.data = std::move(data);
        steps_.push_back(std::move(step));
        return *this;
    }

    ScriptedByteSource& empty_reads(int count) {
        for (int i = 0; i < count; ++i) {
            Step step;
            step.kind = StepKind::Empty;
            steps_.push_back(std::move(step));
        }
        return *this;
    }

    ScriptedByteSource& fail(StreamError error) {
        Step step;
        step.kind = StepKind::Error;
        step.error = std::move(error);
        steps_.push_back(std::move(step));
        return *this;
    }

    ScriptedByteSource& negative_count(std::ptrdiff_t count = -1) {
        Step step;
        step.kind = StepKind::Negative;
        step.negative = count;
        steps_.push_back(std::move(step));
        return *this;
    }

    ScriptedByteSource& block_until_cancelled(CancellationToken token) {
        Step step;
        step.kind = StepKind::Block;
        step.token = std::move(token);
        steps_.push_back(std::move(step));
        return *this;
    }

    ReadResult read(std::span<char> buffer) override {
        reads_.fetch_add(1);

        if (steps_.empty()) {
            return ReadResult{0, StreamError::end_of_stream()};
        }

        Step& step = steps_.front();
        switch (step.kind) {
            case StepKind::Chunk: {
                const std::size_t count = std::min(buffer.size(), step.data.size());
                std::memcpy(buffer.data(), step.data.data(), count);
                step.data.erase(0, count);
                if (step.data.empty()) {
                    steps_.pop_front();
                }
                return ReadResult{static_cast<std::ptrdiff_t>(count), std::nullopt};
            }

            case StepKind::Empty:
                steps_.pop_front();
                return ReadResult{0, std::nullopt};

            case StepKind::Error: {
                StreamError error = *step.error;
                steps_.pop_front();
                return ReadResult{0, std::move(error)};
            }

            case StepKind::Negative: {
                const std::ptrdiff_t count = step.negative;
                steps_.pop_front();
                return ReadResult{count, std::nullopt};
            }

            case StepKind::Block:
                while (step.token.wait_for(std::chrono::milliseconds(50)) == false) {
                }
                return ReadResult{0, StreamError::cancelled()};
        }
        return ReadResult{0, StreamError::end_of_stream()};
    }

    [[nodiscard]] int reads() const noexcept { return reads_.load(); }

private:
    enum class StepKind { Chunk, Empty, Error, Negative, Block };

    struct Step {
        StepKind kind{StepKind::Chunk};
        std::string data;
        std::optional<StreamError> error;
        std::ptrdiff_t negative{0};
        CancellationToken token;
    };

    std::deque<Step> steps_;
    std::atomic<int> reads_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// RepeatingByteSource - endless stream of the same chunk
// ─────────────────────────────────────────────────────────────────────────────
// Returns `chunk` on every read until `token` is cancelled, then Cancelled.
// Used to keep the dispatch path busy while shutdown races it.

class RepeatingByteSource final : public IByteSource {
public:
    RepeatingByteSource(std::string chunk, CancellationToken token)
        : chunk_(std::move(chunk))
        , token_(std::move(token))
    {}

    ReadResult read(std::span<char> buffer) override {
        if (token_.is_cancelled()) {
            return ReadResult{0, StreamError::cancelled()};
        }
        const std::size_t remaining = chunk_.size() - offset_;
        const std::size_t count = std::min(buffer.size(), remaining);
        std::memcpy(buffer.data(), chunk_.data() + offset_, count);
        offset_ = (offset_ + count) % chunk_.size();
        return ReadResult{static_cast<std::ptrdiff_t>(count), std::nullopt};
    }

private:
    std::string chunk_;
    std::size_t offset_{0};
    CancellationToken token_;
};

}  // namespace eventsource::testing

#endif  // EVENTSOURCE_TESTS_MOCKS_SCRIPTED_BYTE_SOURCE_HPP
