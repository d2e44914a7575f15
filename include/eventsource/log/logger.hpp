#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

namespace eventsource {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Per-line protocol detail
    Debug = 1,  // Connection attempts, state transitions
    Info  = 2,  // Start/stop of a stream
    Warn  = 3,  // Errors delivered to the consumer (stream keeps going)
    Error = 4,  // Consumer callback failures
    Fatal = 5,  // Worker stopped on a broken invariant
    Off   = 6   // Disable all logging
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// True when a record at `level` passes a `threshold` filter.
[[nodiscard]] constexpr bool level_enabled(LogLevel level, LogLevel threshold) noexcept {
    return level != LogLevel::Off &&
           static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(threshold);
}

/// Parse a level name ("debug", "WARN", "warning", ...). Case-insensitive.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(LogLevel lvl, std::string msg, std::source_location loc)
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

/// Format string that remembers where it was written, so the *_fmt helpers
/// report the caller's location rather than this header's.
template <typename... Args>
struct LocatedFormat {
    std::format_string<Args...> format;
    std::source_location location;

    template <typename S>
        requires std::convertible_to<const S&, std::string_view>
    consteval LocatedFormat(const S& fmt, std::source_location loc = std::source_location::current())
        : format(fmt)
        , location(loc)
    {}
};

template <typename... Args>
using LocatedFormatFor = LocatedFormat<std::type_identity_t<Args>...>;

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface
// ─────────────────────────────────────────────────────────────────────────────
// Implementations provide log() and should_log(); everything else funnels
// into them. Messages are only formatted once should_log() agrees.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) { emit(LogLevel::Trace, msg, loc); }
    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) { emit(LogLevel::Debug, msg, loc); }
    void info(std::string_view msg, std::source_location loc = std::source_location::current()) { emit(LogLevel::Info, msg, loc); }
    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) { emit(LogLevel::Warn, msg, loc); }
    void error(std::string_view msg, std::source_location loc = std::source_location::current()) { emit(LogLevel::Error, msg, loc); }
    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) { emit(LogLevel::Fatal, msg, loc); }

    template <typename... Args>
    void trace_fmt(LocatedFormatFor<Args...> fmt, Args&&... args) { emit_fmt(LogLevel::Trace, fmt, std::forward<Args>(args)...); }

    template <typename... Args>
    void debug_fmt(LocatedFormatFor<Args...> fmt, Args&&... args) { emit_fmt(LogLevel::Debug, fmt, std::forward<Args>(args)...); }

    template <typename... Args>
    void info_fmt(LocatedFormatFor<Args...> fmt, Args&&... args) { emit_fmt(LogLevel::Info, fmt, std::forward<Args>(args)...); }

    template <typename... Args>
    void warn_fmt(LocatedFormatFor<Args...> fmt, Args&&... args) { emit_fmt(LogLevel::Warn, fmt, std::forward<Args>(args)...); }

    template <typename... Args>
    void error_fmt(LocatedFormatFor<Args...> fmt, Args&&... args) { emit_fmt(LogLevel::Error, fmt, std::forward<Args>(args)...); }

    template <typename... Args>
    void fatal_fmt(LocatedFormatFor<Args...> fmt, Args&&... args) { emit_fmt(LogLevel::Fatal, fmt, std::forward<Args>(args)...); }

private:
    void emit(LogLevel level, std::string_view msg, const std::source_location& loc) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

    template <typename... Args>
    void emit_fmt(LogLevel level, const LocatedFormatFor<Args...>& fmt, Args&&... args) {
        if (should_log(level)) {
            log(LogRecord(level, std::format(fmt.format, std::forward<Args>(args)...), fmt.location));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - process default, discards everything
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - one line per record on stderr
// ─────────────────────────────────────────────────────────────────────────────
// "12:00:01.250 WARN  reconnect_controller.cpp:75 Unexpected HTTP status 502"

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info, bool colors = true)
        : min_level_(min_level)
        , colors_(colors)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return level_enabled(level, min_level_);
    }

    void set_level(LogLevel level) noexcept { min_level_ = level; }
    [[nodiscard]] LogLevel level() const noexcept { return min_level_; }

    void set_colors_enabled(bool enabled) noexcept { colors_ = enabled; }

    /// The line log() writes, without the trailing newline.
    [[nodiscard]] std::string format(const LogRecord& record) const;

private:
    LogLevel min_level_;
    bool colors_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────
// Shared by every EventSource in the process. Replace it before starting
// streams; the previous logger is destroyed by set_logger().

[[nodiscard]] ILogger& get_logger() noexcept;

/// Takes ownership; nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define EVENTSOURCE_LOG_AT(level, fn, msg)                                        \
    do {                                                                          \
        auto& eventsource_logger_ = ::eventsource::get_logger();                  \
        if (eventsource_logger_.should_log(::eventsource::LogLevel::level)) {     \
            eventsource_logger_.fn(msg);                                          \
        }                                                                         \
    } while (false)

#define EVENTSOURCE_LOG_TRACE(msg) EVENTSOURCE_LOG_AT(Trace, trace, msg)
#define EVENTSOURCE_LOG_DEBUG(msg) EVENTSOURCE_LOG_AT(Debug, debug, msg)
#define EVENTSOURCE_LOG_INFO(msg)  EVENTSOURCE_LOG_AT(Info, info, msg)
#define EVENTSOURCE_LOG_WARN(msg)  EVENTSOURCE_LOG_AT(Warn, warn, msg)
#define EVENTSOURCE_LOG_ERROR(msg) EVENTSOURCE_LOG_AT(Error, error, msg)
#define EVENTSOURCE_LOG_FATAL(msg) EVENTSOURCE_LOG_AT(Fatal, fatal, msg)

}  // namespace eventsource
