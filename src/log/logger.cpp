#include "eventsource/log/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iostream>
#include <mutex>

namespace eventsource {

namespace {

constexpr std::string_view reset_code = "\033[0m";
constexpr std::string_view dim_code = "\033[90m";

[[nodiscard]] std::string_view level_code(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[1;33m";
        case LogLevel::Error: return "\033[1;31m";
        case LogLevel::Fatal: return "\033[1;35m";
        case LogLevel::Off:   break;
    }
    return reset_code;
}

// HH:MM:SS.mmm, local time
[[nodiscard]] std::string clock_time(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    return std::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec, millis);
}

[[nodiscard]] std::string_view basename(std::string_view path) noexcept {
    const auto slash = path.find_last_of('/');
    return (slash == std::string_view::npos) ? path : path.substr(slash + 1);
}

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    constexpr std::array all_levels{
        LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
        LogLevel::Warn, LogLevel::Error, LogLevel::Fatal, LogLevel::Off
    };

    const auto it = std::ranges::find_if(all_levels, [name](LogLevel level) {
        return iequals(to_string(level), name);
    });
    if (it != all_levels.end()) {
        return *it;
    }
    // spdlog and syslog spelling
    if (iequals(name, "warning")) {
        return LogLevel::Warn;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

std::string ConsoleLogger::format(const LogRecord& record) const {
    const std::string where = std::format("{}:{}",
        basename(record.location.file_name()), record.location.line());

    if (colors_ == false) {
        return std::format("{} {:<5} {} {}",
            clock_time(record.timestamp), to_string(record.level), where, record.message);
    }
    return std::format("{}{}{} {}{:<5}{} {}{}{} {}",
        dim_code, clock_time(record.timestamp), reset_code,
        level_code(record.level), to_string(record.level), reset_code,
        dim_code, where, reset_code,
        record.message);
}

void ConsoleLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }
    const std::string line = format(record) + '\n';

    // Whole lines only; the worker and the caller may log concurrently
    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << line;
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

struct GlobalLogger {
    std::mutex mutex;
    std::unique_ptr<ILogger> logger = std::make_unique<NullLogger>();
};

GlobalLogger& global_logger() {
    static GlobalLogger instance;
    return instance;
}

}  // namespace

ILogger& get_logger() noexcept {
    auto& global = global_logger();
    std::lock_guard<std::mutex> lock(global.mutex);
    return *global.logger;
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    if (logger == nullptr) {
        logger = std::make_unique<NullLogger>();
    }
    auto& global = global_logger();
    std::lock_guard<std::mutex> lock(global.mutex);
    global.logger = std::move(logger);
}

}  // namespace eventsource
