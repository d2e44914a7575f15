#include "eventsource/log/spdlog_logger.hpp"

#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <stdexcept>

namespace eventsource {

namespace {

// Thread id helps tell the stream worker apart from the caller's threads
constexpr const char* default_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] [%s:%#] %v";

// spdlog needs a name per logger; ours never enter its registry
std::string next_logger_name(std::string_view kind) {
    static std::atomic<std::uint64_t> sequence{0};
    return std::format("eventsource.{}.{}", kind, sequence.fetch_add(1, std::memory_order_relaxed));
}

std::shared_ptr<spdlog::logger> configure(std::shared_ptr<spdlog::logger> logger, LogLevel level) {
    logger->set_level(SpdlogLogger::to_spdlog_level(level));
    logger->set_pattern(default_pattern);
    // Warnings and worse are the errors a stream reports; don't lose them on exit
    logger->flush_on(spdlog::level::warn);
    return logger;
}

std::shared_ptr<spdlog::details::thread_pool> shared_thread_pool(std::size_t queue_size, std::size_t threads) {
    static std::once_flag once;
    static std::shared_ptr<spdlog::details::thread_pool> pool;
    std::call_once(once, [&]() {
        pool = std::make_shared<spdlog::details::thread_pool>(queue_size, threads);
    });
    return pool;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Level Conversion
// ─────────────────────────────────────────────────────────────────────────────

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Fatal: return spdlog::level::critical;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warn;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Fatal;
        default:                      return LogLevel::Off;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

SpdlogLogger::SpdlogLogger(LogLevel min_level)
    : SpdlogLogger(std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()},
                   min_level)
{}

SpdlogLogger::SpdlogLogger(const std::string& filename, LogLevel min_level)
    : SpdlogLogger(std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename)},
                   min_level)
{}

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level)
    : logger_(configure(
          std::make_shared<spdlog::logger>(next_logger_name("sync"), sinks.begin(), sinks.end()),
          min_level))
    , min_level_(min_level)
{}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , min_level_(LogLevel::Off)
{
    if (logger_ == nullptr) {
        throw std::invalid_argument("SpdlogLogger: spdlog logger is null");
    }
    min_level_ = from_spdlog_level(logger_->level());
}

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────

void SpdlogLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }
    const spdlog::source_loc where{
        record.location.file_name(),
        static_cast<int>(record.location.line()),
        record.location.function_name()
    };
    // The message is already formatted; never reinterpret braces in it
    logger_->log(record.timestamp, where, to_spdlog_level(record.level),
                 spdlog::string_view_t(record.message.data(), record.message.size()));
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    return level_enabled(level, min_level_);
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    min_level_ = level;
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

void SpdlogLogger::flush() {
    logger_->flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel min_level) {
    return std::make_unique<SpdlogLogger>(min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(const std::string& filename, LogLevel min_level) {
    return std::make_unique<SpdlogLogger>(filename, min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(const std::string& filename, LogLevel min_level) {
    return std::make_unique<SpdlogLogger>(
        std::vector<spdlog::sink_ptr>{
            std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename)
        },
        min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(
    LogLevel min_level,
    std::size_t queue_size,
    std::size_t thread_count
) {
    auto async = std::make_shared<spdlog::async_logger>(
        next_logger_name("async"),
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
        shared_thread_pool(queue_size, thread_count),
        spdlog::async_overflow_policy::block);
    return std::make_unique<SpdlogLogger>(configure(std::move(async), min_level));
}

}  // namespace eventsource
