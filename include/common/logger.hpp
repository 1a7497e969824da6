#pragma once

#include "containers/lock_free_queue.hpp"
#include <cstdio>
#include <cstring>
#include <atomic>
#include <mutex>
#include <string_view>
#include <thread>

namespace canonical {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

const char* log_level_name(LogLevel level) noexcept;
bool parse_log_level(std::string_view text, LogLevel& out) noexcept;

struct LogEntry {
    char message[240];
    LogLevel level;
    uint64_t timestamp_ns;
};

/// Asynchronous logger. Callers format into a fixed-size entry and push it onto an
/// SPSC ring drained by a background thread. Before start() (and after stop())
/// entries are written synchronously. Pushes are serialized by a producer mutex,
/// so any thread may log.
class Logger {
public:
    static Logger& instance();

    void start();
    void stop();

    void log(LogLevel level, const char* msg);
    void logf(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

    void set_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel level() const { return min_level_.load(std::memory_order_relaxed); }

    void set_enabled(bool enabled) { enabled_.store(enabled, std::memory_order_relaxed); }
    bool enabled() const { return enabled_.load(std::memory_order_relaxed); }

    /// Not safe to call while running.
    void set_output(FILE* output) { output_ = output; }

    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    Logger();
    ~Logger();

    void push(const LogEntry& entry);
    void write(const LogEntry& entry);
    void drain_loop();

    LockFreeRingBuffer<LogEntry, 8192> queue_;
    std::mutex producer_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> enabled_{true};
    std::atomic<LogLevel> min_level_{LogLevel::Info};
    std::atomic<uint64_t> dropped_{0};
    std::thread drain_thread_;
    FILE* output_ = stderr;
};

#define CANONICAL_LOG(lvl, ...) do { \
    auto& canonical_logger_ = ::canonical::Logger::instance(); \
    if (canonical_logger_.enabled() && canonical_logger_.level() <= (lvl)) \
        canonical_logger_.logf((lvl), __VA_ARGS__); \
} while(0)

#ifdef NDEBUG
#define LOG_DEBUG(...) ((void)0)
#else
#define LOG_DEBUG(...) CANONICAL_LOG(::canonical::LogLevel::Debug, __VA_ARGS__)
#endif

#define LOG_INFO(...)  CANONICAL_LOG(::canonical::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...)  CANONICAL_LOG(::canonical::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) CANONICAL_LOG(::canonical::LogLevel::Error, __VA_ARGS__)

} // namespace canonical
