#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cstdarg>
#include <chrono>

namespace canonical {

namespace {

constexpr const char* LEVEL_NAMES[] = {"DEBUG", "INFO ", "WARN ", "ERROR"};

} // anonymous namespace

const char* log_level_name(LogLevel level) noexcept {
    int idx = static_cast<int>(level);
    if (idx < 0 || idx > 3) idx = 1;
    return LEVEL_NAMES[idx];
}

bool parse_log_level(std::string_view text, LogLevel& out) noexcept {
    if (text == "debug") { out = LogLevel::Debug; return true; }
    if (text == "info")  { out = LogLevel::Info;  return true; }
    if (text == "warn")  { out = LogLevel::Warn;  return true; }
    if (text == "error") { out = LogLevel::Error; return true; }
    return false;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() = default;

Logger::~Logger() {
    stop();
}

void Logger::start() {
    if (running_.exchange(true)) return;
    drain_thread_ = std::thread(&Logger::drain_loop, this);
}

void Logger::stop() {
    if (!running_.exchange(false)) return;
    if (drain_thread_.joinable()) {
        drain_thread_.join();
    }
    queue_.drain([this](const LogEntry& entry) { write(entry); });
    fflush(output_);
}

void Logger::log(LogLevel level, const char* msg) {
    if (level < min_level_.load(std::memory_order_relaxed)) return;

    LogEntry entry;
    entry.level = level;
    entry.timestamp_ns = now_ns();
    strncpy(entry.message, msg, sizeof(entry.message) - 1);
    entry.message[sizeof(entry.message) - 1] = '\0';
    push(entry);
}

void Logger::logf(LogLevel level, const char* fmt, ...) {
    if (level < min_level_.load(std::memory_order_relaxed)) return;

    LogEntry entry;
    entry.level = level;
    entry.timestamp_ns = now_ns();

    va_list args;
    va_start(args, fmt);
    vsnprintf(entry.message, sizeof(entry.message), fmt, args);
    va_end(args);
    push(entry);
}

void Logger::push(const LogEntry& entry) {
    if (!running_.load(std::memory_order_acquire)) {
        write(entry);
        return;
    }
    bool pushed;
    {
        std::lock_guard<std::mutex> lock(producer_mutex_);
        pushed = queue_.try_push(entry);
    }
    if (!pushed) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
    }
}

void Logger::write(const LogEntry& entry) {
    fprintf(output_, "[%s] [%lu] %s\n", log_level_name(entry.level),
            static_cast<unsigned long>(entry.timestamp_ns), entry.message);
}

void Logger::drain_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        if (queue_.drain([this](const LogEntry& entry) { write(entry); }) == 0) {
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
    }
}

} // namespace canonical
