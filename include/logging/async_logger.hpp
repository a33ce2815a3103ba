#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <functional>
#include <mutex>
#include <thread>

namespace zonetrader {
namespace logging {

enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

namespace detail {
struct LevelName {
    LogLevel level;
    const char* config_name; // as written in config and on the command line
    const char* column;      // padded for the output column
};

inline constexpr std::array<LevelName, 6> LEVEL_NAMES{{
    {LogLevel::Trace, "trace", "TRACE"},
    {LogLevel::Debug, "debug", "DEBUG"},
    {LogLevel::Info, "info", "INFO "},
    {LogLevel::Warn, "warn", "WARN "},
    {LogLevel::Error, "error", "ERROR"},
    {LogLevel::Fatal, "fatal", "FATAL"},
}};
} // namespace detail

inline const char* level_to_string(LogLevel level) {
    for (const auto& n : detail::LEVEL_NAMES)
        if (n.level == level)
            return n.column;
    return "?????";
}

inline LogLevel level_from_string(const char* name, LogLevel fallback = LogLevel::Info) {
    for (const auto& n : detail::LEVEL_NAMES)
        if (std::strcmp(name, n.config_name) == 0)
            return n.level;
    return fallback;
}

// One category per engine component
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Pipeline = 1;
constexpr uint8_t Zones = 2;
constexpr uint8_t Analysis = 3;
constexpr uint8_t Decision = 4;
constexpr uint8_t Order = 5;
constexpr uint8_t Broker = 6;
constexpr uint8_t Distributor = 7;
constexpr uint8_t Api = 8;
constexpr uint8_t Count = 9;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    static constexpr const char* names[LogCategory::Count] = {
        "system", "pipeline", "zones", "analysis", "decision", "order", "broker", "distributor", "api",
    };
    return category < LogCategory::Count ? names[category] : "other";
}

/**
 * One log line as it travels through the ring. Fixed size so pushing
 * never allocates; longer messages are cut at 111 characters.
 */
struct alignas(64) LogEntry {
    uint64_t timestamp_ms; // wall clock, UTC
    LogLevel level;
    uint8_t category;
    uint16_t reserved;
    uint32_t thread_id; // small per-process sequence, 1 for the first thread that logs
    char message[112];

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) == 128, "LogEntry must be 128 bytes");

/**
 * Bounded single-producer single-consumer queue of log entries.
 *
 * Positions are free-running counters; the slot is the counter masked
 * by Capacity - 1, so all Capacity slots are usable.
 */
template <size_t Capacity = 8192>
class LogRing {
public:
    static_assert(Capacity > 0 && (Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    bool push(const LogEntry& entry) {
        const uint64_t write = write_pos_.load(std::memory_order_relaxed);
        if (write - read_pos_.load(std::memory_order_acquire) == Capacity)
            return false;
        slots_[write & (Capacity - 1)] = entry;
        write_pos_.store(write + 1, std::memory_order_release);
        return true;
    }

    bool pop(LogEntry& entry) {
        const uint64_t read = read_pos_.load(std::memory_order_relaxed);
        if (read == write_pos_.load(std::memory_order_acquire))
            return false;
        entry = slots_[read & (Capacity - 1)];
        read_pos_.store(read + 1, std::memory_order_release);
        return true;
    }

    size_t size() const {
        return static_cast<size_t>(write_pos_.load(std::memory_order_acquire) -
                                   read_pos_.load(std::memory_order_acquire));
    }

    static constexpr size_t capacity() { return Capacity; }

private:
    alignas(64) std::atomic<uint64_t> write_pos_{0};
    alignas(64) std::atomic<uint64_t> read_pos_{0};
    std::array<LogEntry, Capacity> slots_;
};

/**
 * Async Logger
 *
 * Components receive an AsyncLogger* at construction; a null logger means
 * the component logs nothing. Callers format into a fixed entry under a
 * short producer lock; a background thread writes entries to stderr (or
 * the output callback) so replay threads never block on I/O. When the
 * ring is full the entry is dropped and counted.
 *
 *   AsyncLogger logger;
 *   logger.set_min_level(level_from_string(cfg.log_level.c_str()));
 *   logger.start();
 *   LOGF_INFO(&logger, LogCategory::Pipeline, "replay %s done", date);
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;
    static constexpr auto IDLE_WAIT = std::chrono::milliseconds(20);

    AsyncLogger() = default;
    ~AsyncLogger() { stop(); }

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void start() {
        if (running_.exchange(true))
            return;
        writer_ = std::thread([this] { write_loop(); });
    }

    // Joins the writer thread, then writes whatever it left behind
    void stop() {
        if (running_.exchange(false)) {
            wake_.notify_one();
            if (writer_.joinable())
                writer_.join();
        }
        flush();
    }

    /**
     * Write pending entries on the calling thread. Does nothing while the
     * writer thread owns the consumer side.
     */
    void flush() {
        if (running_.load())
            return;
        drain();
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (level < min_level_.load(std::memory_order_relaxed))
            return;

        LogEntry entry;
        entry.timestamp_ms = wall_clock_ms();
        entry.level = level;
        entry.category = category;
        entry.reserved = 0;
        entry.thread_id = current_thread_number();
        entry.set_message(message);

        bool was_empty;
        bool pushed;
        {
            std::lock_guard<std::mutex> lock(producer_mutex_);
            was_empty = ring_.size() == 0;
            pushed = ring_.push(entry);
        }
        if (!pushed) {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        total_logged_.fetch_add(1, std::memory_order_relaxed);
        if (was_empty)
            wake_.notify_one();
    }

    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level_.load(std::memory_order_relaxed))
            return;
        char text[sizeof(LogEntry::message)];
        std::snprintf(text, sizeof(text), fmt, args...);
        log(level, category, text);
    }

    void set_min_level(LogLevel level) { min_level_.store(level); }
    LogLevel min_level() const { return min_level_.load(); }

    // Set before start(); the writer thread reads it without locking
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }

    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    size_t pending_count() const { return ring_.size(); }

    /**
     * Render an entry the way the default sink prints it:
     *   2024-03-14T13:30:00.250Z INFO  [pipeline] t1 message
     */
    static int format_line(const LogEntry& entry, char* out, size_t size) {
        std::time_t seconds = static_cast<std::time_t>(entry.timestamp_ms / 1000);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        return std::snprintf(out, size, "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ %s [%s] t%u %s", utc.tm_year + 1900,
                             utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec,
                             static_cast<unsigned>(entry.timestamp_ms % 1000), level_to_string(entry.level),
                             category_to_string(entry.category), static_cast<unsigned>(entry.thread_id),
                             entry.message);
    }

private:
    LogRing<8192> ring_;
    std::mutex producer_mutex_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::atomic<bool> running_{false};
    std::thread writer_;
    std::atomic<LogLevel> min_level_{LogLevel::Info};
    OutputCallback output_callback_;

    std::atomic<uint64_t> dropped_count_{0};
    std::atomic<uint64_t> total_logged_{0};

    void write_loop() {
        while (running_.load(std::memory_order_relaxed)) {
            drain();
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_.wait_for(lock, IDLE_WAIT, [this] { return ring_.size() > 0 || !running_.load(); });
        }
    }

    void drain() {
        LogEntry entry;
        while (ring_.pop(entry))
            write_entry(entry);
    }

    void write_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
            return;
        }
        char line[256];
        format_line(entry, line, sizeof(line));
        std::fprintf(stderr, "%s\n", line);
    }

    static uint64_t wall_clock_ms() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                         std::chrono::system_clock::now().time_since_epoch())
                                         .count());
    }

    static uint32_t current_thread_number() {
        static std::atomic<uint32_t> next{1};
        thread_local uint32_t number = next.fetch_add(1, std::memory_order_relaxed);
        return number;
    }
};

// `logger` is an AsyncLogger* and may be null; nothing is formatted for a null logger
#define ZONETRADER_LOG_AT(logger, level, cat, msg)                                                                     \
    do {                                                                                                               \
        if (zonetrader::logging::AsyncLogger* zt_log_ = (logger))                                                      \
            zt_log_->log(zonetrader::logging::LogLevel::level, cat, msg);                                              \
    } while (0)
#define ZONETRADER_LOGF_AT(logger, level, cat, fmt, ...)                                                               \
    do {                                                                                                               \
        if (zonetrader::logging::AsyncLogger* zt_log_ = (logger))                                                      \
            zt_log_->logf(zonetrader::logging::LogLevel::level, cat, fmt, ##__VA_ARGS__);                              \
    } while (0)

#define LOG_TRACE(logger, cat, msg) ZONETRADER_LOG_AT(logger, Trace, cat, msg)
#define LOG_DEBUG(logger, cat, msg) ZONETRADER_LOG_AT(logger, Debug, cat, msg)
#define LOG_INFO(logger, cat, msg) ZONETRADER_LOG_AT(logger, Info, cat, msg)
#define LOG_WARN(logger, cat, msg) ZONETRADER_LOG_AT(logger, Warn, cat, msg)
#define LOG_ERROR(logger, cat, msg) ZONETRADER_LOG_AT(logger, Error, cat, msg)

#define LOGF_DEBUG(logger, cat, fmt, ...) ZONETRADER_LOGF_AT(logger, Debug, cat, fmt, ##__VA_ARGS__)
#define LOGF_INFO(logger, cat, fmt, ...) ZONETRADER_LOGF_AT(logger, Info, cat, fmt, ##__VA_ARGS__)
#define LOGF_WARN(logger, cat, fmt, ...) ZONETRADER_LOGF_AT(logger, Warn, cat, fmt, ##__VA_ARGS__)
#define LOGF_ERROR(logger, cat, fmt, ...) ZONETRADER_LOGF_AT(logger, Error, cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace zonetrader
