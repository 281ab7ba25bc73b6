/**
 * MEMENTO - Function Result Memoization
 * Logger - Component-tagged logging with spdlog
 *
 * Provides:
 * - Levels (TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL)
 * - Log format: timestamp, level, [component] message
 * - Console sink (colored) and rotating file sink
 * - Cache event log: one line per memoized call decision
 *   (outcome, callable, key, computation time)
 */

#ifndef MEMENTO_UTIL_LOGGER_HPP
#define MEMENTO_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace memento::util {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logging configuration
 */
struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string name{"memento"};       // spdlog logger name
    std::string file_path;             // Empty for console only
    std::size_t max_file_size_mb{100}; // Max size before rotation
    std::size_t max_files{5};          // Number of rotated files to keep
    bool enable_console{true};
    bool enable_colors{true};
    bool enable_events{false};         // Cache event log, "<name>.events"
};

/**
 * What a memoized call did with its cache
 */
enum class CacheOutcome {
    Hit,    // Served from the store
    Miss,   // Computed (and stored unless the result was the marker)
    Skip,   // Computed without touching the store
    Erase,  // One entry deleted
    Clear   // Entries deleted by prefix
};

/**
 * Cache event log entry
 */
struct CacheEvent {
    CacheOutcome outcome{CacheOutcome::Miss};
    std::string_view callable;                  // Identity prefix
    std::string_view key;                       // Empty when there is none
    std::chrono::microseconds elapsed{0};       // Computation time
};

/**
 * Logger class - centralized logging with component tagging
 *
 * Thread-safe singleton. The first call to instance() sets up a console
 * logger at INFO level; init() can replace it at any time.
 */
class Logger {
public:
    /**
     * (Re)configure the logger
     */
    static void init(const LogConfig& config);

    /**
     * Get the logger instance (creates default if not initialized)
     */
    static Logger& instance();

    ~Logger();

    void set_level(LogLevel level);
    LogLevel get_level() const;

    /**
     * Parse log level from string (case-insensitive)
     * Valid values: trace, debug, info, warn, error, critical, off
     */
    static std::optional<LogLevel> parse_level(std::string_view level_str);

    static std::string_view level_to_string(LogLevel level);

    static std::string_view outcome_to_string(CacheOutcome outcome);

    // Component-tagged logging methods
    template<typename... Args>
    void trace(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Critical, component, fmt, std::forward<Args>(args)...);
    }

    /**
     * Write a cache event line; no-op unless events are enabled
     */
    void event(const CacheEvent& entry);

    bool events_enabled() const { return events_enabled_.load(std::memory_order_relaxed); }

    void flush();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LogConfig& config);

    struct Sinks {
        std::shared_ptr<spdlog::logger> main;
        std::shared_ptr<spdlog::logger> events;
    };

    Sinks current() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return Sinks{logger_, event_logger_};
    }

    template<typename... Args>
    void log(LogLevel level, std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (level < current_level_.load(std::memory_order_relaxed)) return;

        auto logger = current().main;
        if (!logger) return;

        auto msg = fmt::format(fmt, std::forward<Args>(args)...);
        logger->log(to_spdlog_level(level), "[{}] {}", component, msg);
    }

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> event_logger_;
    std::atomic<LogLevel> current_level_{LogLevel::Info};
    std::atomic<bool> events_enabled_{false};
    mutable std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

// Convenience macros for logging with automatic component tagging
#define MEMENTO_LOG_TRACE(component, ...) \
    ::memento::util::Logger::instance().trace(component, __VA_ARGS__)
#define MEMENTO_LOG_DEBUG(component, ...) \
    ::memento::util::Logger::instance().debug(component, __VA_ARGS__)
#define MEMENTO_LOG_INFO(component, ...) \
    ::memento::util::Logger::instance().info(component, __VA_ARGS__)
#define MEMENTO_LOG_WARN(component, ...) \
    ::memento::util::Logger::instance().warn(component, __VA_ARGS__)
#define MEMENTO_LOG_ERROR(component, ...) \
    ::memento::util::Logger::instance().error(component, __VA_ARGS__)
#define MEMENTO_LOG_CRITICAL(component, ...) \
    ::memento::util::Logger::instance().critical(component, __VA_ARGS__)

// Component constants
namespace log_component {
    constexpr std::string_view Memo = "memo";
    constexpr std::string_view Backend = "backend";
    constexpr std::string_view Config = "config";
}

} // namespace memento::util

#endif // MEMENTO_UTIL_LOGGER_HPP
