/**
 * MEMENTO - Function Result Memoization
 * Logger Implementation
 */

#include "util/logger.hpp"

#include <array>
#include <cctype>
#include <utility>
#include <vector>

namespace memento::util {

std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::init_flag_;

namespace {

constexpr std::array<std::pair<std::string_view, LogLevel>, 12> kLevelNames{{
    {"trace", LogLevel::Trace},
    {"debug", LogLevel::Debug},
    {"info", LogLevel::Info},
    {"warn", LogLevel::Warn},
    {"warning", LogLevel::Warn},
    {"error", LogLevel::Error},
    {"err", LogLevel::Error},
    {"critical", LogLevel::Critical},
    {"crit", LogLevel::Critical},
    {"fatal", LogLevel::Critical},
    {"off", LogLevel::Off},
    {"none", LogLevel::Off},
}};

std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.enable_colors) {
            console_sink->set_color_mode(spdlog::color_mode::never);
        }
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (!config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(file_sink);
    }

    return sinks;
}

} // anonymous namespace

void Logger::init(const LogConfig& config) {
    // instance() builds the default logger once; this replaces it
    instance().configure(config);
}

Logger& Logger::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(LogConfig{});
    });
    return *instance_;
}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LogConfig& config) {
    auto sinks = make_sinks(config);

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_level(to_spdlog_level(config.level));
    logger->flush_on(spdlog::level::warn);

    // Same sinks, own level: events are written whatever the main level is
    std::shared_ptr<spdlog::logger> events;
    if (config.enable_events) {
        events = std::make_shared<spdlog::logger>(config.name + ".events", sinks.begin(), sinks.end());
        events->set_level(spdlog::level::info);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& old : {logger_, event_logger_}) {
        if (old) {
            old->flush();
            spdlog::drop(old->name());
        }
    }

    logger_ = std::move(logger);
    event_logger_ = std::move(events);
    spdlog::drop(logger_->name());
    spdlog::register_logger(logger_);

    current_level_.store(config.level, std::memory_order_relaxed);
    events_enabled_.store(event_logger_ != nullptr, std::memory_order_relaxed);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
    }
    current_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::get_level() const {
    return current_level_.load(std::memory_order_relaxed);
}

std::optional<LogLevel> Logger::parse_level(std::string_view level_str) {
    std::string lower(level_str);
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    for (const auto& [name, level] : kLevelNames) {
        if (name == lower) {
            return level;
        }
    }
    return std::nullopt;
}

std::string_view Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "trace";
        case LogLevel::Debug:    return "debug";
        case LogLevel::Info:     return "info";
        case LogLevel::Warn:     return "warn";
        case LogLevel::Error:    return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off:      return "off";
    }
    return "unknown";
}

std::string_view Logger::outcome_to_string(CacheOutcome outcome) {
    switch (outcome) {
        case CacheOutcome::Hit:   return "HIT";
        case CacheOutcome::Miss:  return "MISS";
        case CacheOutcome::Skip:  return "SKIP";
        case CacheOutcome::Erase: return "ERASE";
        case CacheOutcome::Clear: return "CLEAR";
    }
    return "UNKNOWN";
}

void Logger::event(const CacheEvent& entry) {
    if (!events_enabled()) return;

    auto events = current().events;
    if (!events) return;

    // Example: MISS app.reports:monthly: app.reports:monthly:[2024,3] 1520us
    events->info("{} {} {} {}us",
                 outcome_to_string(entry.outcome),
                 entry.callable.empty() ? "-" : entry.callable,
                 entry.key.empty() ? "-" : entry.key,
                 entry.elapsed.count());
}

void Logger::flush() {
    auto sinks = current();
    if (sinks.main) {
        sinks.main->flush();
    }
    if (sinks.events) {
        sinks.events->flush();
    }
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace memento::util
