/**
 * MEMENTO - Function Result Memoization
 * Configuration System - Supports JSON file and environment variables
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Environment variables (MEMENTO_*)
 * 2. Configuration file (JSON)
 * 3. Default values
 */

#ifndef MEMENTO_CONFIG_CONFIG_HPP
#define MEMENTO_CONFIG_CONFIG_HPP

#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace memento::config {

/**
 * Memoization defaults
 */
struct CacheSettings {
    std::uint32_t default_ttl_seconds{900};
    std::size_t max_key_length{0};  // 0 = keys are never shortened
};

/**
 * Default backend settings
 */
struct BackendSettings {
    std::string key_prefix;
    std::uint32_t version{1};
    std::size_t max_entries{0};  // 0 = unbounded

    bool operator==(const BackendSettings&) const = default;
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::string name{"memento"};
    std::string file;
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
    bool enable_events{false};
};

/**
 * Complete library configuration
 */
struct Config {
    CacheSettings cache;
    BackendSettings backend;
    LogSettings logging;

    /**
     * Validate configuration and throw if invalid
     */
    void validate() const;
};

/**
 * Configuration manager - loads file and environment settings
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Load configuration: defaults, then the JSON file (path, or
     * MEMENTO_CONFIG when path is empty), then environment overrides
     *
     * @throws std::runtime_error on configuration errors
     */
    void load(const std::filesystem::path& path = {});

    /**
     * Get the current configuration (thread-safe)
     */
    Config get_config() const;

    /**
     * Get the configuration file path (empty if none was used)
     */
    std::filesystem::path get_config_path() const;

    /**
     * Logger configuration for the given settings
     * @throws std::runtime_error on an unknown level
     */
    static util::LogConfig to_log_config(const LogSettings& settings);

private:
    void load_from_file(const std::filesystem::path& path);

    void apply_environment_overrides();

    static std::optional<std::string> get_env(const std::string& name);

    mutable std::mutex config_mutex_;
    Config config_;
    std::filesystem::path config_path_;
};

// JSON serialization support
void to_json(nlohmann::json& j, const CacheSettings& c);
void from_json(const nlohmann::json& j, CacheSettings& c);
void to_json(nlohmann::json& j, const BackendSettings& b);
void from_json(const nlohmann::json& j, BackendSettings& b);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace memento::config

#endif // MEMENTO_CONFIG_CONFIG_HPP
