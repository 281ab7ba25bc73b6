/**
 * MEMENTO - Function Result Memoization
 * Configuration System Implementation
 */

#include "config/config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace memento::config {

namespace log_component = util::log_component;

// JSON serialization implementations
void to_json(nlohmann::json& j, const CacheSettings& c) {
    j = nlohmann::json{
        {"default_ttl_seconds", c.default_ttl_seconds},
        {"max_key_length", c.max_key_length}
    };
}

void from_json(const nlohmann::json& j, CacheSettings& c) {
    if (j.contains("default_ttl_seconds")) j.at("default_ttl_seconds").get_to(c.default_ttl_seconds);
    if (j.contains("max_key_length")) j.at("max_key_length").get_to(c.max_key_length);
}

void to_json(nlohmann::json& j, const BackendSettings& b) {
    j = nlohmann::json{
        {"key_prefix", b.key_prefix},
        {"version", b.version},
        {"max_entries", b.max_entries}
    };
}

void from_json(const nlohmann::json& j, BackendSettings& b) {
    if (j.contains("key_prefix")) j.at("key_prefix").get_to(b.key_prefix);
    if (j.contains("version")) j.at("version").get_to(b.version);
    if (j.contains("max_entries")) j.at("max_entries").get_to(b.max_entries);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"name", l.name},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors},
        {"enable_events", l.enable_events}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("name")) j.at("name").get_to(l.name);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
    if (j.contains("enable_events")) j.at("enable_events").get_to(l.enable_events);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"cache", c.cache},
        {"backend", c.backend},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("cache")) j.at("cache").get_to(c.cache);
    if (j.contains("backend")) j.at("backend").get_to(c.backend);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

// Config validation
void Config::validate() const {
    if (backend.key_prefix.find(':') != std::string::npos) {
        throw std::runtime_error("Configuration error: backend.key_prefix cannot contain ':'");
    }
    if (backend.version == 0) {
        throw std::runtime_error("Configuration error: backend.version must be non-zero");
    }
    if (cache.max_key_length != 0 && cache.max_key_length < 64) {
        throw std::runtime_error("Configuration error: cache.max_key_length must be 0 or at least 64");
    }
    if (!util::Logger::parse_level(logging.level)) {
        throw std::runtime_error("Configuration error: unknown logging.level '" + logging.level + "'");
    }
    if (logging.name.empty()) {
        throw std::runtime_error("Configuration error: logging.name cannot be empty");
    }
    if (!logging.file.empty() && (logging.max_file_size_mb == 0 || logging.max_files == 0)) {
        throw std::runtime_error("Configuration error: logging.max_file_size_mb and logging.max_files must be non-zero");
    }
}

// ConfigManager implementation
ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

void ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    // Start with defaults
    config_ = Config{};
    config_path_ = path;

    if (config_path_.empty()) {
        if (auto env = get_env("MEMENTO_CONFIG")) {
            config_path_ = *env;
        }
    }

    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    apply_environment_overrides();

    config_.validate();

    MEMENTO_LOG_DEBUG(log_component::Config, "Configuration loaded successfully");
}

Config ConfigManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

std::filesystem::path ConfigManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

util::LogConfig ConfigManager::to_log_config(const LogSettings& settings) {
    auto level = util::Logger::parse_level(settings.level);
    if (!level) {
        throw std::runtime_error("Configuration error: unknown logging.level '" + settings.level + "'");
    }

    util::LogConfig log_config;
    log_config.level = *level;
    log_config.name = settings.name;
    log_config.file_path = settings.file;
    log_config.max_file_size_mb = settings.max_file_size_mb;
    log_config.max_files = settings.max_files;
    log_config.enable_console = settings.enable_console;
    log_config.enable_colors = settings.enable_colors;
    log_config.enable_events = settings.enable_events;
    return log_config;
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<Config>();
        MEMENTO_LOG_DEBUG(log_component::Config, "Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides() {
    if (auto env = get_env("MEMENTO_DEFAULT_TTL")) {
        try {
            config_.cache.default_ttl_seconds = static_cast<std::uint32_t>(std::stoul(*env));
            MEMENTO_LOG_DEBUG(log_component::Config, "Applied MEMENTO_DEFAULT_TTL={}", config_.cache.default_ttl_seconds);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid MEMENTO_DEFAULT_TTL value: " + *env);
        }
    }

    if (auto env = get_env("MEMENTO_MAX_KEY_LENGTH")) {
        try {
            config_.cache.max_key_length = std::stoul(*env);
            MEMENTO_LOG_DEBUG(log_component::Config, "Applied MEMENTO_MAX_KEY_LENGTH={}", config_.cache.max_key_length);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid MEMENTO_MAX_KEY_LENGTH value: " + *env);
        }
    }

    if (auto env = get_env("MEMENTO_KEY_PREFIX")) {
        config_.backend.key_prefix = *env;
        MEMENTO_LOG_DEBUG(log_component::Config, "Applied MEMENTO_KEY_PREFIX={}", config_.backend.key_prefix);
    }

    if (auto env = get_env("MEMENTO_KEY_VERSION")) {
        try {
            config_.backend.version = static_cast<std::uint32_t>(std::stoul(*env));
            MEMENTO_LOG_DEBUG(log_component::Config, "Applied MEMENTO_KEY_VERSION={}", config_.backend.version);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid MEMENTO_KEY_VERSION value: " + *env);
        }
    }

    if (auto env = get_env("MEMENTO_MAX_ENTRIES")) {
        try {
            config_.backend.max_entries = std::stoul(*env);
            MEMENTO_LOG_DEBUG(log_component::Config, "Applied MEMENTO_MAX_ENTRIES={}", config_.backend.max_entries);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid MEMENTO_MAX_ENTRIES value: " + *env);
        }
    }

    if (auto env = get_env("MEMENTO_LOG_LEVEL")) {
        config_.logging.level = *env;
        MEMENTO_LOG_DEBUG(log_component::Config, "Applied MEMENTO_LOG_LEVEL={}", config_.logging.level);
    }

    if (auto env = get_env("MEMENTO_LOG_FILE")) {
        config_.logging.file = *env;
        MEMENTO_LOG_DEBUG(log_component::Config, "Applied MEMENTO_LOG_FILE={}", config_.logging.file);
    }

    if (auto env = get_env("MEMENTO_LOG_EVENTS")) {
        config_.logging.enable_events = (*env == "1" || *env == "true" || *env == "yes");
        MEMENTO_LOG_DEBUG(log_component::Config, "Applied MEMENTO_LOG_EVENTS={}", config_.logging.enable_events);
    }
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace memento::config
