#include <gtest/gtest.h>

#include "config/config.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace memento;
using config::Config;
using config::ConfigManager;

namespace {

const char* const kEnvironment[] = {
    "MEMENTO_CONFIG",
    "MEMENTO_DEFAULT_TTL",
    "MEMENTO_MAX_KEY_LENGTH",
    "MEMENTO_KEY_PREFIX",
    "MEMENTO_KEY_VERSION",
    "MEMENTO_MAX_ENTRIES",
    "MEMENTO_LOG_LEVEL",
    "MEMENTO_LOG_FILE",
    "MEMENTO_LOG_EVENTS",
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_environment(); }

    void TearDown() override {
        clear_environment();
        for (const auto& path : files_) {
            std::filesystem::remove(path);
        }
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        auto path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << content;
        files_.push_back(path);
        return path;
    }

private:
    static void clear_environment() {
        for (const char* name : kEnvironment) {
            unsetenv(name);
        }
    }

    std::vector<std::filesystem::path> files_;
};

} // anonymous namespace

TEST_F(ConfigTest, defaults) {
    ConfigManager manager;
    manager.load();

    auto config = manager.get_config();
    EXPECT_EQ(config.cache.default_ttl_seconds, 900u);
    EXPECT_EQ(config.cache.max_key_length, 0u);
    EXPECT_EQ(config.backend.key_prefix, "");
    EXPECT_EQ(config.backend.version, 1u);
    EXPECT_EQ(config.backend.max_entries, 0u);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_TRUE(manager.get_config_path().empty());
}

TEST_F(ConfigTest, loadFromFile) {
    auto path = write_file("memento_config_load.json", R"({
        "cache": {"default_ttl_seconds": 120, "max_key_length": 250},
        "backend": {"key_prefix": "shop", "version": 2, "max_entries": 1000},
        "logging": {"level": "debug", "enable_colors": false}
    })");

    ConfigManager manager;
    manager.load(path);

    auto config = manager.get_config();
    EXPECT_EQ(config.cache.default_ttl_seconds, 120u);
    EXPECT_EQ(config.cache.max_key_length, 250u);
    EXPECT_EQ(config.backend.key_prefix, "shop");
    EXPECT_EQ(config.backend.version, 2u);
    EXPECT_EQ(config.backend.max_entries, 1000u);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_FALSE(config.logging.enable_colors);

    // Unlisted fields keep their defaults
    EXPECT_EQ(config.logging.name, "memento");
    EXPECT_EQ(manager.get_config_path().string(), path.string());
}

TEST_F(ConfigTest, fileFromEnvironment) {
    auto path = write_file("memento_config_env.json", R"({"cache": {"default_ttl_seconds": 30}})");
    setenv("MEMENTO_CONFIG", path.c_str(), 1);

    ConfigManager manager;
    manager.load();
    EXPECT_EQ(manager.get_config().cache.default_ttl_seconds, 30u);
}

TEST_F(ConfigTest, environmentOverridesFile) {
    auto path = write_file("memento_config_override.json", R"({
        "cache": {"default_ttl_seconds": 120},
        "backend": {"key_prefix": "shop"}
    })");
    setenv("MEMENTO_DEFAULT_TTL", "45", 1);
    setenv("MEMENTO_KEY_PREFIX", "cart", 1);
    setenv("MEMENTO_KEY_VERSION", "7", 1);
    setenv("MEMENTO_MAX_ENTRIES", "50", 1);
    setenv("MEMENTO_MAX_KEY_LENGTH", "128", 1);
    setenv("MEMENTO_LOG_LEVEL", "warn", 1);
    setenv("MEMENTO_LOG_EVENTS", "true", 1);

    ConfigManager manager;
    manager.load(path);

    auto config = manager.get_config();
    EXPECT_EQ(config.cache.default_ttl_seconds, 45u);
    EXPECT_EQ(config.cache.max_key_length, 128u);
    EXPECT_EQ(config.backend.key_prefix, "cart");
    EXPECT_EQ(config.backend.version, 7u);
    EXPECT_EQ(config.backend.max_entries, 50u);
    EXPECT_EQ(config.logging.level, "warn");
    EXPECT_TRUE(config.logging.enable_events);
}

TEST_F(ConfigTest, invalidEnvironmentValue) {
    setenv("MEMENTO_DEFAULT_TTL", "soon", 1);
    ConfigManager manager;
    EXPECT_THROW(manager.load(), std::runtime_error);
}

TEST_F(ConfigTest, missingFile) {
    ConfigManager manager;
    EXPECT_THROW(manager.load("/nonexistent/memento.json"), std::runtime_error);
}

TEST_F(ConfigTest, malformedJson) {
    auto path = write_file("memento_config_bad.json", "{\"cache\": ");
    ConfigManager manager;
    EXPECT_THROW(manager.load(path), std::runtime_error);
}

TEST_F(ConfigTest, validation) {
    Config config;
    EXPECT_NO_THROW(config.validate());

    auto bad_prefix = config;
    bad_prefix.backend.key_prefix = "a:b";
    EXPECT_THROW(bad_prefix.validate(), std::runtime_error);

    auto bad_version = config;
    bad_version.backend.version = 0;
    EXPECT_THROW(bad_version.validate(), std::runtime_error);

    auto short_keys = config;
    short_keys.cache.max_key_length = 10;
    EXPECT_THROW(short_keys.validate(), std::runtime_error);

    auto bad_level = config;
    bad_level.logging.level = "loud";
    EXPECT_THROW(bad_level.validate(), std::runtime_error);

    auto no_name = config;
    no_name.logging.name.clear();
    EXPECT_THROW(no_name.validate(), std::runtime_error);

    auto no_rotation = config;
    no_rotation.logging.file = "memento.log";
    no_rotation.logging.max_files = 0;
    EXPECT_THROW(no_rotation.validate(), std::runtime_error);
}

TEST_F(ConfigTest, invalidFileContentRejected) {
    auto path = write_file("memento_config_invalid.json", R"({"backend": {"version": 0}})");
    ConfigManager manager;
    EXPECT_THROW(manager.load(path), std::runtime_error);
}

TEST_F(ConfigTest, jsonRoundTrip) {
    Config config;
    config.cache.default_ttl_seconds = 5;
    config.backend = {"svc", 3, 10};
    config.logging.level = "error";

    nlohmann::json j = config;
    auto parsed = j.get<Config>();
    EXPECT_EQ(parsed.cache.default_ttl_seconds, 5u);
    EXPECT_EQ(parsed.backend, config.backend);
    EXPECT_EQ(parsed.logging.level, "error");
}

TEST_F(ConfigTest, toLogConfig) {
    config::LogSettings settings;
    settings.level = "DEBUG";
    settings.file = "/tmp/memento.log";
    settings.max_files = 2;
    settings.enable_events = true;

    auto log_config = ConfigManager::to_log_config(settings);
    EXPECT_EQ(log_config.level, util::LogLevel::Debug);
    EXPECT_EQ(log_config.file_path, "/tmp/memento.log");
    EXPECT_EQ(log_config.max_files, 2u);
    EXPECT_TRUE(log_config.enable_events);

    settings.level = "verbose";
    EXPECT_THROW(ConfigManager::to_log_config(settings), std::runtime_error);
}

TEST(Logger, parseLevel) {
    EXPECT_EQ(util::Logger::parse_level("trace").value(), util::LogLevel::Trace);
    EXPECT_EQ(util::Logger::parse_level("Warn").value(), util::LogLevel::Warn);
    EXPECT_EQ(util::Logger::parse_level("off").value(), util::LogLevel::Off);
    EXPECT_FALSE(util::Logger::parse_level("chatty").has_value());
    EXPECT_EQ(util::Logger::level_to_string(util::LogLevel::Error), "error");
}

TEST(Logger, setLevel) {
    auto& logger = util::Logger::instance();
    auto previous = logger.get_level();

    logger.set_level(util::LogLevel::Critical);
    EXPECT_EQ(logger.get_level(), util::LogLevel::Critical);
    MEMENTO_LOG_INFO(util::log_component::Config, "suppressed {}", 1);

    logger.set_level(previous);
}

TEST(Logger, cacheEvents) {
    EXPECT_EQ(util::Logger::outcome_to_string(util::CacheOutcome::Hit), "HIT");
    EXPECT_EQ(util::Logger::outcome_to_string(util::CacheOutcome::Skip), "SKIP");

    util::LogConfig config;
    config.enable_console = false;
    config.enable_events = true;
    util::Logger::init(config);
    EXPECT_TRUE(util::Logger::instance().events_enabled());
    util::Logger::instance().event({util::CacheOutcome::Miss, "tests:f:", "tests:f:[1]",
                                    std::chrono::microseconds(12)});

    util::Logger::init(util::LogConfig{});
    EXPECT_FALSE(util::Logger::instance().events_enabled());
}
