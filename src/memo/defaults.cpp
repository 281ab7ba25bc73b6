/**
 * MEMENTO - Function Result Memoization
 * Defaults Implementation
 */

#include "memo/defaults.hpp"
#include "cache/memory_backend.hpp"
#include "util/logger.hpp"

#include <mutex>
#include <stdexcept>

namespace memento::memo {

namespace {

struct DefaultState {
    std::mutex mutex;
    config::Config config;
    std::shared_ptr<cache::Backend> backend;
};

DefaultState& state() {
    static DefaultState instance;
    return instance;
}

std::shared_ptr<cache::Backend> make_backend(const config::BackendSettings& settings) {
    cache::MemoryBackendConfig backend_config;
    backend_config.key_prefix = settings.key_prefix;
    backend_config.version = settings.version;
    backend_config.max_entries = settings.max_entries;
    return std::make_shared<cache::MemoryBackend>(backend_config);
}

} // anonymous namespace

std::chrono::seconds default_ttl() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return std::chrono::seconds(s.config.cache.default_ttl_seconds);
}

std::size_t default_max_key_length() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.config.cache.max_key_length;
}

std::shared_ptr<cache::Backend> default_backend() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.backend) {
        s.backend = make_backend(s.config.backend);
    }
    return s.backend;
}

void set_default_backend(std::shared_ptr<cache::Backend> backend) {
    if (!backend) {
        throw std::invalid_argument("set_default_backend: backend cannot be null");
    }
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.backend = std::move(backend);
}

void configure(const config::Config& config) {
    config.validate();

    util::Logger::init(config::ConfigManager::to_log_config(config.logging));

    auto backend = make_backend(config.backend);
    {
        auto& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        s.config = config;
        s.backend = std::move(backend);
    }

    MEMENTO_LOG_INFO(util::log_component::Config,
                     "Memoization defaults configured: ttl={}s, max_key_length={}, namespace='{}:{}'",
                     config.cache.default_ttl_seconds, config.cache.max_key_length,
                     config.backend.key_prefix, config.backend.version);
}

} // namespace memento::memo
