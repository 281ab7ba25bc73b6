/**
 * MEMENTO - Function Result Memoization
 * Memory Backend Implementation
 */

#include "cache/memory_backend.hpp"
#include "util/logger.hpp"

#include <stdexcept>

namespace memento::cache {

namespace log_component = util::log_component;

MemoryBackend::MemoryBackend(MemoryBackendConfig config)
    : config_(std::move(config)) {
    if (config_.key_prefix.find(':') != std::string::npos) {
        throw std::invalid_argument("MemoryBackend: key_prefix cannot contain ':'");
    }
    namespace_ = config_.key_prefix + ":" + std::to_string(config_.version) + ":";

    MEMENTO_LOG_DEBUG(log_component::Backend, "Memory backend initialized: namespace='{}', max_entries={}",
                      namespace_, config_.max_entries);
}

std::string MemoryBackend::make_key(const std::string& key) const {
    return namespace_ + key;
}

std::optional<Value> MemoryBackend::get(const std::string& key) {
    auto full_key = make_key(key);

    // Exclusive lock: a hit reorders the LRU list, an expired entry is removed
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(full_key);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }

    if (is_expired(*it->second, Clock::now())) {
        erase_node(it);
        ++expired_;
        ++misses_;
        return std::nullopt;
    }

    if (it->second != lru_list_.begin()) {
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    }
    ++hits_;
    return it->second->value;
}

void MemoryBackend::set(const std::string& key, const Value& value, std::chrono::seconds ttl) {
    if (ttl.count() < 0) {
        throw std::invalid_argument("MemoryBackend: ttl cannot be negative");
    }

    auto full_key = make_key(key);
    std::optional<Clock::time_point> expires_at;
    if (ttl.count() > 0) {
        auto now = Clock::now();
        // A ttl past the clock's range never expires
        auto headroom = std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max() - now);
        if (ttl < headroom) {
            expires_at = now + ttl;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(full_key);
    if (it != entries_.end()) {
        it->second->value = value;
        it->second->expires_at = expires_at;
        if (it->second != lru_list_.begin()) {
            lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        }
        MEMENTO_LOG_TRACE(log_component::Backend, "Entry updated: key={}", full_key);
    } else {
        lru_list_.push_front(Node{full_key, value, expires_at});
        entries_.emplace(full_key, lru_list_.begin());
        MEMENTO_LOG_TRACE(log_component::Backend, "Entry added: key={}, entries={}", full_key, entries_.size());
    }

    evict_if_needed();
}

void MemoryBackend::remove(const std::string& key) {
    auto full_key = make_key(key);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(full_key);
    if (it != entries_.end()) {
        erase_node(it);
        MEMENTO_LOG_TRACE(log_component::Backend, "Entry removed: key={}", full_key);
    }
}

void MemoryBackend::delete_many(const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        remove(key);
    }
}

std::optional<std::size_t> MemoryBackend::delete_prefix(const std::string& prefix) {
    // An empty prefix would wipe the whole namespace
    if (prefix.empty()) {
        return std::size_t{0};
    }

    auto full_prefix = make_key(prefix);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (it->first.starts_with(full_prefix)) {
            lru_list_.erase(it->second);
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    MEMENTO_LOG_DEBUG(log_component::Backend, "Deleted {} entries with prefix {}", removed, full_prefix);
    return removed;
}

void MemoryBackend::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::size_t count = entries_.size();
    entries_.clear();
    lru_list_.clear();

    MEMENTO_LOG_INFO(log_component::Backend, "Memory backend cleared: {} entries removed", count);
}

std::size_t MemoryBackend::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

BackendStats MemoryBackend::get_stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    BackendStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.evictions = evictions_.load();
    stats.expired = expired_.load();
    stats.entries = entries_.size();
    stats.max_entries = config_.max_entries;

    return stats;
}

void MemoryBackend::erase_node(EntryMap::iterator it) {
    lru_list_.erase(it->second);
    entries_.erase(it);
}

void MemoryBackend::evict_if_needed() {
    if (config_.max_entries == 0) {
        return;
    }

    while (entries_.size() > config_.max_entries && !lru_list_.empty()) {
        auto& lru_node = lru_list_.back();

        MEMENTO_LOG_TRACE(log_component::Backend, "Evicting entry: key={}", lru_node.key);

        entries_.erase(lru_node.key);
        lru_list_.pop_back();

        ++evictions_;
    }
}

bool MemoryBackend::is_expired(const Node& node, Clock::time_point now) {
    return node.expires_at && now >= *node.expires_at;
}

} // namespace memento::cache
