/**
 * MEMENTO - Function Result Memoization
 * Memory Backend - Thread-safe in-process TTL store
 *
 * Features:
 * - Thread-safe with std::shared_mutex (concurrent reads, exclusive writes)
 * - Versioned key namespace: "<key_prefix>:<version>:<key>"
 * - Per-entry TTL, 0 (or one past the clock's range) means the entry never expires
 * - Optional LRU eviction by entry count
 * - Prefix deletion, so Memoized::clear() works
 * - Statistics for monitoring
 */

#ifndef MEMENTO_CACHE_MEMORY_BACKEND_HPP
#define MEMENTO_CACHE_MEMORY_BACKEND_HPP

#include "cache/backend.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace memento::cache {

/**
 * Backend statistics
 */
struct BackendStats {
    std::uint64_t hits{0};          // Total lookups that found a live entry
    std::uint64_t misses{0};        // Total lookups that found nothing
    std::uint64_t evictions{0};     // Total LRU evictions
    std::uint64_t expired{0};       // Total expired entries removed

    std::size_t entries{0};         // Current number of entries
    std::size_t max_entries{0};     // Entry bound, 0 = unbounded

    double hit_rate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

/**
 * Memory backend configuration
 */
struct MemoryBackendConfig {
    std::string key_prefix;         // Namespace prepended to every key
    std::uint32_t version{1};       // Bump to invalidate every existing key
    std::size_t max_entries{0};     // 0 = unbounded
};

class MemoryBackend : public Backend {
public:
    explicit MemoryBackend(MemoryBackendConfig config = {});
    ~MemoryBackend() override = default;

    // Non-copyable, non-movable
    MemoryBackend(const MemoryBackend&) = delete;
    MemoryBackend& operator=(const MemoryBackend&) = delete;
    MemoryBackend(MemoryBackend&&) = delete;
    MemoryBackend& operator=(MemoryBackend&&) = delete;

    std::optional<Value> get(const std::string& key) override;
    void set(const std::string& key, const Value& value, std::chrono::seconds ttl) override;
    void remove(const std::string& key) override;
    std::optional<std::size_t> delete_prefix(const std::string& prefix) override;

    void delete_many(const std::vector<std::string>& keys);

    /**
     * Remove every entry, regardless of namespace
     */
    void clear();

    /**
     * Number of stored entries, including ones that expired but were not
     * yet collected
     */
    std::size_t size() const;

    BackendStats get_stats() const;

    /**
     * Full stored key for a caller key
     */
    std::string make_key(const std::string& key) const;

    const MemoryBackendConfig& config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    struct Node {
        std::string key;
        Value value;
        std::optional<Clock::time_point> expires_at;  // nullopt = never
    };

    using LruList = std::list<Node>;
    using EntryMap = std::unordered_map<std::string, LruList::iterator>;

    /**
     * Must be called with exclusive lock held
     */
    void erase_node(EntryMap::iterator it);

    /**
     * Evict from the LRU end until within max_entries
     * Must be called with exclusive lock held
     */
    void evict_if_needed();

    static bool is_expired(const Node& node, Clock::time_point now);

    mutable std::shared_mutex mutex_;
    MemoryBackendConfig config_;
    std::string namespace_;  // "<key_prefix>:<version>:"

    LruList lru_list_;  // Front = most recently used
    EntryMap entries_;

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::uint64_t> expired_{0};
};

} // namespace memento::cache

#endif // MEMENTO_CACHE_MEMORY_BACKEND_HPP
