/**
 * MEMENTO - Function Result Memoization
 * Context - Objects that own a private, lifetime-scoped result cache
 *
 * A context is whatever a cached result should live and die with: an
 * instance, a request, a session. Each context owns one ContextCache which is
 * created on first use and destroyed with the context; it never expires on
 * its own. Every memoized callable attached to a context shares its cache and
 * keeps to its own identity prefix.
 */

#ifndef MEMENTO_CONTEXT_CONTEXT_HPP
#define MEMENTO_CONTEXT_CONTEXT_HPP

#include "core/argument.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace memento::context {

using core::Value;

/**
 * Thread-safe key -> value mapping private to one context
 */
class ContextCache {
public:
    ContextCache() = default;

    // Non-copyable, non-movable
    ContextCache(const ContextCache&) = delete;
    ContextCache& operator=(const ContextCache&) = delete;

    std::optional<Value> get(const std::string& key) const;
    void put(const std::string& key, Value value);
    bool contains(const std::string& key) const;

    /**
     * @return true if an entry was removed
     */
    bool erase(const std::string& key);

    /**
     * Remove every entry whose key starts with prefix
     * @return Number of entries removed
     */
    std::size_t erase_prefix(std::string_view prefix);

    std::size_t size() const;
    std::vector<std::string> keys() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Value> entries_;
};

/**
 * Base class for context objects
 */
class Context {
public:
    Context();
    virtual ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    /**
     * Process-unique identity, never reused
     */
    std::uint64_t identity() const noexcept { return identity_; }

    /**
     * Private cache, created on first call (exactly once across threads)
     */
    ContextCache& cache();

    /**
     * Private cache if it has been created, nullptr otherwise
     */
    ContextCache* cache_if_present() const;

private:
    std::uint64_t identity_;
    std::once_flag cache_once_;
    std::unique_ptr<ContextCache> cache_;
    std::atomic<ContextCache*> published_{nullptr};
};

/**
 * A request-like context carrying the caller's identity
 */
class Request : public Context {
public:
    Request() = default;
    Request(Value user_id, std::string remote_addr)
        : user_id_(std::move(user_id)), remote_addr_(std::move(remote_addr)) {}

    const Value& user_id() const { return user_id_; }
    const std::string& remote_addr() const { return remote_addr_; }

private:
    Value user_id_;
    std::string remote_addr_;
};

// Namespace of request_cache() keys inside a context cache
inline constexpr std::string_view kRequestCacheNamespace = "memento.cache:request_cache:";

/**
 * Look up a value cached directly on a context
 */
std::optional<Value> request_cache(Context& context, std::string_view key);

/**
 * Cache a value directly on a context for the context's lifetime
 * @return The stored value
 */
Value request_cache(Context& context, std::string_view key, Value value);

} // namespace memento::context

#endif // MEMENTO_CONTEXT_CONTEXT_HPP
