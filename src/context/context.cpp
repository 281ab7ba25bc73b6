/**
 * MEMENTO - Function Result Memoization
 * Context Implementation
 */

#include "context/context.hpp"

namespace memento::context {

namespace {

std::atomic<std::uint64_t> next_identity{1};

} // anonymous namespace

// ContextCache

std::optional<Value> ContextCache::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ContextCache::put(const std::string& key, Value value) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.insert_or_assign(key, std::move(value));
}

bool ContextCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.contains(key);
}

bool ContextCache::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

std::size_t ContextCache::erase_prefix(std::string_view prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (std::string_view(it->first).starts_with(prefix)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t ContextCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<std::string> ContextCache::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [key, value] : entries_) {
        result.push_back(key);
    }
    return result;
}

// Context

Context::Context()
    : identity_(next_identity.fetch_add(1, std::memory_order_relaxed)) {}

Context::~Context() = default;

ContextCache& Context::cache() {
    std::call_once(cache_once_, [this]() {
        cache_ = std::make_unique<ContextCache>();
        published_.store(cache_.get(), std::memory_order_release);
    });
    return *cache_;
}

ContextCache* Context::cache_if_present() const {
    return published_.load(std::memory_order_acquire);
}

// Request cache accessor

std::optional<Value> request_cache(Context& context, std::string_view key) {
    std::string full_key(kRequestCacheNamespace);
    full_key.append(key);
    return context.cache().get(full_key);
}

Value request_cache(Context& context, std::string_view key, Value value) {
    std::string full_key(kRequestCacheNamespace);
    full_key.append(key);
    context.cache().put(full_key, value);
    return value;
}

} // namespace memento::context
