/**
 * MEMENTO - Function Result Memoization
 * Memoized Implementation
 */

#include "memo/memoized.hpp"
#include "memo/defaults.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

namespace memento::memo {

using util::log_component::Memo;
using util::CacheOutcome;

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::microseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
}

} // anonymous namespace

Memoized::Memoized(core::CallableIdentity identity, core::Signature signature,
                   Function function, MemoizeOptions options)
    : info_(std::move(identity), std::move(signature))
    , function_(std::move(function))
    , backend_(options.backend ? std::move(options.backend) : default_backend())
    , ttl_(options.ttl.value_or(default_ttl()))
    , key_(std::move(options.key))
    , max_key_length_(options.max_key_length.value_or(default_max_key_length())) {
    if (!function_) {
        throw std::invalid_argument("Memoized: function is required for " + info_.prefix());
    }
    if (!key_) {
        throw std::invalid_argument("Memoized: key function is required for " + info_.prefix());
    }
    if (ttl_.count() < 0) {
        throw std::invalid_argument("Memoized: ttl cannot be negative for " + info_.prefix());
    }
    if (max_key_length_ != 0 && cache::compacted_length(info_.prefix()) > max_key_length_) {
        throw std::invalid_argument("Memoized: prefix " + info_.prefix() + " leaves no room for keys of " +
                                    std::to_string(max_key_length_) + " characters");
    }
}

std::optional<std::string> Memoized::storage_key(const core::Call& call) const {
    auto key = key_(info_, call);
    if (key.is_marker()) {
        return std::nullopt;
    }
    return cache::compact_key(key.value(), info_.prefix(), max_key_length_);
}

CallResult Memoized::invoke(const core::Call& call) const {
    core::BoundArguments bound(info_.signature(), core::bind(info_.signature(), call));
    return function_(bound);
}

CallResult Memoized::call(const core::Call& call) const {
    auto& logger = util::Logger::instance();

    auto key = storage_key(call);
    if (!key) {
        MEMENTO_LOG_DEBUG(Memo, "skipped cache check for {}", info_.prefix());
        auto start = Clock::now();
        auto result = invoke(call);
        logger.event({CacheOutcome::Skip, info_.prefix(), {}, since(start)});
        return result;
    }

    if (auto cached = backend_->get(*key)) {
        MEMENTO_LOG_DEBUG(Memo, "obtained the cached value for {} key", *key);
        logger.event({CacheOutcome::Hit, info_.prefix(), *key});
        return std::move(*cached);
    }

    MEMENTO_LOG_DEBUG(Memo, "calculated a new value for {} key", *key);
    auto start = Clock::now();
    auto result = invoke(call);
    logger.event({CacheOutcome::Miss, info_.prefix(), *key, since(start)});

    if (!result.is_marker()) {
        backend_->set(*key, result.value(), ttl_);
    }
    return result;
}

void Memoized::erase_call(const core::Call& call) const {
    auto key = storage_key(call);
    if (!key) {
        return;
    }
    MEMENTO_LOG_DEBUG(Memo, "cleared cache value for {} key", *key);
    backend_->remove(*key);
    util::Logger::instance().event({CacheOutcome::Erase, info_.prefix(), *key});
}

void Memoized::clear() const {
    auto removed = backend_->delete_prefix(info_.prefix());
    if (!removed) {
        MEMENTO_LOG_DEBUG(Memo, "backend cannot delete by prefix, clear of {} skipped", info_.prefix());
        return;
    }
    MEMENTO_LOG_DEBUG(Memo, "cleared {} cache values for {}", *removed, info_.prefix());
    util::Logger::instance().event({CacheOutcome::Clear, info_.prefix(), {}});
}

Memoized memoize(core::CallableIdentity identity, core::Signature signature,
                 Function function, MemoizeOptions options) {
    return Memoized(std::move(identity), std::move(signature),
                    std::move(function), std::move(options));
}

} // namespace memento::memo
