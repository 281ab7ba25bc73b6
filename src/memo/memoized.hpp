/**
 * MEMENTO - Function Result Memoization
 * Memoized - Memoizing wrapper over a TTL backend
 *
 * Wraps a computation so that repeated calls with equivalent arguments are
 * served from a Backend for a fixed number of seconds.
 *
 * Per call:
 * - the key function returns the marker: compute, do not touch the backend
 * - hit: return the stored value
 * - miss: compute, store unless the result is the marker, return the result
 *
 * There is no locking here. Concurrent misses on one key compute the value
 * more than once and the last store wins; atomicity is whatever the backend
 * provides. Backend exceptions propagate to the caller.
 */

#ifndef MEMENTO_MEMO_MEMOIZED_HPP
#define MEMENTO_MEMO_MEMOIZED_HPP

#include "cache/backend.hpp"
#include "cache/cache_key.hpp"
#include "core/argument.hpp"
#include "core/cacheable.hpp"
#include "core/callable.hpp"
#include "core/signature.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace memento::memo {

using CallResult = core::Cacheable<core::Value>;

/**
 * The wrapped computation; receives the call bound to its signature
 */
using Function = std::function<CallResult(const core::BoundArguments&)>;

struct MemoizeOptions {
    std::optional<std::chrono::seconds> ttl;        // default_ttl() when unset
    std::shared_ptr<cache::Backend> backend;        // default_backend() when null
    cache::KeyFunction key{cache::default_key};
    std::optional<std::size_t> max_key_length;      // default_max_key_length() when unset
};

class Memoized {
public:
    /**
     * @throws std::invalid_argument on a malformed identity or signature, or
     *         a missing function or key function
     */
    Memoized(core::CallableIdentity identity, core::Signature signature,
             Function function, MemoizeOptions options = {});

    CallResult operator()(core::Arguments positional = {},
                          core::KeywordArguments keywords = {}) const {
        return call(core::Call{std::move(positional), std::move(keywords)});
    }

    CallResult call(const core::Call& call) const;

    /**
     * Delete the entry a call with these arguments would use; no-op on a miss
     */
    void erase(core::Arguments positional = {}, core::KeywordArguments keywords = {}) const {
        erase_call(core::Call{std::move(positional), std::move(keywords)});
    }

    void erase_call(const core::Call& call) const;

    /**
     * Delete every entry of this callable
     *
     * No-op if the backend cannot delete by prefix.
     */
    void clear() const;

    const core::CallableInfo& info() const { return info_; }
    const std::string& prefix() const { return info_.prefix(); }
    const std::shared_ptr<cache::Backend>& backend() const { return backend_; }
    std::chrono::seconds ttl() const { return ttl_; }

private:
    /**
     * Backend key for a call, nullopt when the key function returned the marker
     */
    std::optional<std::string> storage_key(const core::Call& call) const;

    CallResult invoke(const core::Call& call) const;

    core::CallableInfo info_;
    Function function_;
    std::shared_ptr<cache::Backend> backend_;
    std::chrono::seconds ttl_;
    cache::KeyFunction key_;
    std::size_t max_key_length_;
};

/**
 * Wrap a function with a TTL-backed cache
 */
Memoized memoize(core::CallableIdentity identity, core::Signature signature,
                 Function function, MemoizeOptions options = {});

} // namespace memento::memo

#endif // MEMENTO_MEMO_MEMOIZED_HPP
