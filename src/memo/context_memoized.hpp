/**
 * MEMENTO - Function Result Memoization
 * Context Memoized - Memoizing wrapper scoped to a context object
 *
 * Results are stored in the private cache of the context passed to the call
 * (an instance, a request) and live exactly as long as that context. The
 * context argument is found by parameter name ("instance" by default), or is
 * the first parameter when no parameter has that name, as for a method's
 * self argument. It is left out of the key.
 *
 * A call whose context argument is null runs uncached.
 */

#ifndef MEMENTO_MEMO_CONTEXT_MEMOIZED_HPP
#define MEMENTO_MEMO_CONTEXT_MEMOIZED_HPP

#include "cache/cache_key.hpp"
#include "context/context.hpp"
#include "core/argument.hpp"
#include "core/callable.hpp"
#include "core/signature.hpp"
#include "memo/memoized.hpp"

#include <cstddef>
#include <string>

namespace memento::memo {

inline constexpr const char* kInstanceParameter = "instance";
inline constexpr const char* kRequestParameter = "request";

struct ContextMemoizeOptions {
    std::string context_parameter{kInstanceParameter};
    cache::KeyFunction key{cache::default_key};
};

class ContextMemoized {
public:
    /**
     * @throws std::invalid_argument on a malformed identity, an empty
     *         signature, or a missing function or key function
     */
    ContextMemoized(core::CallableIdentity identity, core::Signature signature,
                    Function function, ContextMemoizeOptions options = {});

    CallResult operator()(core::Arguments positional = {},
                          core::KeywordArguments keywords = {}) const {
        return call(core::Call{std::move(positional), std::move(keywords)});
    }

    CallResult call(const core::Call& call) const;

    /**
     * Delete one entry from a context's cache; no-op on a miss
     *
     * The arguments are those of a call without the context argument.
     */
    void erase(const core::ContextPtr& context, core::Arguments positional = {},
               core::KeywordArguments keywords = {}) const;

    /**
     * Delete this callable's entries from a context's cache
     */
    void clear(const core::ContextPtr& context) const;

    /**
     * The context's private cache, shared with every callable on it
     */
    context::ContextCache& cache(context::Context& context) const { return context.cache(); }

    const core::CallableInfo& info() const { return info_; }
    const std::string& prefix() const { return info_.prefix(); }
    std::size_t context_index() const { return *info_.context_index(); }
    const std::string& context_parameter() const { return context_parameter_; }

private:
    CallResult invoke(const core::Signature& signature, core::Arguments bound) const;

    core::CallableInfo info_;
    std::string context_parameter_;
    Function function_;
    cache::KeyFunction key_;
};

/**
 * Wrap a function with a cache bound to an instance-like argument
 */
ContextMemoized memoize_in_context(core::CallableIdentity identity, core::Signature signature,
                                   Function function, ContextMemoizeOptions options = {});

/**
 * Wrap a function with a cache bound to its "request" argument
 */
ContextMemoized memoize_in_request(core::CallableIdentity identity, core::Signature signature,
                                   Function function, cache::KeyFunction key = cache::default_key);

} // namespace memento::memo

#endif // MEMENTO_MEMO_CONTEXT_MEMOIZED_HPP
