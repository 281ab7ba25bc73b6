/**
 * MEMENTO - Function Result Memoization
 * Cache Key - Key derivation for memoized calls
 *
 * A key function turns a callable and a call into a cache key, or into the
 * do-not-cache marker. Keys always start with the callable's identity prefix
 * so a callable's entries can be removed by prefix.
 *
 * Provided key functions:
 * - default_key: prefix + representation of the bound arguments, minus the
 *   context argument
 * - static_key: prefix + the "cachekey" keyword argument (or nothing)
 * - request_user_ip_key: prefix + the request's user id and remote address
 */

#ifndef MEMENTO_CACHE_CACHE_KEY_HPP
#define MEMENTO_CACHE_CACHE_KEY_HPP

#include "core/argument.hpp"
#include "core/cacheable.hpp"
#include "core/callable.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace memento::cache {

using KeyResult = core::Cacheable<std::string>;

/**
 * Key function contract: (callable, call) -> key | marker
 */
using KeyFunction = std::function<KeyResult(const core::CallableInfo&, const core::Call&)>;

/**
 * Argument-sensitive key
 *
 * Calls that bind to the same argument vector produce the same key; the
 * context argument, if the callable declares one, is left out.
 *
 * @throws core::BindingError if the call does not match the signature
 */
KeyResult default_key(const core::CallableInfo& info, const core::Call& call);

/**
 * Argument-independent key
 *
 * Uses the string keyword argument "cachekey" as a bucket name so one
 * callable can keep several cache entries.
 *
 * @throws core::BindingError if the bucket name starts with '#', which is
 *         reserved for compacted keys
 */
KeyResult static_key(const core::CallableInfo& info, const core::Call& call);

/**
 * Key from the request's user id and remote address only
 *
 * The request is the first positional argument, or the parameter named
 * "request", or the first bound argument.
 *
 * @throws core::BindingError if no Request context is found
 */
KeyResult request_user_ip_key(const core::CallableInfo& info, const core::Call& call);

/**
 * Shorten a key for length-limited stores
 *
 * When max_length is non-zero and the key is longer, everything after prefix
 * is replaced by '#' and the XXH64 hash of it in hex. The prefix is kept so
 * prefix deletion still matches. A key that would not get shorter is returned
 * unchanged; compacted_length() tells whether a prefix fits at all.
 */
std::string compact_key(const std::string& key, std::string_view prefix, std::size_t max_length);

/**
 * Length of any key compacted under prefix
 */
constexpr std::size_t compacted_length(std::string_view prefix) noexcept {
    return prefix.size() + 17; // '#' + 16 hex digits
}

} // namespace memento::cache

#endif // MEMENTO_CACHE_CACHE_KEY_HPP
