/**
 * MEMENTO - Function Result Memoization
 * Backend - Key-value store contract consumed by memoized callables
 *
 * Minimum interface:
 * - get: value or nullopt when absent
 * - set: store with a seconds-based expiry
 * - remove: delete a key, no-op if absent
 * - delete_prefix: optional bulk deletion, enables Memoized::clear()
 *
 * Implementations report I/O or serialization failures by throwing
 * BackendError; memoized callables never catch or retry them.
 */

#ifndef MEMENTO_CACHE_BACKEND_HPP
#define MEMENTO_CACHE_BACKEND_HPP

#include "core/argument.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace memento::cache {

using core::Value;

class BackendError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Backend {
public:
    virtual ~Backend() = default;

    virtual std::optional<Value> get(const std::string& key) = 0;

    virtual void set(const std::string& key, const Value& value, std::chrono::seconds ttl) = 0;

    virtual void remove(const std::string& key) = 0;

    /**
     * Delete every key starting with prefix
     *
     * @return Number of keys removed, or nullopt if the backend cannot
     *         delete by prefix
     */
    virtual std::optional<std::size_t> delete_prefix(const std::string& prefix) {
        (void)prefix;
        return std::nullopt;
    }
};

} // namespace memento::cache

#endif // MEMENTO_CACHE_BACKEND_HPP
