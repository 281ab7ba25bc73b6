/**
 * MEMENTO - Function Result Memoization
 * Defaults - Process-wide TTL and backend used by Memoized
 */

#ifndef MEMENTO_MEMO_DEFAULTS_HPP
#define MEMENTO_MEMO_DEFAULTS_HPP

#include "cache/backend.hpp"
#include "config/config.hpp"

#include <chrono>
#include <cstddef>
#include <memory>

namespace memento::memo {

/**
 * TTL for Memoized instances built without one (900 seconds unless configured)
 */
std::chrono::seconds default_ttl();

/**
 * Key length limit for Memoized instances built without one (0 = unlimited)
 */
std::size_t default_max_key_length();

/**
 * Shared backend for Memoized instances built without one.
 * A MemoryBackend built from the current settings on first use.
 */
std::shared_ptr<cache::Backend> default_backend();

void set_default_backend(std::shared_ptr<cache::Backend> backend);

/**
 * Apply a loaded configuration: default TTL, key length limit, a fresh
 * default MemoryBackend and the logger settings.
 * Memoized instances built earlier keep the backend they were given.
 *
 * @throws std::runtime_error if the configuration is invalid
 */
void configure(const config::Config& config);

} // namespace memento::memo

#endif // MEMENTO_MEMO_DEFAULTS_HPP
