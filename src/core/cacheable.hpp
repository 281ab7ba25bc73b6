/**
 * MEMENTO - Function Result Memoization
 * Cacheable - A value or the do-not-cache marker
 *
 * Key functions and wrapped computations both return Cacheable<T>. Holding
 * DoNotCache instead of a T means:
 * - from a key function: bypass the cache for this call
 * - from a computation: return the result but do not store it
 *
 * The marker is a separate variant alternative, so no T value can alias it.
 */

#ifndef MEMENTO_CORE_CACHEABLE_HPP
#define MEMENTO_CORE_CACHEABLE_HPP

#include <type_traits>
#include <utility>
#include <variant>

namespace memento::core {

/**
 * Do-not-cache marker tag
 */
struct DoNotCache {
    bool operator==(const DoNotCache&) const = default;
};

inline constexpr DoNotCache do_not_cache{};

template<typename T>
class Cacheable {
public:
    Cacheable(DoNotCache) : state_(std::in_place_index<1>) {}

    template<typename U>
        requires(!std::is_same_v<std::remove_cvref_t<U>, Cacheable> &&
                 !std::is_same_v<std::remove_cvref_t<U>, DoNotCache> &&
                 std::is_constructible_v<T, U>)
    Cacheable(U&& value) : state_(std::in_place_index<0>, std::forward<U>(value)) {}

    bool is_marker() const noexcept { return state_.index() == 1; }
    explicit operator bool() const noexcept { return !is_marker(); }

    /**
     * Stored value
     * @throws std::bad_variant_access when holding the marker
     */
    const T& value() const& { return std::get<0>(state_); }
    T& value() & { return std::get<0>(state_); }
    T&& value() && { return std::get<0>(std::move(state_)); }

    const T& operator*() const& { return value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, DoNotCache> state_;
};

} // namespace memento::core

#endif // MEMENTO_CORE_CACHEABLE_HPP
