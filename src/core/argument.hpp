/**
 * MEMENTO - Function Result Memoization
 * Arguments - Call argument model
 *
 * A call argument is either a JSON value or a reference to a context object
 * (an instance or a request). Values are nlohmann::json documents so they have
 * a deterministic textual representation for key derivation.
 */

#ifndef MEMENTO_CORE_ARGUMENT_HPP
#define MEMENTO_CORE_ARGUMENT_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace memento::context {
class Context;
}

namespace memento::core {

using Value = nlohmann::json;
using ContextPtr = std::shared_ptr<context::Context>;

class Argument {
public:
    Argument() = default;
    Argument(std::nullptr_t) {}
    Argument(Value value) : state_(std::move(value)) {}

    template<typename C>
        requires std::is_base_of_v<context::Context, C>
    Argument(std::shared_ptr<C> context) : state_(ContextPtr(std::move(context))) {}

    template<typename T>
        requires(!std::is_same_v<std::remove_cvref_t<T>, Argument> &&
                 !std::is_same_v<std::remove_cvref_t<T>, Value> &&
                 !std::is_convertible_v<T, ContextPtr> &&
                 std::is_constructible_v<Value, T>)
    Argument(T&& value) : state_(Value(std::forward<T>(value))) {}

    bool is_context() const noexcept { return state_.index() == 1; }

    /**
     * True for a JSON null or a null context pointer
     */
    bool is_null() const noexcept;

    /**
     * JSON value of this argument
     * @throws BindingError when the argument is a context
     */
    const Value& value() const;

    /**
     * Context of this argument, nullptr when the argument is a value
     */
    ContextPtr context() const;

    /**
     * Typed access through nlohmann::json conversion
     */
    template<typename T>
    T as() const {
        return value().get<T>();
    }

    /**
     * Deterministic textual form used in cache keys.
     * Values render as compact JSON, contexts as "<context#N>".
     */
    std::string repr() const;

private:
    std::variant<Value, ContextPtr> state_;
};

using Arguments = std::vector<Argument>;
using KeywordArguments = std::map<std::string, Argument>;

/**
 * A concrete invocation: positional arguments plus keyword arguments
 */
struct Call {
    Arguments positional;
    KeywordArguments keywords;
};

/**
 * Render an argument vector as "[a,b,...]"
 */
std::string repr(const Arguments& args);

} // namespace memento::core

#endif // MEMENTO_CORE_ARGUMENT_HPP
