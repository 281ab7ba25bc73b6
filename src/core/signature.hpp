/**
 * MEMENTO - Function Result Memoization
 * Signature - Declared parameters and call binding
 *
 * A Signature is the ordered parameter list of a memoized callable, captured
 * once when the callable is wrapped. bind() resolves a concrete Call into one
 * argument per declared parameter:
 * - positional arguments fill parameters left to right
 * - keyword arguments fill parameters by name
 * - declared defaults fill whatever is left
 */

#ifndef MEMENTO_CORE_SIGNATURE_HPP
#define MEMENTO_CORE_SIGNATURE_HPP

#include "core/argument.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace memento::core {

/**
 * Call does not match the declared signature
 */
class BindingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * One declared parameter; no default means the parameter is required
 */
struct Parameter {
    std::string name;
    std::optional<Value> default_value;
};

class Signature {
public:
    Signature() = default;

    /**
     * @throws std::invalid_argument on empty or duplicate parameter names
     */
    Signature(std::initializer_list<Parameter> parameters);
    explicit Signature(std::vector<Parameter> parameters);

    const std::vector<Parameter>& parameters() const { return parameters_; }
    std::size_t size() const { return parameters_.size(); }
    bool empty() const { return parameters_.empty(); }

    /**
     * Position of a parameter by name
     */
    std::optional<std::size_t> index_of(std::string_view name) const;

private:
    void validate() const;

    std::vector<Parameter> parameters_;
};

/**
 * Declared parameter names, in order
 */
std::vector<std::string> declared_parameters(const Signature& signature);

/**
 * Bind a call to a signature, applying defaults
 *
 * @return One argument per declared parameter, in declaration order
 * @throws BindingError if the call has too many positional arguments, an
 *         unknown or duplicated keyword, or leaves a required parameter unset
 */
Arguments bind(const Signature& signature, const Call& call);

/**
 * Bound arguments handed to a memoized computation
 */
class BoundArguments {
public:
    BoundArguments(const Signature& signature, Arguments values);

    std::size_t size() const { return values_.size(); }
    const Arguments& values() const { return values_; }

    const Argument& operator[](std::size_t index) const { return values_.at(index); }

    /**
     * @throws BindingError if no parameter has this name
     */
    const Argument& at(std::string_view name) const;

    template<typename T>
    T get(std::string_view name) const {
        return at(name).as<T>();
    }

    ContextPtr context(std::string_view name) const { return at(name).context(); }

private:
    const Signature& signature_;
    Arguments values_;
};

} // namespace memento::core

#endif // MEMENTO_CORE_SIGNATURE_HPP
