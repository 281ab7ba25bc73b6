/**
 * MEMENTO - Function Result Memoization
 * Signature Implementation
 */

#include "core/signature.hpp"

#include <unordered_set>

namespace memento::core {

Signature::Signature(std::initializer_list<Parameter> parameters)
    : parameters_(parameters) {
    validate();
}

Signature::Signature(std::vector<Parameter> parameters)
    : parameters_(std::move(parameters)) {
    validate();
}

void Signature::validate() const {
    std::unordered_set<std::string_view> seen;
    for (const auto& param : parameters_) {
        if (param.name.empty()) {
            throw std::invalid_argument("Signature: parameter name cannot be empty");
        }
        if (!seen.insert(param.name).second) {
            throw std::invalid_argument("Signature: duplicate parameter '" + param.name + "'");
        }
    }
}

std::optional<std::size_t> Signature::index_of(std::string_view name) const {
    for (std::size_t i = 0; i < parameters_.size(); ++i) {
        if (parameters_[i].name == name) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<std::string> declared_parameters(const Signature& signature) {
    std::vector<std::string> names;
    names.reserve(signature.size());
    for (const auto& param : signature.parameters()) {
        names.push_back(param.name);
    }
    return names;
}

Arguments bind(const Signature& signature, const Call& call) {
    const auto& params = signature.parameters();

    if (call.positional.size() > params.size()) {
        throw BindingError("takes " + std::to_string(params.size()) +
                           " positional arguments but " +
                           std::to_string(call.positional.size()) + " were given");
    }

    std::vector<std::optional<Argument>> slots(params.size());
    for (std::size_t i = 0; i < call.positional.size(); ++i) {
        slots[i] = call.positional[i];
    }

    for (const auto& [name, arg] : call.keywords) {
        auto index = signature.index_of(name);
        if (!index) {
            throw BindingError("got an unexpected keyword argument '" + name + "'");
        }
        if (slots[*index]) {
            throw BindingError("got multiple values for argument '" + name + "'");
        }
        slots[*index] = arg;
    }

    Arguments bound;
    bound.reserve(params.size());
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (slots[i]) {
            bound.push_back(std::move(*slots[i]));
        } else if (params[i].default_value) {
            bound.emplace_back(*params[i].default_value);
        } else {
            throw BindingError("missing required argument '" + params[i].name + "'");
        }
    }
    return bound;
}

BoundArguments::BoundArguments(const Signature& signature, Arguments values)
    : signature_(signature), values_(std::move(values)) {}

const Argument& BoundArguments::at(std::string_view name) const {
    auto index = signature_.index_of(name);
    if (!index || *index >= values_.size()) {
        throw BindingError("no parameter named '" + std::string(name) + "'");
    }
    return values_[*index];
}

} // namespace memento::core
