/**
 * MEMENTO - Function Result Memoization
 * Callable Implementation
 */

#include "core/callable.hpp"

#include <stdexcept>

namespace memento::core {

namespace {

bool has_any_of(const std::string& text, const char* chars) {
    return text.find_first_of(chars) != std::string::npos;
}

} // anonymous namespace

void CallableIdentity::validate() const {
    if (name.empty()) {
        throw std::invalid_argument("CallableIdentity: name cannot be empty");
    }
    if (module.empty()) {
        throw std::invalid_argument("CallableIdentity: module cannot be empty");
    }
    if (has_any_of(module, ":")) {
        throw std::invalid_argument("CallableIdentity: module '" + module + "' cannot contain ':'");
    }
    if (has_any_of(type_name, ".:")) {
        throw std::invalid_argument("CallableIdentity: type '" + type_name + "' cannot contain '.' or ':'");
    }
    if (has_any_of(name, ".:")) {
        throw std::invalid_argument("CallableIdentity: name '" + name + "' cannot contain '.' or ':'");
    }
}

std::string CallableIdentity::prefix() const {
    if (type_name.empty()) {
        return module + ":" + name + ":";
    }
    return module + ":" + type_name + "." + name + ":";
}

CallableInfo::CallableInfo(CallableIdentity identity, Signature signature,
                           std::optional<std::size_t> context_index)
    : identity_(std::move(identity))
    , signature_(std::move(signature))
    , context_index_(context_index) {
    identity_.validate();
    prefix_ = identity_.prefix();

    if (context_index_ && *context_index_ >= signature_.size()) {
        throw std::invalid_argument("CallableInfo: context index " +
                                    std::to_string(*context_index_) +
                                    " is outside the parameter list of " + prefix_);
    }
}

Arguments arguments(const CallableInfo& info, const Call& call) {
    // With no keywords, N positional arguments for N parameters bind verbatim
    if (call.keywords.empty() && call.positional.size() == info.signature().size()) {
        return call.positional;
    }
    return bind(info.signature(), call);
}

} // namespace memento::core
