/**
 * MEMENTO - Function Result Memoization
 * Callable - Identity and static description of a memoized callable
 *
 * The identity prefix names a callable in the key space:
 *   module:name:        plain function or static method
 *   module:Type.name:   method bound to a type
 *
 * Names and type names may not contain '.' or ':', modules may not contain
 * ':'. With those rules distinct callables never share a prefix, and no
 * prefix is a leading substring of another callable's keys.
 */

#ifndef MEMENTO_CORE_CALLABLE_HPP
#define MEMENTO_CORE_CALLABLE_HPP

#include "core/argument.hpp"
#include "core/signature.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace memento::core {

struct CallableIdentity {
    std::string module;
    std::string type_name;  // Empty for free functions and static methods
    std::string name;

    /**
     * @throws std::invalid_argument if a component is malformed
     */
    void validate() const;

    std::string prefix() const;
};

/**
 * Immutable description of a memoized callable, built once at wrap time
 */
class CallableInfo {
public:
    CallableInfo(CallableIdentity identity, Signature signature,
                 std::optional<std::size_t> context_index = std::nullopt);

    const CallableIdentity& identity() const { return identity_; }
    const std::string& prefix() const { return prefix_; }
    const Signature& signature() const { return signature_; }

    /**
     * Position of the parameter excluded from argument-sensitive keys
     */
    std::optional<std::size_t> context_index() const { return context_index_; }

private:
    CallableIdentity identity_;
    std::string prefix_;
    Signature signature_;
    std::optional<std::size_t> context_index_;
};

/**
 * Bound argument vector for key derivation
 *
 * Calls with no keyword arguments and exactly one positional argument per
 * parameter are returned verbatim; anything else goes through bind().
 */
Arguments arguments(const CallableInfo& info, const Call& call);

} // namespace memento::core

#endif // MEMENTO_CORE_CALLABLE_HPP
