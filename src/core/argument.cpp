/**
 * MEMENTO - Function Result Memoization
 * Arguments Implementation
 */

#include "core/argument.hpp"
#include "core/signature.hpp"
#include "context/context.hpp"

#include <cstdint>
#include <vector>

namespace memento::core {

namespace {

// Hex of the CBOR encoding: byte-exact for strings that are not valid UTF-8.
// JSON text never starts with '<', so this cannot collide with dump() output.
std::string binary_repr(const Value& value) {
    static constexpr char kDigits[] = "0123456789abcdef";

    std::vector<std::uint8_t> bytes = Value::to_cbor(value);
    std::string out = "<cbor:";
    out.reserve(out.size() + bytes.size() * 2 + 1);
    for (auto byte : bytes) {
        out.push_back(kDigits[byte >> 4]);
        out.push_back(kDigits[byte & 0x0f]);
    }
    out.push_back('>');
    return out;
}

} // anonymous namespace

bool Argument::is_null() const noexcept {
    if (const auto* ctx = std::get_if<ContextPtr>(&state_)) {
        return *ctx == nullptr;
    }
    return std::get<Value>(state_).is_null();
}

const Value& Argument::value() const {
    if (const auto* v = std::get_if<Value>(&state_)) {
        return *v;
    }
    throw BindingError("argument is a context object, not a value");
}

ContextPtr Argument::context() const {
    if (const auto* ctx = std::get_if<ContextPtr>(&state_)) {
        return *ctx;
    }
    return nullptr;
}

std::string Argument::repr() const {
    if (const auto* ctx = std::get_if<ContextPtr>(&state_)) {
        // JSON text never starts with '<', so this cannot collide with a value
        if (!*ctx) {
            return "null";
        }
        return "<context#" + std::to_string((*ctx)->identity()) + ">";
    }
    const auto& value = std::get<Value>(state_);
    try {
        return value.dump();
    } catch (const nlohmann::json::type_error&) {
        // dump() rejects invalid UTF-8 (error 316)
        return binary_repr(value);
    }
}

std::string repr(const Arguments& args) {
    std::string out = "[";
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        out += args[i].repr();
    }
    out.push_back(']');
    return out;
}

} // namespace memento::core
