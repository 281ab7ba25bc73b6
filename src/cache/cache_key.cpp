/**
 * MEMENTO - Function Result Memoization
 * Cache Key Implementation
 */

#include "cache/cache_key.hpp"
#include "context/context.hpp"

#include <xxhash.h>

#include <iomanip>
#include <memory>
#include <sstream>

namespace memento::cache {

namespace {

constexpr std::string_view kBucketKeyword = "cachekey";
constexpr std::string_view kRequestParameter = "request";
constexpr char kCompactedMarker = '#';

std::shared_ptr<context::Request> as_request(const core::Argument& arg) {
    return std::dynamic_pointer_cast<context::Request>(arg.context());
}

} // anonymous namespace

KeyResult default_key(const core::CallableInfo& info, const core::Call& call) {
    auto args = core::arguments(info, call);

    if (auto index = info.context_index(); index && *index < args.size()) {
        args.erase(args.begin() + static_cast<std::ptrdiff_t>(*index));
    }

    return info.prefix() + core::repr(args);
}

KeyResult static_key(const core::CallableInfo& info, const core::Call& call) {
    auto it = call.keywords.find(std::string(kBucketKeyword));
    if (it == call.keywords.end() || it->second.is_null()) {
        return info.prefix();
    }

    const auto& bucket = it->second.value();
    if (bucket.is_string()) {
        const auto& name = bucket.get_ref<const std::string&>();
        if (name.starts_with(kCompactedMarker)) {
            throw core::BindingError(info.prefix() + " cache bucket cannot start with '#': " + name);
        }
        return info.prefix() + name;
    }
    return info.prefix() + bucket.dump();
}

KeyResult request_user_ip_key(const core::CallableInfo& info, const core::Call& call) {
    std::shared_ptr<context::Request> request;

    if (!call.positional.empty()) {
        request = as_request(call.positional.front());
    }

    if (!request) {
        auto args = core::bind(info.signature(), call);
        auto index = info.signature().index_of(kRequestParameter).value_or(0);
        if (index < args.size()) {
            request = as_request(args[index]);
        }
    }

    if (!request) {
        throw core::BindingError(info.prefix() + " requires a request argument");
    }

    core::Arguments parts{request->user_id(), request->remote_addr()};
    return info.prefix() + core::repr(parts);
}

std::string compact_key(const std::string& key, std::string_view prefix, std::size_t max_length) {
    if (max_length == 0 || key.size() <= max_length || !std::string_view(key).starts_with(prefix)) {
        return key;
    }
    if (compacted_length(prefix) >= key.size()) {
        return key;
    }

    std::string_view tail = std::string_view(key).substr(prefix.size());
    XXH64_hash_t hash = XXH64(tail.data(), tail.size(), 0);

    std::ostringstream oss;
    oss << prefix << kCompactedMarker << std::hex << std::setfill('0') << std::setw(16) << hash;
    return oss.str();
}

} // namespace memento::cache
