/**
 * MEMENTO - Function Result Memoization
 * Context Memoized Implementation
 */

#include "memo/context_memoized.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <stdexcept>

namespace memento::memo {

using util::log_component::Memo;
using util::CacheOutcome;

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::microseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
}

core::CallableInfo make_info(core::CallableIdentity identity, const core::Signature& signature,
                             const std::string& context_parameter) {
    if (signature.empty()) {
        throw std::invalid_argument("ContextMemoized: " + identity.prefix() +
                                    " must declare a context parameter");
    }
    // Without a parameter of that name the context is the first one (self)
    auto index = signature.index_of(context_parameter).value_or(0);
    return core::CallableInfo(std::move(identity), signature, index);
}

} // anonymous namespace

ContextMemoized::ContextMemoized(core::CallableIdentity identity, core::Signature signature,
                                 Function function, ContextMemoizeOptions options)
    : info_(make_info(std::move(identity), signature, options.context_parameter))
    , context_parameter_(std::move(options.context_parameter))
    , function_(std::move(function))
    , key_(std::move(options.key)) {
    if (!function_) {
        throw std::invalid_argument("ContextMemoized: function is required for " + info_.prefix());
    }
    if (!key_) {
        throw std::invalid_argument("ContextMemoized: key function is required for " + info_.prefix());
    }
}

CallResult ContextMemoized::invoke(const core::Signature& signature, core::Arguments bound) const {
    core::BoundArguments args(signature, std::move(bound));
    return function_(args);
}

CallResult ContextMemoized::call(const core::Call& call) const {
    auto& logger = util::Logger::instance();
    auto bound = core::bind(info_.signature(), call);
    auto ctx = bound[context_index()].context();

    cache::KeyResult key = core::do_not_cache;
    if (!ctx) {
        MEMENTO_LOG_DEBUG(Memo, "no context for {}, caching disabled for this call", info_.prefix());
    } else {
        key = key_(info_, call);
        if (key.is_marker()) {
            MEMENTO_LOG_DEBUG(Memo, "skipped cache check for {}", info_.prefix());
        }
    }

    if (key.is_marker()) {
        auto start = Clock::now();
        auto result = invoke(info_.signature(), std::move(bound));
        logger.event({CacheOutcome::Skip, info_.prefix(), {}, since(start)});
        return result;
    }

    auto& store = ctx->cache();
    if (auto cached = store.get(key.value())) {
        MEMENTO_LOG_DEBUG(Memo, "obtained the cached value for {} key", key.value());
        logger.event({CacheOutcome::Hit, info_.prefix(), key.value()});
        return std::move(*cached);
    }

    MEMENTO_LOG_DEBUG(Memo, "calculated a new value for {} key", key.value());
    auto start = Clock::now();
    auto result = invoke(info_.signature(), std::move(bound));
    logger.event({CacheOutcome::Miss, info_.prefix(), key.value(), since(start)});

    if (!result.is_marker()) {
        store.put(key.value(), result.value());
    }
    return result;
}

void ContextMemoized::erase(const core::ContextPtr& context, core::Arguments positional,
                            core::KeywordArguments keywords) const {
    if (!context) {
        return;
    }

    // Put the context back where the signature declares it
    auto index = context_index();
    if (index <= positional.size()) {
        positional.insert(positional.begin() + static_cast<std::ptrdiff_t>(index), context);
    } else {
        keywords.insert_or_assign(info_.signature().parameters()[index].name, context);
    }

    auto key = key_(info_, core::Call{std::move(positional), std::move(keywords)});
    if (key.is_marker()) {
        return;
    }

    // Nothing was ever cached on this context
    auto* store = context->cache_if_present();
    if (!store) {
        return;
    }

    MEMENTO_LOG_DEBUG(Memo, "cleared cache value for {} key", key.value());
    store->erase(key.value());
    util::Logger::instance().event({CacheOutcome::Erase, info_.prefix(), key.value()});
}

void ContextMemoized::clear(const core::ContextPtr& context) const {
    auto* store = context ? context->cache_if_present() : nullptr;
    if (!store) {
        return;
    }
    auto removed = store->erase_prefix(info_.prefix());
    MEMENTO_LOG_DEBUG(Memo, "cleared {} cache values for {} on context #{}",
                      removed, info_.prefix(), context->identity());
    util::Logger::instance().event({CacheOutcome::Clear, info_.prefix(), {}});
}

ContextMemoized memoize_in_context(core::CallableIdentity identity, core::Signature signature,
                                   Function function, ContextMemoizeOptions options) {
    return ContextMemoized(std::move(identity), std::move(signature),
                           std::move(function), std::move(options));
}

ContextMemoized memoize_in_request(core::CallableIdentity identity, core::Signature signature,
                                   Function function, cache::KeyFunction key) {
    ContextMemoizeOptions options;
    options.context_parameter = kRequestParameter;
    options.key = std::move(key);
    return ContextMemoized(std::move(identity), std::move(signature),
                           std::move(function), std::move(options));
}

} // namespace memento::memo
