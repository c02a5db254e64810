#include <composespace/runtime/Composer.hpp>
#include <composespace/runtime/Composition.hpp>

#include "log/TaggedLogger.hpp"

#include <atomic>
#include <string>
#include <utility>

namespace CS::Runtime {

auto nextCompositionLocalId() noexcept -> LocalId {
    static std::atomic<LocalId> next{1};
    return next.fetch_add(1, std::memory_order_relaxed);
}

Composer::Composer(Composition& composition, RenderScope& scope, std::vector<EmittedNode>& output)
    : composition_(composition), scope_(scope), locals_(scope.locals_) {
    targets_.push_back(&output);
}

auto Composer::node(std::string type, NodeOptions options, RenderFn const& content) -> void {
    auto& target = *targets_.back();
    target.push_back(EmittedNode{.type     = std::move(type),
                                 .props    = std::move(options.props),
                                 .key      = std::move(options.key),
                                 .handlers = std::move(options.handlers)});
    if (!content) {
        return;
    }
    targets_.push_back(&target.back().children);
    struct Pop {
        std::vector<std::vector<EmittedNode>*>& stack;
        ~Pop() { stack.pop_back(); }
    } pop{targets_};
    content(*this);
}

auto Composer::node(std::string type, RenderFn const& content) -> void {
    this->node(std::move(type), NodeOptions{}, content);
}

auto Composer::text(std::string value, std::optional<std::string> key) -> void {
    NodeOptions options;
    options.props.emplace(std::string{kTextValueProp}, Value{std::move(value)});
    options.key = std::move(key);
    this->node(std::string{kTextNodeType}, std::move(options));
}

auto Composer::scope(ScopeOptions options, RenderFn fn) -> ScopeId {
    std::string key = options.key.empty() ? "#" + std::to_string(scopeOrdinal_++) : options.key;
    if (!declaredKeys_.insert(key).second) {
        throw CompositionError{Error{Error::Code::DuplicateKey,
                                     "child scope key '" + key + "' declared twice in scope "
                                             + std::to_string(scope_.id())}};
    }
    auto child = composition_.declareChild(*this, std::move(key), std::move(options), std::move(fn));
    declared_.push_back(child);
    targets_.back()->push_back(EmittedNode{.scope = child});
    return child;
}

auto Composer::scope(std::string key, RenderFn fn) -> ScopeId {
    ScopeOptions options;
    options.key = std::move(key);
    return this->scope(std::move(options), std::move(fn));
}

auto Composer::scope(RenderFn fn) -> ScopeId {
    return this->scope(ScopeOptions{}, std::move(fn));
}

auto Composer::onDispose(std::function<void()> fn) -> void {
    auto& slot               = this->useSlot<EffectSlot>([] { return std::make_unique<EffectSlot>(); });
    slot.state()->on_dispose = std::move(fn);
}

auto Composer::scopeId() const noexcept -> ScopeId {
    return scope_.id();
}

auto Composer::trackerRef() -> DependencyTracker& {
    return composition_.tracker_;
}

auto Composer::savedStateRegistry() -> SavedStateRegistry* {
    return composition_.options_.saved_state;
}

auto Composer::replaceSlot(std::size_t index, std::unique_ptr<Slot> replacement) -> void {
    cs_log("scope " + std::to_string(scope_.id()) + " slot " + std::to_string(index)
                   + " reached with a different type; replacing",
           "Slot", "WARN");
    auto& slots = scope_.slots_;
    composition_.releaseSlot(scope_, *slots[index]);
    slots[index] = std::move(replacement);
}

auto Composer::queueEffect(std::shared_ptr<EffectState> const& state, std::vector<Value> deps, EffectFn run) -> void {
    effects_.push_back(PendingEffect{scope_.id(), state, std::move(deps), std::move(run)});
}

} // namespace CS::Runtime
