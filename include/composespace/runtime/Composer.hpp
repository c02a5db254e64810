#pragma once

#include <composespace/core/Error.hpp>
#include <composespace/core/Value.hpp>
#include <composespace/runtime/CompositionLocal.hpp>
#include <composespace/runtime/DependencyTracker.hpp>
#include <composespace/runtime/RenderScope.hpp>
#include <composespace/runtime/Renderer.hpp>
#include <composespace/runtime/SavedStateRegistry.hpp>
#include <composespace/runtime/StateCell.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace CS::Runtime {

class Composition;

struct NodeOptions {
    PropMap                    props;
    std::optional<std::string> key;
    LiveHandlers               handlers;
};

struct ScopeOptions {
    // Empty: positional key "#<ordinal>" among the unkeyed children.
    std::string                       key;
    std::string                       type = "scope";
    // When set and equal to the previous declaration's inputs, a clean child
    // is not re-executed with its parent.
    std::optional<std::vector<Value>> inputs;
};

/**
 * Composer is what a render function sees while its scope executes.
 *
 * Declarations (node, text, scope) build the scope's output. Stateful calls
 * (state, remember, savedState, asyncValue, effect, onMount, onDispose) are
 * positional: the n-th call of an execution reaches the n-th slot of the
 * scope, so they must not be made conditionally with a varying order.
 */
class Composer {
public:
    Composer(Composer const&)            = delete;
    Composer& operator=(Composer const&) = delete;

    auto node(std::string type, NodeOptions options = {}, RenderFn const& content = {}) -> void;
    auto node(std::string type, RenderFn const& content) -> void;
    auto text(std::string value, std::optional<std::string> key = std::nullopt) -> void;

    // Declare a child scope. Its output is spliced into the current position.
    auto scope(ScopeOptions options, RenderFn fn) -> ScopeId;
    auto scope(std::string key, RenderFn fn) -> ScopeId;
    auto scope(RenderFn fn) -> ScopeId;

    template <typename T>
    auto state(T initial) -> StateCell<T>& {
        auto& slot = this->useSlot<OwnedSlot<StateCell<T>>>([&] {
            return std::make_unique<OwnedSlot<StateCell<T>>>(
                    std::make_unique<StateCell<T>>(this->trackerRef(), this->scopeId(), std::move(initial)));
        });
        return slot.get();
    }

    template <typename T, typename Factory>
    auto remember(Factory&& factory) -> T& {
        auto& slot = this->useSlot<OwnedSlot<T>>([&] {
            return std::make_unique<OwnedSlot<T>>(std::make_unique<T>(std::forward<Factory>(factory)()));
        });
        return slot.get();
    }

    // A state cell mirrored into the composition's SavedStateRegistry under
    // `key`; seeded from it when a value of the right kind is stored there.
    template <ValueConvertible T>
    auto savedState(std::string key, T initial) -> StateCell<T>& {
        auto& slot = this->useSlot<OwnedSlot<StateCell<T>>>([&] {
            auto*            registry = this->savedStateRegistry();
            std::optional<T> seeded;
            if (registry != nullptr) {
                if (auto stored = registry->get(key)) {
                    seeded = ValueTraits<T>::fromValue(*stored);
                }
                if (!seeded) {
                    registry->set(key, ValueTraits<T>::toValue(initial));
                }
            }
            auto cell = std::make_unique<StateCell<T>>(this->trackerRef(), this->scopeId(),
                                                       seeded ? std::move(*seeded) : std::move(initial));
            if (registry != nullptr) {
                cell->setWriteHook([registry, key](T const& value) {
                    registry->set(key, ValueTraits<T>::toValue(value));
                });
            }
            return std::make_unique<OwnedSlot<StateCell<T>>>(std::move(cell));
        });
        return slot.get();
    }

    template <typename T>
    auto asyncValue() -> AsyncValue<T>& {
        auto& slot = this->useSlot<OwnedSlot<AsyncValue<T>>>([&] {
            return std::make_unique<OwnedSlot<AsyncValue<T>>>(
                    std::make_unique<AsyncValue<T>>(this->trackerRef(), this->scopeId()));
        });
        return slot.get();
    }

    // Subscribe to `value`; nullptr while it is not ready. A pending value
    // marks the scope suspended until it resolves.
    template <typename T>
    auto await(AsyncValue<T>& value) -> T const* {
        auto const* result = value.value();
        if (result == nullptr && value.status() == AsyncStatus::Pending) {
            suspended_ = true;
        }
        return result;
    }

    // Run `fn` after the commit of this pass when `deps` differ from the last
    // run. `fn` may return a cleanup, run before the next run and at disposal.
    template <typename Fn>
    auto effect(std::vector<Value> deps, Fn&& fn) -> void {
        auto& slot  = this->useSlot<EffectSlot>([] { return std::make_unique<EffectSlot>(); });
        auto& state = slot.state();
        if (state->deps && *state->deps == deps) {
            return;
        }
        EffectFn run;
        if constexpr (std::is_void_v<std::invoke_result_t<std::decay_t<Fn>&>>) {
            run = [fn = std::forward<Fn>(fn)]() mutable -> EffectCleanup {
                fn();
                return {};
            };
        } else {
            run = [fn = std::forward<Fn>(fn)]() mutable -> EffectCleanup { return EffectCleanup{fn()}; };
        }
        this->queueEffect(state, std::move(deps), std::move(run));
    }

    template <typename Fn>
    auto onMount(Fn&& fn) -> void {
        this->effect({}, std::forward<Fn>(fn));
    }

    auto onDispose(std::function<void()> fn) -> void;

    template <typename T>
    auto provide(CompositionLocal<T> const& local, std::type_identity_t<T> value, RenderFn const& content) -> void {
        auto next = std::make_shared<LocalMap>(locals_ ? *locals_ : LocalMap{});
        (*next)[local.id()] = std::make_shared<T const>(std::move(value));

        struct Restore {
            Composer&                       self;
            std::shared_ptr<LocalMap const> previous;
            ~Restore() { self.locals_ = std::move(previous); }
        } restore{*this, std::exchange(locals_, std::shared_ptr<LocalMap const>{std::move(next)})};

        if (content) {
            content(*this);
        }
    }

    template <typename T>
    [[nodiscard]] auto current(CompositionLocal<T> const& local) const -> T const& {
        if (locals_) {
            if (auto it = locals_->find(local.id()); it != locals_->end()) {
                return *static_cast<T const*>(it->second.get());
            }
        }
        return local.defaultValue();
    }

    template <typename Fn>
    auto untracked(Fn&& fn) -> decltype(auto) {
        auto frame = this->trackerRef().suspend();
        return std::forward<Fn>(fn)();
    }

    [[nodiscard]] auto scopeId() const noexcept -> ScopeId;
    [[nodiscard]] auto isSuspended() const noexcept -> bool {
        return suspended_;
    }

private:
    friend class Composition;

    Composer(Composition& composition, RenderScope& scope, std::vector<EmittedNode>& output);

    template <typename SlotT, typename Make>
    auto useSlot(Make&& make) -> SlotT& {
        auto const index = slotCursor_++;
        auto&      slots = scope_.slots_;
        if (index < slots.size()) {
            if (auto* existing = dynamic_cast<SlotT*>(slots[index].get())) {
                return *existing;
            }
            this->replaceSlot(index, std::forward<Make>(make)());
            return static_cast<SlotT&>(*slots[index]);
        }
        slots.push_back(std::forward<Make>(make)());
        return static_cast<SlotT&>(*slots.back());
    }

    auto trackerRef() -> DependencyTracker&;
    auto savedStateRegistry() -> SavedStateRegistry*;
    auto replaceSlot(std::size_t index, std::unique_ptr<Slot> replacement) -> void;
    auto queueEffect(std::shared_ptr<EffectState> const& state, std::vector<Value> deps, EffectFn run) -> void;

    Composition&                           composition_;
    RenderScope&                           scope_;
    std::vector<std::vector<EmittedNode>*> targets_;
    std::size_t                            slotCursor_   = 0;
    std::size_t                            scopeOrdinal_ = 0;
    std::vector<ScopeId>                   declared_;
    std::vector<ScopeId>                   created_;
    phmap::flat_hash_set<std::string>      declaredKeys_;
    std::shared_ptr<LocalMap const>        locals_;
    bool                                   suspended_ = false;
    std::vector<PendingEffect>             effects_;
};

} // namespace CS::Runtime
