#pragma once

#include <composespace/core/DiagnosticSink.hpp>
#include <composespace/core/Error.hpp>
#include <composespace/runtime/Composer.hpp>
#include <composespace/runtime/DependencyTracker.hpp>
#include <composespace/runtime/RenderScope.hpp>
#include <composespace/runtime/Renderer.hpp>
#include <composespace/runtime/SavedStateRegistry.hpp>
#include <composespace/runtime/Scheduler.hpp>
#include <composespace/runtime/StateCell.hpp>
#include <composespace/snapshot/ComponentNode.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace CS::Runtime {

struct CompositionOptions {
    SchedulerOptions    scheduler{};
    SavedStateRegistry* saved_state    = nullptr;
    Renderer*           renderer       = nullptr;
    DiagnosticSink*     diagnostics    = nullptr;
    // Hand the first composition to the renderer. Hydration turns this off
    // and adopts the server markup instead.
    bool                render_initial = true;
};

/**
 * Flattened view of the live tree at one point in time.
 */
struct CapturedTree {
    ComponentNode                               root;
    LiveBindings                                bindings;
    // Key paths of the top-level nodes each scope emitted (nested scopes'
    // nodes count for every enclosing scope that emitted them directly).
    std::map<ScopeId, std::vector<std::string>> scope_roots;
    // Key path of the node a scope's output is spliced into; empty when the
    // scope's nodes sit at the top of the tree.
    std::map<ScopeId, std::string>              scope_parents;
};

/**
 * Composition owns one scope tree and everything hanging off it.
 *
 *     InMemorySavedStateRegistry registry;
 *     Composition composition{{.saved_state = &registry}};
 *     composition.setContent([](Composer& cx) {
 *         auto& count = cx.state(0);
 *         cx.node("button", {.handlers = {{"click", [&count](auto const&) { count.update([](int& v) { ++v; }); }}}},
 *                 [&](Composer& cx) { cx.text(std::to_string(count.read())); });
 *     });
 *     composition.flush();
 *
 * Not thread-safe; all calls come from the thread that owns the composition.
 */
class Composition final : private ScopeHost {
public:
    explicit Composition(CompositionOptions options = {});
    ~Composition() override;

    Composition(Composition const&)            = delete;
    Composition& operator=(Composition const&) = delete;

    // Compose `root` from scratch, replacing any previous content.
    auto setContent(RenderFn root) -> Expected<void>;

    auto flush() -> FlushReport;

    template <typename Fn>
    auto batch(Fn&& fn) -> FlushReport {
        return scheduler_.batch(std::forward<Fn>(fn));
    }

    // State owned by the composition itself rather than by a scope.
    template <typename T>
    auto makeState(T initial) -> StateCell<T>& {
        auto  cell = std::make_unique<StateCell<T>>(tracker_, kNoScope, std::move(initial));
        auto& ref  = *cell;
        rootObjects_.push_back(std::make_unique<OwnedSlot<StateCell<T>>>(std::move(cell)));
        return ref;
    }

    template <typename T>
    auto makeAsync() -> AsyncValue<T>& {
        auto  value = std::make_unique<AsyncValue<T>>(tracker_, kNoScope);
        auto& ref   = *value;
        rootObjects_.push_back(std::make_unique<OwnedSlot<AsyncValue<T>>>(std::move(value)));
        return ref;
    }

    [[nodiscard]] auto snapshot() const -> Expected<ComponentNode>;
    [[nodiscard]] auto capture() const -> Expected<CapturedTree>;

    // Tear down every scope, running effect cleanups and dispose callbacks.
    auto dispose() -> void;

    // Steady-state updates go to `renderer` from the next pass on.
    auto attachRenderer(Renderer* renderer) -> void;

    [[nodiscard]] auto rootScope() const noexcept -> ScopeId {
        return root_;
    }
    [[nodiscard]] auto findScope(ScopeId id) const -> RenderScope const*;
    [[nodiscard]] auto findChild(ScopeId parent, std::string const& key) const -> ScopeId;
    [[nodiscard]] auto scopeCount() const noexcept -> std::size_t {
        return scopes_.size();
    }
    [[nodiscard]] auto isDisposed() const noexcept -> bool {
        return disposed_;
    }

    [[nodiscard]] auto scheduler() noexcept -> Scheduler& {
        return scheduler_;
    }
    [[nodiscard]] auto tracker() noexcept -> DependencyTracker& {
        return tracker_;
    }
    [[nodiscard]] auto savedState() const noexcept -> SavedStateRegistry* {
        return options_.saved_state;
    }
    [[nodiscard]] auto renderer() const noexcept -> Renderer* {
        return renderer_;
    }

private:
    friend class Composer;

    // ScopeHost
    auto markDirty(ScopeId scope) -> bool override;
    auto scopeDepth(ScopeId scope) const -> std::optional<std::size_t> override;
    auto scopeNeedsExecution(ScopeId scope) const -> bool override;
    auto executeScope(ScopeId scope) -> Expected<void> override;
    auto failScope(ScopeId scope, Error const& error) -> void override;
    auto afterPass(std::span<ScopeId const> executed) -> std::vector<Error> override;

    auto findMutable(ScopeId id) -> RenderScope*;
    auto createScope(ScopeId parent, std::string key, std::string type, std::size_t depth, RenderFn fn) -> RenderScope&;
    auto runScope(RenderScope& scope) -> Expected<void>;
    auto declareChild(Composer& parent, std::string key, ScopeOptions options, RenderFn fn) -> ScopeId;
    auto disposeScope(ScopeId id) -> void;
    auto releaseSlot(RenderScope& scope, Slot& slot) -> void;
    auto commitInitial() -> Expected<void>;
    auto commit(std::span<ScopeId const> executed) -> std::vector<Error>;
    auto pushSubtree(CapturedTree const& captured, ComponentNode const& node, std::string const& mountPath,
                     std::vector<Error>& errors) -> void;
    auto runEffects() -> std::vector<Error>;
    auto reportError(Error const& error, std::string_view origin) -> void;

    CompositionOptions                                          options_;
    Renderer*                                                   renderer_    = nullptr;
    DiagnosticSink*                                             diagnostics_ = nullptr;
    Scheduler                                                   scheduler_;
    DependencyTracker                                           tracker_;
    phmap::flat_hash_map<ScopeId, std::unique_ptr<RenderScope>> scopes_;
    std::vector<std::unique_ptr<Slot>>                          rootObjects_;
    ScopeId                                                     root_        = kNoScope;
    ScopeId                                                     nextScopeId_ = 1;
    std::vector<PendingEffect>                                  pendingEffects_;
    std::map<ScopeId, std::vector<std::string>>                 committedRoots_;
    bool                                                        disposing_   = false;
    bool                                                        disposed_    = false;
};

} // namespace CS::Runtime
