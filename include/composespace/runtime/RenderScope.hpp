#pragma once

#include <composespace/core/Error.hpp>
#include <composespace/core/Value.hpp>
#include <composespace/runtime/CompositionLocal.hpp>
#include <composespace/runtime/DependencyTracker.hpp>
#include <composespace/runtime/Renderer.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace CS::Runtime {

class Composer;

using RenderFn = std::function<void(Composer&)>;

/**
 * One node of a scope's output, as declared by its render function. A node
 * whose `scope` is set is a placeholder for a child scope's output and
 * carries nothing else; Composition::capture() splices the child in.
 */
struct EmittedNode {
    std::string                type;
    PropMap                    props;
    std::optional<std::string> key;
    LiveHandlers               handlers;
    std::vector<EmittedNode>   children;
    ScopeId                    scope = kNoScope;
};

/**
 * Positional storage a render function reaches through the Composer. Slots
 * are matched by call order; a slot reached with a different type is
 * released and replaced.
 */
class Slot {
public:
    virtual ~Slot() = default;

    // Called once before the slot is dropped.
    virtual auto release() -> std::optional<Error> {
        return std::nullopt;
    }
};

template <typename T>
class OwnedSlot final : public Slot {
public:
    explicit OwnedSlot(std::unique_ptr<T> object) : object_(std::move(object)) {}

    [[nodiscard]] auto get() noexcept -> T& {
        return *object_;
    }

private:
    std::unique_ptr<T> object_;
};

using EffectCleanup = std::function<void()>;
using EffectFn      = std::function<EffectCleanup()>;

struct EffectState {
    // Deps of the last run; nullopt until the effect has run once.
    std::optional<std::vector<Value>> deps;
    EffectCleanup                     cleanup;
    std::function<void()>             on_dispose;
};

// An effect whose deps changed, waiting for the end of the current pass.
struct PendingEffect {
    ScopeId                    scope = kNoScope;
    std::weak_ptr<EffectState> state;
    std::vector<Value>         deps;
    EffectFn                   run;
};

class EffectSlot final : public Slot {
public:
    EffectSlot() : state_(std::make_shared<EffectState>()) {}

    auto release() -> std::optional<Error> override;

    [[nodiscard]] auto state() const noexcept -> std::shared_ptr<EffectState> const& {
        return state_;
    }

private:
    std::shared_ptr<EffectState> state_;
};

/**
 * RenderScope is the unit of re-execution.
 *
 * Owned by the Composition's scope table; `parent` and `children` are ids
 * into that table, never owning edges. Everything a render function declares
 * through the Composer (state, effects, nested scopes) is keyed to the scope
 * that declared it.
 */
class RenderScope {
public:
    RenderScope(ScopeId id, ScopeId parent, std::string key, std::string type, std::size_t depth, RenderFn fn);
    ~RenderScope();

    RenderScope(RenderScope const&)            = delete;
    RenderScope& operator=(RenderScope const&) = delete;

    [[nodiscard]] auto id() const noexcept -> ScopeId {
        return id_;
    }
    [[nodiscard]] auto parent() const noexcept -> ScopeId {
        return parent_;
    }
    [[nodiscard]] auto key() const noexcept -> std::string const& {
        return key_;
    }
    [[nodiscard]] auto type() const noexcept -> std::string const& {
        return type_;
    }
    [[nodiscard]] auto depth() const noexcept -> std::size_t {
        return depth_;
    }
    [[nodiscard]] auto dirty() const noexcept -> bool {
        return dirty_;
    }
    [[nodiscard]] auto failed() const noexcept -> bool {
        return failed_;
    }
    [[nodiscard]] auto suspended() const noexcept -> bool {
        return suspended_;
    }
    [[nodiscard]] auto executionCount() const noexcept -> std::size_t {
        return executionCount_;
    }
    [[nodiscard]] auto lastError() const noexcept -> std::optional<Error> const& {
        return lastError_;
    }
    [[nodiscard]] auto output() const noexcept -> std::vector<EmittedNode> const& {
        return output_;
    }
    [[nodiscard]] auto children() const noexcept -> std::vector<ScopeId> const& {
        return children_;
    }
    [[nodiscard]] auto dependencies() const noexcept -> DependencySet const& {
        return dependencies_;
    }
    [[nodiscard]] auto slotCount() const noexcept -> std::size_t {
        return slots_.size();
    }

    // Id of the live child declared under `key`, or kNoScope.
    [[nodiscard]] auto findChild(std::string const& key) const -> ScopeId;

private:
    friend class Composition;
    friend class Composer;

    ScopeId                            id_;
    ScopeId                            parent_;
    std::string                        key_;
    std::string                        type_;
    std::size_t                        depth_;
    RenderFn                           fn_;
    DependencySet                      dependencies_;
    bool                               dirty_          = true;
    bool                               failed_         = false;
    bool                               suspended_      = false;
    std::size_t                        executionCount_ = 0;
    std::optional<Error>               lastError_;
    std::vector<EmittedNode>           output_;
    std::vector<ScopeId>               children_;
    std::map<std::string, ScopeId>     childIndex_;
    std::vector<std::unique_ptr<Slot>> slots_;
    std::optional<std::vector<Value>>  inputs_;
    std::shared_ptr<LocalMap const>    locals_;
};

} // namespace CS::Runtime
