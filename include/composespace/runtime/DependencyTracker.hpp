#pragma once

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <vector>

namespace CS::Runtime {

using ScopeId = std::uint64_t;
using CellId  = std::uint64_t;

inline constexpr ScopeId kNoScope = 0;

using DependencySet = phmap::flat_hash_set<CellId>;
using ReaderSet     = phmap::flat_hash_set<ScopeId>;

class StateCellBase;

/**
 * Receives the scopes a state write invalidated. Implemented by the
 * Scheduler; kept abstract so the tracker can be exercised on its own.
 */
class InvalidationSink {
public:
    virtual ~InvalidationSink() = default;
    virtual auto invalidate(ScopeId scope) -> void = 0;
};

/**
 * DependencyTracker holds the read/write hooks state cells call into.
 *
 * A stack of frames records which render scope is executing. Reads made
 * while a frame is active register the frame's scope as a reader of the cell
 * and add the cell to the frame's dependency set. Writes hand every current
 * reader to the InvalidationSink and clear the reader set; readers register
 * again on their next execution, so dependencies never go stale.
 *
 * Single-threaded: one tracker per composition root.
 */
class DependencyTracker {
public:
    // RAII frame; pops on destruction, including during unwinding.
    class Frame {
    public:
        Frame(Frame const&)            = delete;
        Frame& operator=(Frame const&) = delete;
        Frame(Frame&& other) noexcept;
        Frame& operator=(Frame&&) = delete;
        ~Frame();

    private:
        friend class DependencyTracker;
        explicit Frame(DependencyTracker* tracker) noexcept : tracker_(tracker) {}
        DependencyTracker* tracker_;
    };

    explicit DependencyTracker(InvalidationSink& sink) : sink_(sink) {}

    DependencyTracker(DependencyTracker const&)            = delete;
    DependencyTracker& operator=(DependencyTracker const&) = delete;

    // Make `scope` the current reader until the returned frame is destroyed.
    [[nodiscard]] auto enter(ScopeId scope, DependencySet& dependencies) -> Frame;

    // Suspend tracking until the returned frame is destroyed.
    [[nodiscard]] auto suspend() -> Frame;

    [[nodiscard]] auto currentScope() const noexcept -> ScopeId;

    auto registerCell(StateCellBase& cell) -> CellId;
    auto unregisterCell(StateCellBase& cell) -> void;
    [[nodiscard]] auto findCell(CellId id) const -> StateCellBase*;
    [[nodiscard]] auto cellCount() const noexcept -> std::size_t {
        return cells_.size();
    }

    auto recordRead(StateCellBase& cell) -> void;
    auto recordWrite(StateCellBase& cell) -> void;

    // Remove `scope` from the readers of every cell in `dependencies` and
    // clear the set. Called before a scope re-executes and when it is disposed.
    auto releaseDependencies(ScopeId scope, DependencySet& dependencies) -> void;

private:
    struct FrameState {
        ScopeId        scope;
        DependencySet* dependencies;
    };

    auto popFrame() noexcept -> void;

    InvalidationSink&                              sink_;
    std::vector<FrameState>                        frames_;
    phmap::flat_hash_map<CellId, StateCellBase*>   cells_;
    CellId                                         nextCellId_ = 1;
};

} // namespace CS::Runtime
