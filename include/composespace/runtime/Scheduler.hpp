#pragma once

#include <composespace/core/DiagnosticSink.hpp>
#include <composespace/core/Error.hpp>
#include <composespace/runtime/DependencyTracker.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace CS::Runtime {

enum class BatchMode {
    Explicit,  // flush() is called by the owner
    Immediate, // every invalidation outside a batch flushes synchronously
    Deferred,  // the first invalidation posts one flush through SchedulerOptions::post
};

struct SchedulerOptions {
    BatchMode   mode = BatchMode::Explicit;
    // Executions of one scope allowed within a single flush before it is
    // failed with SchedulingOverflow.
    std::size_t max_reexecutions_per_flush = 10;
    // Required for BatchMode::Deferred: hands the flush to a frame clock or
    // event loop that runs it later on the same thread.
    std::function<void(std::function<void()>)> post;
};

// Apply COMPOSESPACE_BATCH_MODE / COMPOSESPACE_MAX_REEXECUTIONS on top of `base`.
[[nodiscard]] auto schedulerOptionsFromEnvironment(SchedulerOptions base = {}) -> SchedulerOptions;

[[nodiscard]] auto batchModeToString(BatchMode mode) -> std::string_view;

/**
 * What the scheduler needs from the owner of the scope table.
 */
class ScopeHost {
public:
    virtual ~ScopeHost() = default;

    // Mark `scope` dirty; false when the scope is gone or failed.
    virtual auto markDirty(ScopeId scope) -> bool = 0;
    // Depth in the scope tree; nullopt when the scope is gone.
    [[nodiscard]] virtual auto scopeDepth(ScopeId scope) const -> std::optional<std::size_t> = 0;
    // Still alive and dirty (a parent may already have re-run it inline).
    [[nodiscard]] virtual auto scopeNeedsExecution(ScopeId scope) const -> bool = 0;
    virtual auto executeScope(ScopeId scope) -> Expected<void> = 0;
    virtual auto failScope(ScopeId scope, Error const& error) -> void = 0;
    // Commit executed scopes and run queued effects. Effects may invalidate
    // more scopes; those land in the next pass.
    virtual auto afterPass(std::span<ScopeId const> executed) -> std::vector<Error> = 0;
};

struct FlushReport {
    std::size_t          passes     = 0;
    std::size_t          executions = 0;
    std::vector<ScopeId> executed;
    std::vector<Error>   errors;
};

/**
 * Scheduler batches invalidated scopes and flushes them.
 *
 * The pending set is deduplicated. A flush runs passes until nothing is
 * pending; each pass executes the scopes pending at its start in ascending
 * depth so a parent runs (and possibly disposes or re-runs its children)
 * before any of its descendants. Invalidations raised during a pass go to the
 * next pass; flush() never re-enters itself.
 */
class Scheduler final : public InvalidationSink {
public:
    Scheduler(ScopeHost& host, SchedulerOptions options = {}, DiagnosticSink* diagnostics = nullptr);

    Scheduler(Scheduler const&)            = delete;
    Scheduler& operator=(Scheduler const&) = delete;

    auto invalidate(ScopeId scope) -> void override;

    auto flush() -> FlushReport;

    // Hold back Immediate-mode flushes until the outermost batch closes.
    template <typename Fn>
    auto batch(Fn&& fn) -> FlushReport {
        ++batchDepth_;
        struct Release {
            std::size_t& depth;
            ~Release() { --depth; }
        } release{batchDepth_};
        std::forward<Fn>(fn)();
        if (batchDepth_ == 1 && options_.mode == BatchMode::Immediate && !flushing_) {
            return this->flush();
        }
        return {};
    }

    // Drop `scope` from the pending set (it was disposed).
    auto forget(ScopeId scope) -> void;

    [[nodiscard]] auto hasPending() const noexcept -> bool {
        return !pending_.empty();
    }
    [[nodiscard]] auto pendingCount() const noexcept -> std::size_t {
        return pending_.size();
    }
    [[nodiscard]] auto isFlushing() const noexcept -> bool {
        return flushing_;
    }
    [[nodiscard]] auto options() const noexcept -> SchedulerOptions const& {
        return options_;
    }
    auto setDiagnostics(DiagnosticSink* diagnostics) noexcept -> void {
        diagnostics_ = diagnostics;
    }

    // Result of the last flush that was triggered implicitly (Immediate or
    // Deferred mode), for owners that want to inspect errors afterwards.
    [[nodiscard]] auto lastReport() const noexcept -> FlushReport const& {
        return lastReport_;
    }

private:
    auto runPass(FlushReport& report, phmap::flat_hash_map<ScopeId, std::size_t>& executions) -> void;
    auto reportError(Error const& error) -> void;

    ScopeHost&                        host_;
    SchedulerOptions                  options_;
    DiagnosticSink*                   diagnostics_ = nullptr;
    phmap::flat_hash_set<ScopeId>     pending_;
    bool                              flushing_    = false;
    bool                              posted_      = false;
    std::size_t                       batchDepth_  = 0;
    FlushReport                       lastReport_;
    // Expires with the scheduler so a deferred flush posted to an outside
    // loop is dropped instead of touching a destroyed object.
    std::shared_ptr<bool>             alive_ = std::make_shared<bool>(true);
};

} // namespace CS::Runtime
