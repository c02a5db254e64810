#pragma once

#include <composespace/runtime/DependencyTracker.hpp>

#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace CS::Runtime {

/**
 * Type-erased part of a state cell: identity, version, and the set of scopes
 * that read it during their last execution. Reader ids are weak; an id whose
 * scope has been disposed is skipped by the scheduler.
 */
class StateCellBase {
public:
    StateCellBase(DependencyTracker& tracker, ScopeId owner);
    virtual ~StateCellBase();

    StateCellBase(StateCellBase const&)            = delete;
    StateCellBase& operator=(StateCellBase const&) = delete;

    [[nodiscard]] auto id() const noexcept -> CellId {
        return id_;
    }
    [[nodiscard]] auto owner() const noexcept -> ScopeId {
        return owner_;
    }
    [[nodiscard]] auto version() const noexcept -> std::uint64_t {
        return version_;
    }
    [[nodiscard]] auto readers() const noexcept -> ReaderSet const& {
        return readers_;
    }

protected:
    auto trackRead() -> void;
    // Bump the version and invalidate readers. Callers have already checked
    // that the value actually changed.
    auto publishWrite() -> void;

private:
    friend class DependencyTracker;

    DependencyTracker& tracker_;
    CellId             id_      = 0;
    ScopeId            owner_   = kNoScope;
    std::uint64_t      version_ = 0;
    ReaderSet          readers_;
};

template <typename T>
    requires std::equality_comparable<T>
class StateCell final : public StateCellBase {
public:
    using WriteHook = std::function<void(T const&)>;

    StateCell(DependencyTracker& tracker, ScopeId owner, T initial)
        : StateCellBase(tracker, owner), value_(std::move(initial)) {}

    // Tracked read: registers the executing scope (if any) as a reader.
    auto read() -> T const& {
        this->trackRead();
        return value_;
    }

    // Untracked read.
    [[nodiscard]] auto peek() const noexcept -> T const& {
        return value_;
    }

    // Returns false, and invalidates nothing, when the value is unchanged.
    auto write(T value) -> bool {
        if (value_ == value) {
            return false;
        }
        value_ = std::move(value);
        if (hook_) {
            hook_(value_);
        }
        this->publishWrite();
        return true;
    }

    template <typename Fn>
    auto update(Fn&& fn) -> bool {
        T next = value_;
        std::forward<Fn>(fn)(next);
        return this->write(std::move(next));
    }

    auto setWriteHook(WriteHook hook) -> void {
        hook_ = std::move(hook);
    }

private:
    T         value_;
    WriteHook hook_;
};

enum class AsyncStatus {
    Pending,
    Ready,
    Failed,
};

/**
 * A value produced outside the composition (an in-flight request, a timer).
 * Reading it inside a scope subscribes the scope; resolve()/fail() behave
 * exactly like a state write, so completion shows up as an ordinary
 * invalidation and never blocks the scheduler.
 */
template <typename T>
    requires std::equality_comparable<T>
class AsyncValue {
public:
    struct Result {
        AsyncStatus      status = AsyncStatus::Pending;
        std::optional<T> value;
        std::string      error;

        friend auto operator==(Result const&, Result const&) -> bool = default;
    };

    AsyncValue(DependencyTracker& tracker, ScopeId owner)
        : cell_(tracker, owner, Result{}) {}

    [[nodiscard]] auto status() -> AsyncStatus {
        return cell_.read().status;
    }

    // nullptr while pending or failed.
    [[nodiscard]] auto value() -> T const* {
        auto const& result = cell_.read();
        return result.value ? &*result.value : nullptr;
    }

    [[nodiscard]] auto error() -> std::optional<std::string> {
        auto const& result = cell_.read();
        if (result.status != AsyncStatus::Failed) {
            return std::nullopt;
        }
        return result.error;
    }

    auto resolve(T value) -> bool {
        return cell_.write(Result{AsyncStatus::Ready, std::move(value), {}});
    }

    auto fail(std::string message) -> bool {
        return cell_.write(Result{AsyncStatus::Failed, std::nullopt, std::move(message)});
    }

    // Back to pending, e.g. when a request is re-issued.
    auto reset() -> bool {
        return cell_.write(Result{});
    }

    [[nodiscard]] auto cell() noexcept -> StateCell<Result>& {
        return cell_;
    }

private:
    StateCell<Result> cell_;
};

} // namespace CS::Runtime
