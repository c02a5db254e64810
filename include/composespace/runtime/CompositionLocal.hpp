#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <utility>

namespace CS::Runtime {

using LocalId  = std::uint64_t;
using LocalMap = std::map<LocalId, std::shared_ptr<void const>>;

[[nodiscard]] auto nextCompositionLocalId() noexcept -> LocalId;

/**
 * A value provided implicitly to everything declared inside a
 * Composer::provide() block, nested scopes included. Locals are static:
 * reading one does not subscribe the reader, and a changed value reaches a
 * child only when the providing scope re-executes.
 */
template <typename T>
class CompositionLocal {
public:
    explicit CompositionLocal(T defaultValue)
        : id_(nextCompositionLocalId()), default_(std::move(defaultValue)) {}

    CompositionLocal(CompositionLocal const&)            = delete;
    CompositionLocal& operator=(CompositionLocal const&) = delete;

    [[nodiscard]] auto id() const noexcept -> LocalId {
        return id_;
    }
    [[nodiscard]] auto defaultValue() const noexcept -> T const& {
        return default_;
    }

private:
    LocalId id_;
    T       default_;
};

} // namespace CS::Runtime
