#pragma once

#include <composespace/core/Value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace CS::Runtime {

/**
 * Keyed store for state that must outlive a composition: restored hydration
 * state on the client, collected state on the server. Always handed to a
 * Composition explicitly through CompositionOptions.
 */
class SavedStateRegistry {
public:
    virtual ~SavedStateRegistry() = default;

    [[nodiscard]] virtual auto get(std::string_view key) const -> std::optional<Value> = 0;
    virtual auto set(std::string const& key, Value value) -> void                   = 0;
    virtual auto erase(std::string_view key) -> bool                                = 0;
    [[nodiscard]] virtual auto entries() const -> StateData                         = 0;
};

class InMemorySavedStateRegistry final : public SavedStateRegistry {
public:
    InMemorySavedStateRegistry() = default;
    explicit InMemorySavedStateRegistry(StateData initial);

    [[nodiscard]] auto get(std::string_view key) const -> std::optional<Value> override;
    auto set(std::string const& key, Value value) -> void override;
    auto erase(std::string_view key) -> bool override;
    [[nodiscard]] auto entries() const -> StateData override;

    // Merge `data` over the current entries.
    auto restore(StateData const& data) -> void;

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return entries_.size();
    }

private:
    StateData entries_;
};

} // namespace CS::Runtime
