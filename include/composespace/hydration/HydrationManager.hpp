#pragma once

#include <composespace/core/DiagnosticSink.hpp>
#include <composespace/core/Error.hpp>
#include <composespace/hydration/HydrationContext.hpp>
#include <composespace/hydration/TreeMatcher.hpp>
#include <composespace/runtime/Composition.hpp>
#include <composespace/runtime/Renderer.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace CS::Hydration {

enum class HydrationPhase {
    Idle,
    Deserializing,
    Matching,
    Adopted,
    Mismatched,
    AdoptedWithFallback,
    FullClientRender,
};

[[nodiscard]] auto hydrationPhaseToString(HydrationPhase phase) -> std::string_view;

struct HydrationOptions {
    CompatibilityPolicy policy      = CompatibilityPolicy::Deep;
    DiagnosticSink*     diagnostics = nullptr;
};

// Apply COMPOSESPACE_HYDRATION_POLICY on top of `base`.
[[nodiscard]] auto hydrationOptionsFromEnvironment(HydrationOptions base = {}) -> HydrationOptions;

// The element the client mounts into; an empty tag skips the root tag check.
struct MountElement {
    std::string tag_name;
    std::string id;
};

struct HydrationReport {
    HydrationPhase           phase      = HydrationPhase::Idle;
    bool                     compatible = false;
    std::size_t              adopted    = 0;
    std::size_t              patched    = 0;
    // Subtrees rendered fresh.
    std::size_t              rerendered = 0;
    std::size_t              removed    = 0;
    // Key paths of bound markers, in binding order.
    std::vector<std::string> bound_markers;
    // Renderer failures and classified hydration errors; none of them stopped
    // hydration.
    std::vector<Error>       errors;
};

/**
 * HydrationManager adopts server markup into a live client composition.
 *
 *     Idle -> Deserializing -> Matching -> Adopted
 *                                       -> Mismatched -> AdoptedWithFallback
 *                                                     -> FullClientRender
 *
 * Borrows the server context and the client capture for the duration of one
 * match and never mutates either. One manager handles one context; call
 * reset() before reusing it.
 */
class HydrationManager {
public:
    explicit HydrationManager(HydrationOptions options = {});

    // Server side: context for `tree` with a root marker and one marker per
    // interactive node.
    [[nodiscard]] auto serializeHydrationContext(ComponentNode const&        tree,
                                                 StateData                   state_data = {},
                                                 std::optional<std::int64_t> timestamp  = std::nullopt) const
            -> Expected<HydrationContext>;

    // Parse `contextData`; on success the manager is left in Matching.
    auto deserializeAndMatch(std::string_view contextData, MountElement const& root = {}) -> Expected<HydrationContext>;

    [[nodiscard]] auto validateTreeCompatibility(HydrationContext const& serverContext, ComponentNode const& clientTree) const
            -> bool;

    auto adopt(HydrationContext&& context, Runtime::CapturedTree const& client, Runtime::Renderer& renderer)
            -> Expected<HydrationReport>;

    // deserializeAndMatch() then adopt(); a context that fails to decode
    // falls back to rendering the whole client tree.
    auto hydrate(std::string_view             contextData,
                 Runtime::CapturedTree const& client,
                 Runtime::Renderer&           renderer,
                 MountElement const&          root = {}) -> Expected<HydrationReport>;

    // Render `client` from scratch and bind its handlers.
    auto renderClientTree(Runtime::CapturedTree const& client, Runtime::Renderer& renderer, HydrationReport& report)
            -> void;

    auto reset() -> void;

    [[nodiscard]] auto phase() const noexcept -> HydrationPhase {
        return phase_;
    }
    [[nodiscard]] auto options() const noexcept -> HydrationOptions const& {
        return options_;
    }

private:
    auto transition(HydrationPhase next) -> void;
    auto requireFresh(std::string_view operation) const -> Expected<void>;
    auto record(HydrationReport& report, Error error, std::string_view origin) -> void;
    auto renderSubtree(Runtime::CapturedTree const& client, std::string const& path, Runtime::Renderer& renderer,
                       HydrationReport& report) -> void;

    HydrationOptions options_;
    HydrationPhase   phase_ = HydrationPhase::Idle;
};

} // namespace CS::Hydration
