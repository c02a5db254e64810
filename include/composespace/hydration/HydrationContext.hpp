#pragma once

#include <composespace/core/Value.hpp>
#include <composespace/snapshot/ComponentNode.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace CS::Hydration {

inline constexpr std::string_view kRootMarkerId = "root";

// Prop a render function sets on a node to pick its hydration priority.
inline constexpr std::string_view kPriorityProp = "data-hydration-priority";

inline constexpr std::string_view kMarkerIdAttribute        = "data-cs-hydration-id";
inline constexpr std::string_view kMarkerComponentAttribute = "data-cs-component";
inline constexpr std::string_view kMarkerKeyAttribute       = "data-cs-key";
inline constexpr std::string_view kMarkerEventsAttribute    = "data-cs-events";
inline constexpr std::string_view kMarkerPriorityAttribute  = "data-cs-priority";

// Bind order for markers; lower binds first.
enum class HydrationPriority {
    Critical,
    Visible,
    Near,
    Deferred,
};

[[nodiscard]] auto hydrationPriorityToString(HydrationPriority priority) -> std::string_view;
[[nodiscard]] auto parseHydrationPriority(std::string_view text) -> std::optional<HydrationPriority>;

struct DOMMarker {
    std::string                        id;
    std::string                        type;
    std::map<std::string, std::string> attributes;

    friend auto operator==(DOMMarker const&, DOMMarker const&) -> bool = default;

    // From the data-cs-priority attribute; Visible when absent or unknown.
    [[nodiscard]] auto priority() const -> HydrationPriority;
};

/**
 * Everything the server hands the client for one render pass. Produced once
 * per pass and consumed once by the client; never kept as live state.
 */
struct HydrationContext {
    ComponentNode          component_tree;
    StateData              state_data;
    std::vector<DOMMarker> hydration_markers;
    // Epoch milliseconds.
    std::int64_t           timestamp = 0;

    friend auto operator==(HydrationContext const&, HydrationContext const&) -> bool = default;

    [[nodiscard]] auto findMarker(std::string_view id) const -> DOMMarker const*;
};

} // namespace CS::Hydration
