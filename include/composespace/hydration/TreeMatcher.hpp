#pragma once

#include <composespace/snapshot/ComponentNode.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace CS::Hydration {

enum class CompatibilityPolicy {
    // Type, key and child count equal at every level, children compared in order.
    Deep,
    // Root type only.
    Shallow,
};

[[nodiscard]] auto compatibilityPolicyToString(CompatibilityPolicy policy) -> std::string_view;

// Props never affect compatibility; differing props are patched.
[[nodiscard]] auto isTreeCompatible(ComponentNode const& server, ComponentNode const& client, CompatibilityPolicy policy)
        -> bool;

/**
 * What to do with each part of the server markup. Paths are client key
 * paths except `removed`, which names server-only subtrees.
 */
struct AdoptionPlan {
    // Roots differ in type or key: nothing can be adopted.
    bool                     full_render = false;
    // Nodes kept as-is; their markers get bound.
    std::vector<std::string> adopted;
    // Same type, different props: re-created from the client node.
    std::vector<std::string> patched;
    // Different type or client-only: rendered fresh.
    std::vector<std::string> rerender;
    std::vector<std::string> removed;

    [[nodiscard]] auto clean() const noexcept -> bool {
        return !full_render && patched.empty() && rerender.empty() && removed.empty();
    }
};

// Children are paired by key at every level.
[[nodiscard]] auto planAdoption(ComponentNode const& server, ComponentNode const& client) -> AdoptionPlan;

} // namespace CS::Hydration
