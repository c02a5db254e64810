#pragma once

#include <composespace/core/Value.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace CS {

inline constexpr std::string_view kTextNodeType     = "#text";
inline constexpr std::string_view kFragmentNodeType = "#fragment";
inline constexpr std::string_view kTextValueProp    = "value";
inline constexpr std::string_view kRootKey          = "root";
inline constexpr char             kKeyPathSeparator = '/';

/**
 * ComponentNode is a structural, serializable description of rendered output.
 *
 * A pure value: no back-references to live scopes or handlers. `events`
 * lists the names of handlers the live tree binds to this node (sorted);
 * a non-empty list is what makes a node interactive for hydration.
 */
struct ComponentNode {
    std::string                type;
    PropMap                    props;
    std::vector<ComponentNode> children;
    std::string                key;
    std::vector<std::string>   events;

    friend auto operator==(ComponentNode const&, ComponentNode const&) -> bool = default;

    [[nodiscard]] auto isInteractive() const noexcept -> bool {
        return !events.empty();
    }
};

// Same type, key, child count and order at every level; props and events ignored.
[[nodiscard]] auto structurallyEqual(ComponentNode const& lhs, ComponentNode const& rhs) -> bool;

[[nodiscard]] auto countNodes(ComponentNode const& node) -> std::size_t;

[[nodiscard]] auto joinKeyPath(std::string_view parent, std::string_view key) -> std::string;

// `path` equals `ancestor` or lies below it.
[[nodiscard]] auto isWithinKeyPath(std::string_view path, std::string_view ancestor) -> bool;

// Resolve a key path ("root/0/submit") relative to `root`, whose own key is
// the first segment. Returns nullptr when any segment is missing.
[[nodiscard]] auto findByKeyPath(ComponentNode const& root, std::string_view path) -> ComponentNode const*;

// Visit every node depth-first, pre-order, with its key path.
template <typename Visitor>
auto visitWithKeyPaths(ComponentNode const& node, std::string const& path, Visitor&& visitor) -> void {
    visitor(node, path);
    for (auto const& child : node.children) {
        visitWithKeyPaths(child, joinKeyPath(path, child.key), visitor);
    }
}

template <typename Visitor>
auto visitWithKeyPaths(ComponentNode const& root, Visitor&& visitor) -> void {
    visitWithKeyPaths(root, root.key, std::forward<Visitor>(visitor));
}

} // namespace CS
