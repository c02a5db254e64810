#include <composespace/snapshot/ComponentNode.hpp>

namespace CS {

auto structurallyEqual(ComponentNode const& lhs, ComponentNode const& rhs) -> bool {
    if (lhs.type != rhs.type || lhs.key != rhs.key || lhs.children.size() != rhs.children.size()) {
        return false;
    }
    for (std::size_t index = 0; index < lhs.children.size(); ++index) {
        if (!structurallyEqual(lhs.children[index], rhs.children[index])) {
            return false;
        }
    }
    return true;
}

auto countNodes(ComponentNode const& node) -> std::size_t {
    std::size_t total = 1;
    for (auto const& child : node.children) {
        total += countNodes(child);
    }
    return total;
}

auto joinKeyPath(std::string_view parent, std::string_view key) -> std::string {
    std::string path;
    path.reserve(parent.size() + 1 + key.size());
    path.append(parent);
    path.push_back(kKeyPathSeparator);
    path.append(key);
    return path;
}

auto isWithinKeyPath(std::string_view path, std::string_view ancestor) -> bool {
    if (!path.starts_with(ancestor)) {
        return false;
    }
    return path.size() == ancestor.size() || path[ancestor.size()] == kKeyPathSeparator;
}

auto findByKeyPath(ComponentNode const& root, std::string_view path) -> ComponentNode const* {
    auto next_segment = [&path]() -> std::string_view {
        auto const split   = path.find(kKeyPathSeparator);
        auto const segment = path.substr(0, split);
        path = split == std::string_view::npos ? std::string_view{} : path.substr(split + 1);
        return segment;
    };

    if (next_segment() != root.key) {
        return nullptr;
    }
    ComponentNode const* current = &root;
    while (!path.empty()) {
        auto const segment = next_segment();
        ComponentNode const* match = nullptr;
        for (auto const& child : current->children) {
            if (child.key == segment) {
                match = &child;
                break;
            }
        }
        if (match == nullptr) {
            return nullptr;
        }
        current = match;
    }
    return current;
}

} // namespace CS
