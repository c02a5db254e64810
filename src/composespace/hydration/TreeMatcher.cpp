#include <composespace/hydration/TreeMatcher.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <utility>

namespace CS::Hydration {

namespace {

auto deep_compatible(ComponentNode const& server, ComponentNode const& client) -> bool {
    if (server.type != client.type || server.key != client.key
        || server.children.size() != client.children.size()) {
        return false;
    }
    for (std::size_t index = 0; index < server.children.size(); ++index) {
        if (!deep_compatible(server.children[index], client.children[index])) {
            return false;
        }
    }
    return true;
}

auto plan_node(ComponentNode const& server, ComponentNode const& client, std::string const& path, AdoptionPlan& plan)
        -> void {
    std::map<std::string_view, ComponentNode const*> serverChildren;
    bool                                             uniqueKeys = true;
    for (auto const& child : server.children) {
        uniqueKeys = serverChildren.emplace(child.key, &child).second && uniqueKeys;
    }
    // A patch re-creates the whole subtree from the client node, which also
    // drops server siblings that cannot be told apart by key.
    if (server.props != client.props || !uniqueKeys) {
        plan.patched.push_back(path);
        return;
    }
    plan.adopted.push_back(path);

    for (auto const& child : client.children) {
        auto childPath = joinKeyPath(path, child.key);
        auto match     = serverChildren.find(child.key);
        if (match == serverChildren.end()) {
            plan.rerender.push_back(std::move(childPath));
            continue;
        }
        auto const* serverChild = match->second;
        serverChildren.erase(match);
        if (serverChild->type != child.type) {
            plan.rerender.push_back(std::move(childPath));
            continue;
        }
        plan_node(*serverChild, child, childPath, plan);
    }
    for (auto const& [key, leftover] : serverChildren) {
        plan.removed.push_back(joinKeyPath(path, leftover->key));
    }
}

} // namespace

auto compatibilityPolicyToString(CompatibilityPolicy policy) -> std::string_view {
    switch (policy) {
    case CompatibilityPolicy::Deep:
        return "deep";
    case CompatibilityPolicy::Shallow:
        return "shallow";
    }
    return "deep";
}

auto isTreeCompatible(ComponentNode const& server, ComponentNode const& client, CompatibilityPolicy policy) -> bool {
    if (policy == CompatibilityPolicy::Shallow) {
        return server.type == client.type;
    }
    return deep_compatible(server, client);
}

auto planAdoption(ComponentNode const& server, ComponentNode const& client) -> AdoptionPlan {
    AdoptionPlan plan;
    if (server.type != client.type || server.key != client.key) {
        plan.full_render = true;
        return plan;
    }
    plan_node(server, client, client.key, plan);
    return plan;
}

} // namespace CS::Hydration
