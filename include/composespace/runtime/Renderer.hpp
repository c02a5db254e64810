#pragma once

#include <composespace/core/Error.hpp>
#include <composespace/core/Value.hpp>
#include <composespace/snapshot/ComponentNode.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace CS::Runtime {

struct EventPayload {
    std::string name;
    Value       value;
};

using EventHandler = std::function<void(EventPayload const&)>;
using LiveHandlers = std::map<std::string, EventHandler>;

// Key path -> handlers of the live node at that path.
using LiveBindings = std::map<std::string, LiveHandlers>;

/**
 * Renderer is the presentation collaborator. The runtime never builds
 * DOM/UI primitives itself; it hands finished structure to a Renderer.
 *
 * Mount paths are key paths (see ComponentNode). createOrUpdate() receives
 * the whole subtree rooted at `node` and replaces whatever was mounted at
 * that path. bindMarker() attaches live handlers to an existing element
 * without recreating it. Hydration and later commits both pass the node's
 * key path, so the root is bound under its own key even though its server
 * marker id is always "root". After createOrUpdate() the runtime binds the
 * handlers of every interactive node in the new subtree the same way.
 */
class Renderer {
public:
    virtual ~Renderer() = default;

    virtual auto createOrUpdate(ComponentNode const& node, std::string_view mount_path) -> Expected<void> = 0;
    virtual auto bindMarker(std::string_view marker_id, LiveHandlers const& handlers) -> Expected<void> = 0;

    // Drop a server-rendered subtree the client no longer produces.
    virtual auto remove(std::string_view mount_path) -> Expected<void> {
        (void)mount_path;
        return {};
    }
};

} // namespace CS::Runtime
