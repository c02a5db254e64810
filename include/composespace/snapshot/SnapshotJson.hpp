#pragma once

#include <composespace/core/Error.hpp>
#include <composespace/snapshot/ComponentNode.hpp>

#include <string>
#include <string_view>

namespace CS {

// {"type":..., "key":..., "props":{...}, "children":[...], "events":[...]};
// empty props, children and events are left out.
[[nodiscard]] auto serializeComponentTree(ComponentNode const& root) -> std::string;

// Fails with DeserializationFailure on malformed JSON, a missing or non-string
// "type", or a non-scalar prop value. Never returns a partial tree.
[[nodiscard]] auto deserializeComponentTree(std::string_view payload) -> Expected<ComponentNode>;

} // namespace CS
