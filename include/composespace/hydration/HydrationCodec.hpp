#pragma once

#include <composespace/core/Error.hpp>
#include <composespace/hydration/HydrationContext.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace CS::Hydration {

// Root marker plus one marker per interactive node, id = key path. Fails
// with DuplicateMarker when two markers would share an id.
[[nodiscard]] auto generateMarkers(ComponentNode const& tree) -> Expected<std::vector<DOMMarker>>;

[[nodiscard]] auto validateMarkers(std::vector<DOMMarker> const& markers) -> Expected<void>;

// Wire form (camelCase keys). Fails with DuplicateMarker or MalformedInput
// (non-positive timestamp) instead of emitting an ambiguous context.
[[nodiscard]] auto encodeHydrationContext(HydrationContext const& context) -> Expected<std::string>;

// Fails with DeserializationFailure on malformed JSON, a missing or ill-typed
// componentTree/timestamp, non-scalar state values or repeated marker ids.
[[nodiscard]] auto decodeHydrationContext(std::string_view payload) -> Expected<HydrationContext>;

[[nodiscard]] auto currentTimestampMs() -> std::int64_t;

} // namespace CS::Hydration
