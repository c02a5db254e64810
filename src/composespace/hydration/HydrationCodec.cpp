#include <composespace/hydration/HydrationCodec.hpp>

#include "log/TaggedLogger.hpp"
#include "snapshot/JsonDetail.hpp"

#include <chrono>
#include <set>
#include <string>
#include <utility>

namespace CS::Hydration {

using detail::Json;
using detail::make_error;

auto hydrationPriorityToString(HydrationPriority priority) -> std::string_view {
    switch (priority) {
    case HydrationPriority::Critical:
        return "critical";
    case HydrationPriority::Visible:
        return "visible";
    case HydrationPriority::Near:
        return "near";
    case HydrationPriority::Deferred:
        return "deferred";
    }
    return "visible";
}

auto parseHydrationPriority(std::string_view text) -> std::optional<HydrationPriority> {
    if (text == "critical") {
        return HydrationPriority::Critical;
    }
    if (text == "visible") {
        return HydrationPriority::Visible;
    }
    if (text == "near") {
        return HydrationPriority::Near;
    }
    if (text == "deferred") {
        return HydrationPriority::Deferred;
    }
    return std::nullopt;
}

auto DOMMarker::priority() const -> HydrationPriority {
    if (auto it = attributes.find(std::string{kMarkerPriorityAttribute}); it != attributes.end()) {
        if (auto parsed = parseHydrationPriority(it->second)) {
            return *parsed;
        }
    }
    return HydrationPriority::Visible;
}

auto HydrationContext::findMarker(std::string_view id) const -> DOMMarker const* {
    for (auto const& marker : hydration_markers) {
        if (marker.id == id) {
            return &marker;
        }
    }
    return nullptr;
}

namespace {

auto join_events(std::vector<std::string> const& events) -> std::string {
    std::string joined;
    for (auto const& name : events) {
        if (!joined.empty()) {
            joined.push_back(',');
        }
        joined.append(name);
    }
    return joined;
}

auto make_marker(std::string id, ComponentNode const& node, HydrationPriority fallback) -> DOMMarker {
    auto priority = fallback;
    if (auto it = node.props.find(std::string{kPriorityProp}); it != node.props.end()) {
        if (auto text = it->second.asString()) {
            if (auto parsed = parseHydrationPriority(*text)) {
                priority = *parsed;
            }
        }
    }

    DOMMarker marker;
    marker.type = node.type;
    marker.attributes.emplace(kMarkerIdAttribute, id);
    marker.attributes.emplace(kMarkerComponentAttribute, node.type);
    marker.attributes.emplace(kMarkerKeyAttribute, node.key);
    if (!node.events.empty()) {
        marker.attributes.emplace(kMarkerEventsAttribute, join_events(node.events));
    }
    marker.attributes.emplace(kMarkerPriorityAttribute, hydrationPriorityToString(priority));
    marker.id = std::move(id);
    return marker;
}

auto marker_to_json(DOMMarker const& marker) -> Json {
    auto attributes = Json::object();
    for (auto const& [name, value] : marker.attributes) {
        attributes[name] = value;
    }
    return Json{{"id", marker.id}, {"type", marker.type}, {"attributes", std::move(attributes)}};
}

auto marker_from_json(Json const& json) -> Expected<DOMMarker> {
    if (auto ensure = detail::ensure_object(json, "hydrationMarkers[]"); !ensure) {
        return std::unexpected(ensure.error());
    }
    DOMMarker marker;
    auto      id = detail::read_string(json, "id");
    if (!id) {
        return std::unexpected(id.error());
    }
    if (id->empty()) {
        return std::unexpected(make_error(Error::Code::DeserializationFailure, "id", "must not be empty"));
    }
    marker.id = std::move(*id);

    auto type = detail::read_optional_string(json, "type");
    if (!type) {
        return std::unexpected(type.error());
    }
    marker.type = std::move(*type);

    if (auto it = json.find("attributes"); it != json.end() && !it->is_null()) {
        if (!it->is_object()) {
            return std::unexpected(
                    make_error(Error::Code::DeserializationFailure, "attributes", "must be a JSON object"));
        }
        for (auto const& [name, value] : it->items()) {
            if (!value.is_string()) {
                return std::unexpected(
                        make_error(Error::Code::DeserializationFailure, "attributes." + name, "must be a string"));
            }
            marker.attributes.emplace(name, value.get<std::string>());
        }
    }
    return marker;
}

auto read_timestamp(Json const& json) -> Expected<std::int64_t> {
    auto it = json.find("timestamp");
    if (it == json.end()) {
        return std::unexpected(make_error(Error::Code::DeserializationFailure, "timestamp", "is required"));
    }
    if (!it->is_number_integer()) {
        return std::unexpected(make_error(Error::Code::DeserializationFailure, "timestamp", "must be an integer"));
    }
    auto timestamp = it->is_number_unsigned() ? static_cast<std::int64_t>(it->get<std::uint64_t>())
                                              : it->get<std::int64_t>();
    if (timestamp <= 0) {
        return std::unexpected(make_error(Error::Code::DeserializationFailure, "timestamp", "must be positive"));
    }
    return timestamp;
}

} // namespace

auto generateMarkers(ComponentNode const& tree) -> Expected<std::vector<DOMMarker>> {
    std::vector<DOMMarker> markers;
    markers.push_back(make_marker(std::string{kRootMarkerId}, tree, HydrationPriority::Critical));

    visitWithKeyPaths(tree, [&](ComponentNode const& node, std::string const& path) {
        if (&node == &tree || !node.isInteractive()) {
            return;
        }
        markers.push_back(make_marker(path, node, HydrationPriority::Visible));
    });

    if (auto valid = validateMarkers(markers); !valid) {
        return std::unexpected(valid.error());
    }
    return markers;
}

auto validateMarkers(std::vector<DOMMarker> const& markers) -> Expected<void> {
    std::set<std::string_view> seen;
    for (auto const& marker : markers) {
        if (!seen.insert(marker.id).second) {
            return std::unexpected(make_error(Error::Code::DuplicateMarker, "marker id '" + marker.id + "'",
                                              "appears more than once in the context"));
        }
    }
    return {};
}

auto encodeHydrationContext(HydrationContext const& context) -> Expected<std::string> {
    if (auto valid = validateMarkers(context.hydration_markers); !valid) {
        return std::unexpected(valid.error());
    }
    if (context.timestamp <= 0) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "timestamp", "must be positive"));
    }

    auto state = Json::object();
    for (auto const& [key, value] : context.state_data) {
        state[key] = detail::value_to_json(value);
    }
    auto markers = Json::array();
    for (auto const& marker : context.hydration_markers) {
        markers.push_back(marker_to_json(marker));
    }
    Json json{{"componentTree", detail::node_to_json(context.component_tree)},
              {"stateData", std::move(state)},
              {"hydrationMarkers", std::move(markers)},
              {"timestamp", context.timestamp}};
    return json.dump();
}

auto decodeHydrationContext(std::string_view payload) -> Expected<HydrationContext> {
    auto json = Json::parse(payload, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(make_error(Error::Code::DeserializationFailure, "context", "JSON parse error"));
    }
    if (auto ensure = detail::ensure_object(json, "context"); !ensure) {
        return std::unexpected(ensure.error());
    }

    HydrationContext context;
    auto             tree = json.find("componentTree");
    if (tree == json.end()) {
        return std::unexpected(make_error(Error::Code::DeserializationFailure, "componentTree", "is required"));
    }
    auto root = detail::node_from_json(*tree, "componentTree", std::string{kRootKey});
    if (!root) {
        return std::unexpected(root.error());
    }
    context.component_tree = std::move(*root);

    auto timestamp = read_timestamp(json);
    if (!timestamp) {
        return std::unexpected(timestamp.error());
    }
    context.timestamp = *timestamp;

    if (auto it = json.find("stateData"); it != json.end() && !it->is_null()) {
        if (!it->is_object()) {
            return std::unexpected(
                    make_error(Error::Code::DeserializationFailure, "stateData", "must be a JSON object"));
        }
        for (auto const& [key, raw] : it->items()) {
            auto value = detail::value_from_json(raw, "stateData." + key);
            if (!value) {
                return std::unexpected(value.error());
            }
            context.state_data.emplace(key, std::move(*value));
        }
    }

    if (auto it = json.find("hydrationMarkers"); it != json.end() && !it->is_null()) {
        if (!it->is_array()) {
            return std::unexpected(
                    make_error(Error::Code::DeserializationFailure, "hydrationMarkers", "must be an array"));
        }
        for (auto const& raw : *it) {
            auto marker = marker_from_json(raw);
            if (!marker) {
                return std::unexpected(marker.error());
            }
            context.hydration_markers.push_back(std::move(*marker));
        }
        if (auto valid = validateMarkers(context.hydration_markers); !valid) {
            return std::unexpected(
                    make_error(Error::Code::DeserializationFailure, "hydrationMarkers", *valid.error().message));
        }
    }

    cs_log("decoded hydration context: " + std::to_string(countNodes(context.component_tree)) + " node(s), "
                   + std::to_string(context.hydration_markers.size()) + " marker(s)",
           "Hydration", "DEBUG");
    return context;
}

auto currentTimestampMs() -> std::int64_t {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

} // namespace CS::Hydration
