#include <composespace/snapshot/SnapshotJson.hpp>

#include "snapshot/JsonDetail.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <set>
#include <string>
#include <utility>

namespace CS {
namespace detail {

auto value_to_json(Value const& value) -> Json {
    switch (value.kind()) {
    case Value::Kind::Null:
        return nullptr;
    case Value::Kind::Bool:
        return *value.asBool();
    case Value::Kind::Int:
        return *value.asInt();
    case Value::Kind::Double: {
        auto number = *value.asDouble();
        if (!std::isfinite(number)) {
            return nullptr;
        }
        return number;
    }
    case Value::Kind::String:
        return *value.asString();
    }
    return nullptr;
}

auto value_from_json(Json const& json, std::string_view field) -> Expected<Value> {
    if (json.is_null()) {
        return Value{};
    }
    if (json.is_boolean()) {
        return Value{json.get<bool>()};
    }
    if (json.is_number_unsigned()) {
        auto raw = json.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::unexpected(make_error(Error::Code::DeserializationFailure, field, "integer out of range"));
        }
        return Value{static_cast<std::int64_t>(raw)};
    }
    if (json.is_number_integer()) {
        return Value{json.get<std::int64_t>()};
    }
    if (json.is_number_float()) {
        return Value{json.get<double>()};
    }
    if (json.is_string()) {
        return Value{json.get<std::string>()};
    }
    return std::unexpected(make_error(Error::Code::DeserializationFailure, field, "must be a scalar value"));
}

auto node_to_json(ComponentNode const& node) -> Json {
    Json json{{"type", node.type}, {"key", node.key}};
    if (!node.props.empty()) {
        auto props = Json::object();
        for (auto const& [name, value] : node.props) {
            props[name] = value_to_json(value);
        }
        json["props"] = std::move(props);
    }
    if (!node.children.empty()) {
        auto children = Json::array();
        for (auto const& child : node.children) {
            children.push_back(node_to_json(child));
        }
        json["children"] = std::move(children);
    }
    if (!node.events.empty()) {
        json["events"] = node.events;
    }
    return json;
}

auto node_from_json(Json const& json, std::string_view context, std::string positionalKey) -> Expected<ComponentNode> {
    if (auto ensure = ensure_object(json, context); !ensure) {
        return std::unexpected(ensure.error());
    }

    ComponentNode node;
    auto          type = read_string(json, "type");
    if (!type) {
        return std::unexpected(type.error());
    }
    if (type->empty()) {
        return std::unexpected(make_error(Error::Code::DeserializationFailure, "type", "must not be empty"));
    }
    node.type = std::move(*type);

    auto key = read_optional_string(json, "key");
    if (!key) {
        return std::unexpected(key.error());
    }
    node.key = key->empty() ? std::move(positionalKey) : std::move(*key);

    if (auto it = json.find("props"); it != json.end() && !it->is_null()) {
        if (!it->is_object()) {
            return std::unexpected(make_error(Error::Code::DeserializationFailure, "props", "must be a JSON object"));
        }
        for (auto const& [name, raw] : it->items()) {
            auto value = value_from_json(raw, "props." + name);
            if (!value) {
                return std::unexpected(value.error());
            }
            node.props.emplace(name, std::move(*value));
        }
    }

    if (auto it = json.find("children"); it != json.end() && !it->is_null()) {
        if (!it->is_array()) {
            return std::unexpected(make_error(Error::Code::DeserializationFailure, "children", "must be an array"));
        }
        node.children.reserve(it->size());
        std::set<std::string> siblingKeys;
        for (auto const& raw : *it) {
            auto child = node_from_json(raw, "children[]", std::to_string(node.children.size()));
            if (!child) {
                return std::unexpected(child.error());
            }
            if (!siblingKeys.insert(child->key).second) {
                return std::unexpected(
                        make_error(Error::Code::DeserializationFailure, "children", "duplicate key '" + child->key + "'"));
            }
            node.children.push_back(std::move(*child));
        }
    }

    if (auto it = json.find("events"); it != json.end() && !it->is_null()) {
        if (!it->is_array()) {
            return std::unexpected(make_error(Error::Code::DeserializationFailure, "events", "must be an array"));
        }
        for (auto const& raw : *it) {
            if (!raw.is_string()) {
                return std::unexpected(make_error(Error::Code::DeserializationFailure, "events", "must hold strings"));
            }
            node.events.push_back(raw.get<std::string>());
        }
    }
    return node;
}

} // namespace detail

auto serializeComponentTree(ComponentNode const& root) -> std::string {
    return detail::node_to_json(root).dump();
}

auto deserializeComponentTree(std::string_view payload) -> Expected<ComponentNode> {
    auto json = detail::Json::parse(payload, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(
                detail::make_error(Error::Code::DeserializationFailure, "componentTree", "JSON parse error"));
    }
    return detail::node_from_json(json, "componentTree", std::string{kRootKey});
}

} // namespace CS
