#pragma once

#include <composespace/core/Error.hpp>
#include <composespace/core/Value.hpp>
#include <composespace/snapshot/ComponentNode.hpp>

#include "nlohmann/json.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace CS::detail {

using Json = nlohmann::json;

[[nodiscard]] inline auto make_error(Error::Code code, std::string_view message) -> Error {
    return Error{code, std::string(message)};
}

[[nodiscard]] inline auto make_error(Error::Code code, std::string_view field, std::string_view detail) -> Error {
    std::string message;
    message.reserve(field.size() + detail.size() + 2);
    message.append(field);
    if (!detail.empty()) {
        message.append(": ");
        message.append(detail);
    }
    return Error{code, std::move(message)};
}

[[nodiscard]] inline auto ensure_object(Json const& json, std::string_view context) -> Expected<void> {
    if (!json.is_object()) {
        return std::unexpected(make_error(Error::Code::DeserializationFailure, context, "must be a JSON object"));
    }
    return {};
}

[[nodiscard]] inline auto read_string(Json const& json, char const* key) -> Expected<std::string> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_string()) {
            return std::unexpected(make_error(Error::Code::DeserializationFailure, key, "must be a string"));
        }
        return it->get<std::string>();
    }
    return std::unexpected(make_error(Error::Code::DeserializationFailure, key, "is required"));
}

// Absent means `fallback`; present with another type is an error.
[[nodiscard]] inline auto read_optional_string(Json const& json, char const* key, std::string fallback = {})
        -> Expected<std::string> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_string()) {
            return std::unexpected(make_error(Error::Code::DeserializationFailure, key, "must be a string"));
        }
        return it->get<std::string>();
    }
    return fallback;
}

[[nodiscard]] auto value_to_json(Value const& value) -> Json;
[[nodiscard]] auto value_from_json(Json const& json, std::string_view field) -> Expected<Value>;

[[nodiscard]] auto node_to_json(ComponentNode const& node) -> Json;
// A node without a key takes `positionalKey`: "root" for the root, the
// sibling index below it. Sibling keys must be unique.
[[nodiscard]] auto node_from_json(Json const& json, std::string_view context, std::string positionalKey)
        -> Expected<ComponentNode>;

} // namespace CS::detail
