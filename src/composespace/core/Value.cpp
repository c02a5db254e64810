#include <composespace/core/Value.hpp>

#include <cmath>
#include <sstream>

namespace CS {

auto Value::asBool() const -> std::optional<bool> {
    if (auto const* v = std::get_if<bool>(&storage_)) {
        return *v;
    }
    return std::nullopt;
}

auto Value::asInt() const -> std::optional<std::int64_t> {
    if (auto const* v = std::get_if<std::int64_t>(&storage_)) {
        return *v;
    }
    return std::nullopt;
}

auto Value::asDouble() const -> std::optional<double> {
    if (auto const* v = std::get_if<double>(&storage_)) {
        return *v;
    }
    if (auto const* v = std::get_if<std::int64_t>(&storage_)) {
        return static_cast<double>(*v);
    }
    return std::nullopt;
}

auto Value::asString() const -> std::optional<std::string> {
    if (auto const* v = std::get_if<std::string>(&storage_)) {
        return *v;
    }
    return std::nullopt;
}

auto Value::toString() const -> std::string {
    switch (kind()) {
    case Kind::Null:
        return {};
    case Kind::Bool:
        return std::get<bool>(storage_) ? "true" : "false";
    case Kind::Int:
        return std::to_string(std::get<std::int64_t>(storage_));
    case Kind::Double: {
        auto const value = std::get<double>(storage_);
        if (!std::isfinite(value)) {
            return {};
        }
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }
    case Kind::String:
        return std::get<std::string>(storage_);
    }
    return {};
}

auto valueKindToString(Value::Kind kind) -> std::string_view {
    switch (kind) {
    case Value::Kind::Null:
        return "null";
    case Value::Kind::Bool:
        return "bool";
    case Value::Kind::Int:
        return "int";
    case Value::Kind::Double:
        return "double";
    case Value::Kind::String:
        return "string";
    }
    return "null";
}

} // namespace CS
