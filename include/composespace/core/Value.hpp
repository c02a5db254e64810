#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace CS {

/**
 * Value is a closed tagged union used for node props and hydrated state.
 *
 * Only scalars are representable. Keeping the set closed is what lets a
 * ComponentNode survive a JSON round trip without runtime type inspection.
 */
class Value {
public:
    enum class Kind {
        Null,
        Bool,
        Int,
        Double,
        String,
    };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : storage_(value) {}
    template <std::integral I>
        requires(!std::same_as<I, bool> && !std::same_as<I, char>)
    Value(I value) {
        // Unsigned values past the int64 range keep their magnitude as a double.
        if (std::in_range<std::int64_t>(value)) {
            storage_ = static_cast<std::int64_t>(value);
        } else {
            storage_ = static_cast<double>(value);
        }
    }
    Value(double value) : storage_(value) {}
    Value(float value) : storage_(static_cast<double>(value)) {}
    Value(std::string value) : storage_(std::move(value)) {}
    Value(std::string_view value) : storage_(std::string(value)) {}
    Value(char const* value) : storage_(std::string(value)) {}

    [[nodiscard]] auto kind() const noexcept -> Kind {
        return static_cast<Kind>(storage_.index());
    }

    [[nodiscard]] auto isNull() const noexcept -> bool {
        return kind() == Kind::Null;
    }

    [[nodiscard]] auto asBool() const -> std::optional<bool>;
    [[nodiscard]] auto asInt() const -> std::optional<std::int64_t>;
    // Ints widen to double; doubles never narrow to int.
    [[nodiscard]] auto asDouble() const -> std::optional<double>;
    [[nodiscard]] auto asString() const -> std::optional<std::string>;

    // Text form used for HTML attributes and marker attributes.
    [[nodiscard]] auto toString() const -> std::string;

    friend auto operator==(Value const&, Value const&) -> bool = default;

private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string> storage_;
};

using PropMap = std::map<std::string, Value>;
using StateData = std::map<std::string, Value>;

[[nodiscard]] auto valueKindToString(Value::Kind kind) -> std::string_view;

/**
 * Conversion between C++ types and Value, used by saved state and hydrated
 * state. Specialize for application types that should survive a
 * server-to-client transfer.
 */
template <typename T>
struct ValueTraits;

template <>
struct ValueTraits<bool> {
    static auto toValue(bool v) -> Value { return Value{v}; }
    static auto fromValue(Value const& v) -> std::optional<bool> { return v.asBool(); }
};

template <std::integral I>
    requires(!std::same_as<I, bool>)
struct ValueTraits<I> {
    static auto toValue(I v) -> Value {
        if (std::in_range<std::int64_t>(v)) {
            return Value{static_cast<std::int64_t>(v)};
        }
        return Value{static_cast<double>(v)};
    }
    // Out-of-range ints are rejected rather than wrapped.
    static auto fromValue(Value const& v) -> std::optional<I> {
        if (auto raw = v.asInt(); raw && std::in_range<I>(*raw)) {
            return static_cast<I>(*raw);
        }
        return std::nullopt;
    }
};

template <>
struct ValueTraits<double> {
    static auto toValue(double v) -> Value { return Value{v}; }
    static auto fromValue(Value const& v) -> std::optional<double> { return v.asDouble(); }
};

template <>
struct ValueTraits<std::string> {
    static auto toValue(std::string const& v) -> Value { return Value{v}; }
    static auto fromValue(Value const& v) -> std::optional<std::string> { return v.asString(); }
};

template <typename T>
concept ValueConvertible = requires(T const& t, Value const& v) {
    { ValueTraits<T>::toValue(t) } -> std::same_as<Value>;
    { ValueTraits<T>::fromValue(v) } -> std::same_as<std::optional<T>>;
};

} // namespace CS
