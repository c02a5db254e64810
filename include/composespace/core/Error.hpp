#pragma once
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace CS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        MalformedInput,
        DeserializationFailure,
        TreeIncompatible,
        SchedulingOverflow,
        DuplicateMarker,
        DuplicateKey,
        InvalidState,
        TypeMismatch,
        NotFound,
        RenderFailure,
        NotSupported
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::DeserializationFailure:
        return "deserialization_failure";
    case Error::Code::TreeIncompatible:
        return "tree_incompatible";
    case Error::Code::SchedulingOverflow:
        return "scheduling_overflow";
    case Error::Code::DuplicateMarker:
        return "duplicate_marker";
    case Error::Code::DuplicateKey:
        return "duplicate_key";
    case Error::Code::InvalidState:
        return "invalid_state";
    case Error::Code::TypeMismatch:
        return "type_mismatch";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::RenderFailure:
        return "render_failure";
    case Error::Code::NotSupported:
        return "not_supported";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

/**
 * Thrown from inside a render function when the composition contract is
 * broken (duplicate child keys, slot misuse). Scope execution catches it and
 * records the carried Error on the failing scope.
 */
class CompositionError : public std::runtime_error {
public:
    explicit CompositionError(Error error)
        : std::runtime_error(describeError(error)), error_(std::move(error)) {}

    [[nodiscard]] auto error() const noexcept -> Error const& {
        return error_;
    }

private:
    Error error_;
};

} // namespace CS
