#pragma once

#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace CS::detail {

[[nodiscard]] inline auto normalize_flag(std::string_view raw) -> std::string {
    std::string normalized;
    normalized.reserve(raw.size());
    for (unsigned char ch : raw) {
        if (std::isspace(ch) != 0) {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(ch)));
    }
    return normalized;
}

// Normalized value of an environment variable; nullopt when unset or blank.
[[nodiscard]] inline auto read_env_flag(char const* name) -> std::optional<std::string> {
    if (auto* raw = std::getenv(name)) {
        auto normalized = normalize_flag(raw);
        if (!normalized.empty()) {
            return normalized;
        }
    }
    return std::nullopt;
}

[[nodiscard]] inline auto parse_positive(std::string_view text) -> std::optional<std::size_t> {
    std::size_t value = 0;
    auto const* begin = text.data();
    auto const* end   = text.data() + text.size();
    auto [ptr, ec]    = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end || value == 0) {
        return std::nullopt;
    }
    return value;
}

} // namespace CS::detail
