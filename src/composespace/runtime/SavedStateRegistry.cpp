#include <composespace/runtime/SavedStateRegistry.hpp>

#include <utility>

namespace CS::Runtime {

InMemorySavedStateRegistry::InMemorySavedStateRegistry(StateData initial)
    : entries_(std::move(initial)) {}

auto InMemorySavedStateRegistry::get(std::string_view key) const -> std::optional<Value> {
    auto it = entries_.find(std::string{key});
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto InMemorySavedStateRegistry::set(std::string const& key, Value value) -> void {
    entries_.insert_or_assign(key, std::move(value));
}

auto InMemorySavedStateRegistry::erase(std::string_view key) -> bool {
    return entries_.erase(std::string{key}) > 0;
}

auto InMemorySavedStateRegistry::entries() const -> StateData {
    return entries_;
}

auto InMemorySavedStateRegistry::restore(StateData const& data) -> void {
    for (auto const& [key, value] : data) {
        entries_.insert_or_assign(key, value);
    }
}

} // namespace CS::Runtime
