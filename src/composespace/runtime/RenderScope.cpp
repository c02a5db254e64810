#include <composespace/runtime/RenderScope.hpp>

#include <exception>
#include <string>
#include <utility>

namespace CS::Runtime {

auto EffectSlot::release() -> std::optional<Error> {
    auto cleanup    = std::exchange(state_->cleanup, {});
    auto on_dispose = std::exchange(state_->on_dispose, {});
    std::optional<Error> failure;
    try {
        if (cleanup) {
            cleanup();
        }
    } catch (std::exception const& ex) {
        failure = Error{Error::Code::RenderFailure, std::string{"effect cleanup threw: "} + ex.what()};
    }
    try {
        if (on_dispose) {
            on_dispose();
        }
    } catch (std::exception const& ex) {
        if (!failure) {
            failure = Error{Error::Code::RenderFailure, std::string{"dispose callback threw: "} + ex.what()};
        }
    }
    return failure;
}

RenderScope::RenderScope(ScopeId id, ScopeId parent, std::string key, std::string type, std::size_t depth, RenderFn fn)
    : id_(id), parent_(parent), key_(std::move(key)), type_(std::move(type)), depth_(depth), fn_(std::move(fn)) {}

RenderScope::~RenderScope() = default;

auto RenderScope::findChild(std::string const& key) const -> ScopeId {
    auto it = childIndex_.find(key);
    return it == childIndex_.end() ? kNoScope : it->second;
}

} // namespace CS::Runtime
