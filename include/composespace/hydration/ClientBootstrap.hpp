#pragma once

#include <composespace/core/DiagnosticSink.hpp>
#include <composespace/core/Error.hpp>
#include <composespace/hydration/HydrationManager.hpp>
#include <composespace/runtime/Composition.hpp>
#include <composespace/runtime/Renderer.hpp>
#include <composespace/runtime/SavedStateRegistry.hpp>
#include <composespace/runtime/Scheduler.hpp>

#include <memory>
#include <string_view>

namespace CS::Hydration {

struct ClientBootstrapOptions {
    Runtime::SchedulerOptions scheduler{};
    HydrationOptions          hydration{};
    MountElement              mount{};
    DiagnosticSink*           diagnostics = nullptr;
};

/**
 * A live client root. The registry is declared first so it outlives the
 * composition whose saved-state cells write into it.
 */
struct HydratedRoot {
    std::unique_ptr<Runtime::InMemorySavedStateRegistry> registry;
    std::unique_ptr<Runtime::Composition>                composition;
    HydrationReport                                      report;
};

// Restore server state, compose `rootFn` without touching the renderer,
// adopt the server markup, then attach `renderer` for later updates. A
// context that fails to decode degrades to a full client render; only a
// failing root render function fails the call.
[[nodiscard]] auto hydrateRoot(std::string_view       contextJson,
                               Runtime::RenderFn      rootFn,
                               Runtime::Renderer&     renderer,
                               ClientBootstrapOptions options = {}) -> Expected<HydratedRoot>;

} // namespace CS::Hydration
