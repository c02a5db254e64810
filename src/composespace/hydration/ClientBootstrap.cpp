#include <composespace/hydration/ClientBootstrap.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace CS::Hydration {

auto hydrateRoot(std::string_view       contextJson,
                 Runtime::RenderFn      rootFn,
                 Runtime::Renderer&     renderer,
                 ClientBootstrapOptions options) -> Expected<HydratedRoot> {
    if (options.hydration.diagnostics == nullptr) {
        options.hydration.diagnostics = options.diagnostics;
    }
    HydrationManager manager{options.hydration};
    HydratedRoot     root;
    root.registry = std::make_unique<Runtime::InMemorySavedStateRegistry>();

    auto context = manager.deserializeAndMatch(contextJson, options.mount);
    if (!context) {
        cs_log("hydration context rejected, rendering on the client: " + describeError(context.error()), "Hydration",
               "WARN");
        root.composition = std::make_unique<Runtime::Composition>(Runtime::CompositionOptions{
                .scheduler      = options.scheduler,
                .saved_state    = root.registry.get(),
                .renderer       = &renderer,
                .diagnostics    = options.diagnostics,
                .render_initial = true,
        });
        root.report.errors.push_back(context.error());
        if (auto composed = root.composition->setContent(std::move(rootFn)); !composed) {
            return std::unexpected(composed.error());
        }
        root.report.phase      = HydrationPhase::FullClientRender;
        root.report.rerendered = 1;
        return root;
    }

    root.registry->restore(context->state_data);
    root.composition = std::make_unique<Runtime::Composition>(Runtime::CompositionOptions{
            .scheduler      = options.scheduler,
            .saved_state    = root.registry.get(),
            .renderer       = nullptr,
            .diagnostics    = options.diagnostics,
            .render_initial = false,
    });
    if (auto composed = root.composition->setContent(std::move(rootFn)); !composed) {
        return std::unexpected(composed.error());
    }
    auto captured = root.composition->capture();
    if (!captured) {
        return std::unexpected(captured.error());
    }

    auto report = manager.adopt(std::move(*context), *captured, renderer);
    if (!report) {
        return std::unexpected(report.error());
    }
    root.report = std::move(*report);
    root.composition->attachRenderer(&renderer);
    return root;
}

} // namespace CS::Hydration
