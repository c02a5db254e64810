#include <composespace/hydration/HydrationCodec.hpp>
#include <composespace/hydration/HydrationManager.hpp>

#include "core/EnvFlags.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace CS::Hydration {

namespace {

auto top_most(std::vector<std::string> paths) -> std::vector<std::string> {
    std::sort(paths.begin(), paths.end());
    std::vector<std::string> result;
    for (auto& path : paths) {
        bool covered = std::any_of(result.begin(), result.end(),
                                   [&](std::string const& kept) { return isWithinKeyPath(path, kept); });
        if (!covered) {
            result.push_back(std::move(path));
        }
    }
    return result;
}

auto within_any(std::string const& path, std::vector<std::string> const& roots) -> bool {
    return std::any_of(roots.begin(), roots.end(),
                       [&](std::string const& root) { return isWithinKeyPath(path, root); });
}

} // namespace

auto hydrationPhaseToString(HydrationPhase phase) -> std::string_view {
    switch (phase) {
    case HydrationPhase::Idle:
        return "idle";
    case HydrationPhase::Deserializing:
        return "deserializing";
    case HydrationPhase::Matching:
        return "matching";
    case HydrationPhase::Adopted:
        return "adopted";
    case HydrationPhase::Mismatched:
        return "mismatched";
    case HydrationPhase::AdoptedWithFallback:
        return "adopted_with_fallback";
    case HydrationPhase::FullClientRender:
        return "full_client_render";
    }
    return "idle";
}

auto hydrationOptionsFromEnvironment(HydrationOptions base) -> HydrationOptions {
    if (auto policy = detail::read_env_flag("COMPOSESPACE_HYDRATION_POLICY")) {
        if (*policy == "deep" || *policy == "recursive") {
            base.policy = CompatibilityPolicy::Deep;
        } else if (*policy == "shallow" || *policy == "root") {
            base.policy = CompatibilityPolicy::Shallow;
        } else {
            cs_log("ignoring COMPOSESPACE_HYDRATION_POLICY=" + *policy, "Config", "WARN");
        }
    }
    return base;
}

HydrationManager::HydrationManager(HydrationOptions options)
    : options_(options) {}

auto HydrationManager::serializeHydrationContext(ComponentNode const&        tree,
                                                 StateData                   state_data,
                                                 std::optional<std::int64_t> timestamp) const
        -> Expected<HydrationContext> {
    auto markers = generateMarkers(tree);
    if (!markers) {
        return std::unexpected(markers.error());
    }
    HydrationContext context;
    context.component_tree    = tree;
    context.state_data        = std::move(state_data);
    context.hydration_markers = std::move(*markers);
    context.timestamp         = timestamp.value_or(currentTimestampMs());
    return context;
}

auto HydrationManager::deserializeAndMatch(std::string_view contextData, MountElement const& root)
        -> Expected<HydrationContext> {
    if (auto fresh = this->requireFresh("deserializeAndMatch"); !fresh) {
        return std::unexpected(fresh.error());
    }
    this->transition(HydrationPhase::Deserializing);
    auto context = decodeHydrationContext(contextData);
    if (!context) {
        this->transition(HydrationPhase::Mismatched);
        if (options_.diagnostics != nullptr) {
            options_.diagnostics->report(context.error(), "hydration");
        }
        return std::unexpected(context.error());
    }
    if (!root.tag_name.empty() && root.tag_name != context->component_tree.type) {
        Error mismatch{Error::Code::TreeIncompatible,
                       "mount element <" + root.tag_name + "> does not match server root <"
                               + context->component_tree.type + ">"};
        cs_log(describeError(mismatch), "Hydration", "WARN");
        if (options_.diagnostics != nullptr) {
            options_.diagnostics->report(mismatch, "hydration");
        }
    }
    this->transition(HydrationPhase::Matching);
    return context;
}

auto HydrationManager::validateTreeCompatibility(HydrationContext const& serverContext,
                                                 ComponentNode const&    clientTree) const -> bool {
    return isTreeCompatible(serverContext.component_tree, clientTree, options_.policy);
}

auto HydrationManager::adopt(HydrationContext&& context, Runtime::CapturedTree const& client, Runtime::Renderer& renderer)
        -> Expected<HydrationReport> {
    if (phase_ != HydrationPhase::Matching) {
        if (auto fresh = this->requireFresh("adopt"); !fresh) {
            return std::unexpected(fresh.error());
        }
        this->transition(HydrationPhase::Matching);
    }
    auto const consumed = std::move(context);

    HydrationReport report;
    auto const&     server = consumed.component_tree;
    report.compatible      = this->validateTreeCompatibility(consumed, client.root);

    auto plan = planAdoption(server, client.root);
    if (plan.full_render) {
        this->transition(HydrationPhase::Mismatched);
        this->record(report,
                     Error{Error::Code::TreeIncompatible,
                           "root <" + server.type + "#" + server.key + "> vs <" + client.root.type + "#"
                                   + client.root.key + ">"},
                     "hydration");
        this->renderClientTree(client, renderer, report);
        this->transition(HydrationPhase::FullClientRender);
        report.phase = phase_;
        return report;
    }

    // Interactive client nodes the server never marked cannot be bound in
    // place; render them fresh.
    std::set<std::string> adopted(plan.adopted.begin(), plan.adopted.end());
    for (auto const& [path, handlers] : client.bindings) {
        if (path == client.root.key || !adopted.contains(path)) {
            continue;
        }
        if (consumed.findMarker(path) == nullptr) {
            plan.rerender.push_back(path);
            adopted.erase(path);
        }
    }

    if (!report.compatible || !plan.rerender.empty() || !plan.removed.empty()) {
        this->transition(HydrationPhase::Mismatched);
        if (!report.compatible) {
            this->record(report, Error{Error::Code::TreeIncompatible, "server and client trees differ below the root"},
                         "hydration");
        }
    }

    for (auto const& path : plan.removed) {
        if (auto removed = renderer.remove(path); !removed) {
            this->record(report, removed.error(), "renderer");
        }
    }
    report.removed = plan.removed.size();

    auto fresh = top_most([&] {
        auto all = plan.patched;
        all.insert(all.end(), plan.rerender.begin(), plan.rerender.end());
        return all;
    }());
    for (auto const& path : fresh) {
        this->renderSubtree(client, path, renderer, report);
    }
    report.patched    = plan.patched.size();
    report.rerendered = plan.rerender.size();

    struct Binding {
        HydrationPriority  priority;
        std::string const* path;
    };
    std::vector<Binding> bindings;
    for (auto const& marker : consumed.hydration_markers) {
        auto const path = marker.id == kRootMarkerId ? client.root.key : marker.id;
        if (!adopted.contains(path) || within_any(path, fresh)) {
            continue;
        }
        bindings.push_back(Binding{marker.priority(), &*adopted.find(path)});
    }
    std::stable_sort(bindings.begin(), bindings.end(),
                     [](Binding const& lhs, Binding const& rhs) { return lhs.priority < rhs.priority; });

    static Runtime::LiveHandlers const kNoHandlers;
    for (auto const& binding : bindings) {
        auto        it       = client.bindings.find(*binding.path);
        auto const& handlers = it == client.bindings.end() ? kNoHandlers : it->second;
        // Bound under the key path, the same id steady-state commits use.
        if (auto bound = renderer.bindMarker(*binding.path, handlers); !bound) {
            this->record(report, bound.error(), "renderer");
            continue;
        }
        report.bound_markers.push_back(*binding.path);
    }
    report.adopted = adopted.size();

    this->transition(phase_ == HydrationPhase::Mismatched ? HydrationPhase::AdoptedWithFallback
                                                          : HydrationPhase::Adopted);
    report.phase = phase_;
    cs_log("hydration " + std::string{hydrationPhaseToString(phase_)} + ": " + std::to_string(report.adopted)
                   + " adopted, " + std::to_string(fresh.size()) + " fresh subtree(s), "
                   + std::to_string(report.bound_markers.size()) + " marker(s) bound",
           "Hydration", "INFO");
    return report;
}

auto HydrationManager::hydrate(std::string_view             contextData,
                               Runtime::CapturedTree const& client,
                               Runtime::Renderer&           renderer,
                               MountElement const&          root) -> Expected<HydrationReport> {
    if (auto fresh = this->requireFresh("hydrate"); !fresh) {
        return std::unexpected(fresh.error());
    }
    auto context = this->deserializeAndMatch(contextData, root);
    if (!context) {
        HydrationReport report;
        report.errors.push_back(context.error());
        this->renderClientTree(client, renderer, report);
        this->transition(HydrationPhase::FullClientRender);
        report.phase = phase_;
        return report;
    }
    return this->adopt(std::move(*context), client, renderer);
}

auto HydrationManager::renderClientTree(Runtime::CapturedTree const& client,
                                        Runtime::Renderer&           renderer,
                                        HydrationReport&             report) -> void {
    this->renderSubtree(client, client.root.key, renderer, report);
    ++report.rerendered;
}

auto HydrationManager::reset() -> void {
    phase_ = HydrationPhase::Idle;
}

auto HydrationManager::transition(HydrationPhase next) -> void {
    cs_log(std::string{"hydration phase "} + std::string{hydrationPhaseToString(phase_)} + " -> "
                   + std::string{hydrationPhaseToString(next)},
           "Hydration", "DEBUG");
    phase_ = next;
}

auto HydrationManager::requireFresh(std::string_view operation) const -> Expected<void> {
    if (phase_ != HydrationPhase::Idle) {
        return std::unexpected(Error{Error::Code::InvalidState,
                                     std::string{operation} + " called in phase "
                                             + std::string{hydrationPhaseToString(phase_)} + "; reset() first"});
    }
    return {};
}

auto HydrationManager::record(HydrationReport& report, Error error, std::string_view origin) -> void {
    cs_log(std::string{origin} + ": " + describeError(error), "Hydration", "WARN");
    if (options_.diagnostics != nullptr) {
        options_.diagnostics->report(error, origin);
    }
    report.errors.push_back(std::move(error));
}

auto HydrationManager::renderSubtree(Runtime::CapturedTree const& client,
                                     std::string const&           path,
                                     Runtime::Renderer&           renderer,
                                     HydrationReport&             report) -> void {
    auto const* node = findByKeyPath(client.root, path);
    if (node == nullptr) {
        this->record(report, Error{Error::Code::NotFound, "client tree has no node at '" + path + "'"}, "hydration");
        return;
    }
    if (auto rendered = renderer.createOrUpdate(*node, path); !rendered) {
        this->record(report, rendered.error(), "renderer");
        return;
    }
    for (auto const& [boundPath, handlers] : client.bindings) {
        if (!isWithinKeyPath(boundPath, path)) {
            continue;
        }
        if (auto bound = renderer.bindMarker(boundPath, handlers); !bound) {
            this->record(report, bound.error(), "renderer");
        }
    }
}

} // namespace CS::Hydration
