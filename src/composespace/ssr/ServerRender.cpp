#include <composespace/hydration/HydrationCodec.hpp>
#include <composespace/hydration/HydrationManager.hpp>
#include <composespace/runtime/Composition.hpp>
#include <composespace/runtime/SavedStateRegistry.hpp>
#include <composespace/ssr/ServerRender.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>

namespace CS::Ssr {

auto renderToString(Runtime::RenderFn const& rootFn, ServerRenderOptions options) -> Expected<ServerRenderResult> {
    Runtime::InMemorySavedStateRegistry registry{std::move(options.initial_state)};
    Runtime::Composition                composition{Runtime::CompositionOptions{
            .saved_state = &registry,
            .diagnostics = options.diagnostics,
    }};

    if (auto composed = composition.setContent(rootFn); !composed) {
        return std::unexpected(composed.error());
    }
    auto tree = composition.snapshot();
    if (!tree) {
        return std::unexpected(tree.error());
    }

    Hydration::HydrationManager manager{Hydration::HydrationOptions{.diagnostics = options.diagnostics}};
    auto context = manager.serializeHydrationContext(*tree, registry.entries(), options.timestamp);
    if (!context) {
        return std::unexpected(context.error());
    }
    auto json = Hydration::encodeHydrationContext(*context);
    if (!json) {
        return std::unexpected(json.error());
    }

    HtmlRenderer renderer{options.html};
    auto         html = renderer.render(context->component_tree, context->hydration_markers);
    if (!html) {
        return std::unexpected(html.error());
    }

    ServerRenderResult result;
    result.html = std::move(*html);
    if (options.embed_context) {
        result.html.append(embedContextScript(*json));
    }
    result.context_json = std::move(*json);
    result.context      = std::move(*context);
    cs_log("server render: " + std::to_string(countNodes(result.context.component_tree)) + " node(s), "
                   + std::to_string(result.context.hydration_markers.size()) + " marker(s), "
                   + std::to_string(result.html.size()) + " bytes",
           "Ssr", "INFO");
    return result;
}

auto embedContextScript(std::string_view json) -> std::string {
    std::string script;
    script.reserve(json.size() + 64);
    script.append("<script type=\"application/json\" id=\"");
    script.append(kContextScriptId);
    script.append("\">");
    for (char ch : json) {
        if (ch == '<') {
            script.append("\\u003c");
        } else {
            script.push_back(ch);
        }
    }
    script.append("</script>");
    return script;
}

} // namespace CS::Ssr
