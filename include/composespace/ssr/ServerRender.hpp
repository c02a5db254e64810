#pragma once

#include <composespace/core/DiagnosticSink.hpp>
#include <composespace/core/Error.hpp>
#include <composespace/core/Value.hpp>
#include <composespace/hydration/HydrationContext.hpp>
#include <composespace/runtime/RenderScope.hpp>
#include <composespace/ssr/HtmlRenderer.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace CS::Ssr {

inline constexpr std::string_view kContextScriptId = "cs-hydration";

struct ServerRenderOptions {
    // Append the context as <script type="application/json" id="cs-hydration">.
    bool                        embed_context = true;
    // Epoch milliseconds stamped on the context; now when unset.
    std::optional<std::int64_t> timestamp;
    // Seeds the per-request saved-state registry.
    StateData                   initial_state;
    DiagnosticSink*             diagnostics = nullptr;
    HtmlOptions                 html{};
};

struct ServerRenderResult {
    std::string                 html;
    std::string                 context_json;
    Hydration::HydrationContext context;
};

// One isolated composition and registry per call; nothing is shared between
// requests.
[[nodiscard]] auto renderToString(Runtime::RenderFn const& rootFn, ServerRenderOptions options = {})
        -> Expected<ServerRenderResult>;

// Script element carrying `json`, with '<' escaped so the payload cannot
// close the element early.
[[nodiscard]] auto embedContextScript(std::string_view json) -> std::string;

} // namespace CS::Ssr
