#pragma once

#include <composespace/core/Error.hpp>
#include <composespace/hydration/HydrationContext.hpp>
#include <composespace/snapshot/ComponentNode.hpp>

#include <functional>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace CS::Ssr {

struct HtmlOptions {
    // Write each marker's attributes onto the element it points at.
    bool emit_markers = true;
};

[[nodiscard]] auto escapeHtmlText(std::string_view text) -> std::string;
[[nodiscard]] auto escapeHtmlAttribute(std::string_view text) -> std::string;
[[nodiscard]] auto isVoidElement(std::string_view tag) -> bool;

/**
 * HtmlRenderer turns a ComponentNode tree into markup.
 *
 * Node types are tag names; "#text" emits its escaped "value" prop and
 * "#fragment" emits only its children. Props become attributes: true is a
 * bare attribute, false and null are left out, everything else is escaped
 * text. Fails with MalformedInput on a tag or attribute name that is not a
 * plain HTML name.
 */
class HtmlRenderer {
public:
    explicit HtmlRenderer(HtmlOptions options = {});

    [[nodiscard]] auto render(ComponentNode const& tree, std::vector<Hydration::DOMMarker> const& markers = {}) const
            -> Expected<std::string>;

private:
    using MarkerIndex = std::map<std::string, Hydration::DOMMarker const*, std::less<>>;

    auto renderNode(std::ostringstream& out, ComponentNode const& node, std::string const& path,
                    MarkerIndex const& markers) const -> Expected<void>;

    HtmlOptions options_;
};

} // namespace CS::Ssr
