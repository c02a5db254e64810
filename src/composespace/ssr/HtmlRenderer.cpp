#include <composespace/ssr/HtmlRenderer.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace CS::Ssr {

namespace {

constexpr std::array<std::string_view, 13> kVoidElements{
        "area", "base", "br", "col", "embed", "hr", "img", "input", "link", "meta", "source", "track", "wbr"};

auto is_html_name(std::string_view name) -> bool {
    if (name.empty() || std::isalpha(static_cast<unsigned char>(name.front())) == 0) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char raw) {
        auto ch = static_cast<unsigned char>(raw);
        return std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == ':' || ch == '.';
    });
}

} // namespace

auto escapeHtmlText(std::string_view text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
        case '&':
            escaped.append("&amp;");
            break;
        case '<':
            escaped.append("&lt;");
            break;
        case '>':
            escaped.append("&gt;");
            break;
        default:
            escaped.push_back(ch);
        }
    }
    return escaped;
}

auto escapeHtmlAttribute(std::string_view text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
        case '&':
            escaped.append("&amp;");
            break;
        case '<':
            escaped.append("&lt;");
            break;
        case '>':
            escaped.append("&gt;");
            break;
        case '"':
            escaped.append("&quot;");
            break;
        case '\'':
            escaped.append("&#39;");
            break;
        default:
            escaped.push_back(ch);
        }
    }
    return escaped;
}

auto isVoidElement(std::string_view tag) -> bool {
    return std::find(kVoidElements.begin(), kVoidElements.end(), tag) != kVoidElements.end();
}

HtmlRenderer::HtmlRenderer(HtmlOptions options)
    : options_(options) {}

auto HtmlRenderer::render(ComponentNode const& tree, std::vector<Hydration::DOMMarker> const& markers) const
        -> Expected<std::string> {
    MarkerIndex index;
    if (options_.emit_markers) {
        for (auto const& marker : markers) {
            auto const path = marker.id == Hydration::kRootMarkerId ? tree.key : marker.id;
            index.emplace(path, &marker);
        }
    }
    std::ostringstream out;
    if (auto rendered = this->renderNode(out, tree, tree.key, index); !rendered) {
        return std::unexpected(rendered.error());
    }
    return out.str();
}

auto HtmlRenderer::renderNode(std::ostringstream&  out,
                              ComponentNode const& node,
                              std::string const&   path,
                              MarkerIndex const&   markers) const -> Expected<void> {
    if (node.type == kTextNodeType) {
        if (auto it = node.props.find(std::string{kTextValueProp}); it != node.props.end()) {
            out << escapeHtmlText(it->second.toString());
        }
        return {};
    }

    if (node.type != kFragmentNodeType) {
        if (!is_html_name(node.type)) {
            return std::unexpected(Error{Error::Code::MalformedInput, "'" + node.type + "' is not an element name"});
        }
        out << '<' << node.type;
        for (auto const& [name, value] : node.props) {
            if (!is_html_name(name)) {
                return std::unexpected(
                        Error{Error::Code::MalformedInput, "'" + name + "' is not an attribute name"});
            }
            if (value.isNull() || value == Value{false}) {
                continue;
            }
            out << ' ' << name;
            if (value != Value{true}) {
                out << "=\"" << escapeHtmlAttribute(value.toString()) << '"';
            }
        }
        if (auto marker = markers.find(path); marker != markers.end()) {
            for (auto const& [name, value] : marker->second->attributes) {
                if (node.props.contains(name)) {
                    continue;
                }
                out << ' ' << name << "=\"" << escapeHtmlAttribute(value) << '"';
            }
        }
        out << '>';
        if (isVoidElement(node.type)) {
            return {};
        }
    }

    for (auto const& child : node.children) {
        if (auto rendered = this->renderNode(out, child, joinKeyPath(path, child.key), markers); !rendered) {
            return rendered;
        }
    }

    if (node.type != kFragmentNodeType) {
        out << "</" << node.type << '>';
    }
    return {};
}

} // namespace CS::Ssr
