#include <composespace/hydration/HydrationCodec.hpp>
#include <composespace/ssr/HtmlRenderer.hpp>

#include <doctest/doctest.h>

#include <string>
#include <utility>

using namespace CS;
using namespace CS::Ssr;

namespace {

auto textNode(std::string value, std::string key) -> ComponentNode {
    return ComponentNode{.type = "#text", .props = {{"value", Value{std::move(value)}}}, .key = std::move(key)};
}

} // namespace

TEST_SUITE_BEGIN("ssr.html");

TEST_CASE("Escaping") {
    CHECK(escapeHtmlText("<a & b>") == "&lt;a &amp; b&gt;");
    CHECK(escapeHtmlText("\"quoted\"") == "\"quoted\"");
    CHECK(escapeHtmlAttribute(R"(say "hi" & 'bye')") == "say &quot;hi&quot; &amp; &#39;bye&#39;");
}

TEST_CASE("Elements, attributes and text") {
    ComponentNode tree{.type     = "p",
                       .props    = {{"class", Value{"note"}}, {"hidden", Value{false}}, {"data-count", Value{3}}},
                       .children = {textNode("1 < 2", "0")},
                       .key      = "root"};
    HtmlRenderer renderer;
    auto         html = renderer.render(tree);
    REQUIRE(html);
    CHECK(*html == R"(<p class="note" data-count="3">1 &lt; 2</p>)");
}

TEST_CASE("Void elements and boolean attributes") {
    ComponentNode tree{.type     = "form",
                       .children = {ComponentNode{.type  = "input",
                                                  .props = {{"disabled", Value{true}}, {"placeholder", Value{}}, {"value", Value{"x"}}},
                                                  .key   = "0"},
                                    ComponentNode{.type = "br", .key = "1"}},
                       .key      = "root"};
    auto html = HtmlRenderer{}.render(tree);
    REQUIRE(html);
    CHECK(*html == R"(<form><input disabled value="x"><br></form>)");
}

TEST_CASE("Fragments emit only their children") {
    ComponentNode tree{.type     = "#fragment",
                       .children = {ComponentNode{.type = "h1", .key = "0"}, textNode("tail", "1")},
                       .key      = "root"};
    auto html = HtmlRenderer{}.render(tree);
    REQUIRE(html);
    CHECK(*html == "<h1></h1>tail");
}

TEST_CASE("Markers become data attributes") {
    ComponentNode tree{.type     = "div",
                       .children = {ComponentNode{.type     = "button",
                                                  .children = {textNode("Go", "0")},
                                                  .key      = "0",
                                                  .events   = {"click"}}},
                       .key      = "root"};
    auto markers = Hydration::generateMarkers(tree);
    REQUIRE(markers);

    SUBCASE("Emitted by default") {
        auto html = HtmlRenderer{}.render(tree, *markers);
        REQUIRE(html);
        CHECK(*html
              == R"(<div data-cs-component="div" data-cs-hydration-id="root" data-cs-key="root" data-cs-priority="critical">)"
                 R"(<button data-cs-component="button" data-cs-events="click" data-cs-hydration-id="root/0" data-cs-key="0" data-cs-priority="visible">)"
                 R"(Go</button></div>)");
    }
    SUBCASE("Left out on request") {
        auto html = HtmlRenderer{HtmlOptions{.emit_markers = false}}.render(tree, *markers);
        REQUIRE(html);
        CHECK(*html == "<div><button>Go</button></div>");
    }
    SUBCASE("Props win over marker attributes of the same name") {
        tree.props.emplace("data-cs-key", Value{"mine"});
        auto html = HtmlRenderer{}.render(tree, *markers);
        REQUIRE(html);
        CHECK(html->find(R"(data-cs-key="mine")") != std::string::npos);
        CHECK(html->find(R"(data-cs-key="root")") == std::string::npos);
    }
}

TEST_CASE("Names that are not HTML names are rejected") {
    SUBCASE("Tag") {
        auto html = HtmlRenderer{}.render(ComponentNode{.type = "script><img", .key = "root"});
        REQUIRE_FALSE(html);
        CHECK(html.error().code == Error::Code::MalformedInput);
    }
    SUBCASE("Attribute") {
        auto html = HtmlRenderer{}.render(
                ComponentNode{.type = "a", .props = {{"onclick=\"x\"", Value{"y"}}}, .key = "root"});
        REQUIRE_FALSE(html);
        CHECK(html.error().code == Error::Code::MalformedInput);
    }
}

TEST_CASE("Void element names") {
    CHECK(isVoidElement("img"));
    CHECK(isVoidElement("input"));
    CHECK_FALSE(isVoidElement("div"));
}

TEST_SUITE_END();
