#include "ComposeSpaceTestHelper.hpp"

#include <composespace/hydration/HydrationCodec.hpp>
#include <composespace/runtime/Composer.hpp>
#include <composespace/ssr/ServerRender.hpp>

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>

using namespace CS;
using namespace CS::Runtime;
using namespace CS::Ssr;

namespace {

auto greeting(Composer& cx) -> void {
    auto& name = cx.savedState<std::string>("name", "guest");
    cx.node("h1", [&name](Composer& cx) { cx.text("Hello, " + name.read()); });
}

} // namespace

TEST_SUITE("ssr.server") {
    TEST_CASE("Rendering produces markup and a matching context") {
        auto result = renderToString(greeting, {.timestamp = 1234});
        REQUIRE(result);
        CHECK(result->context.timestamp == 1234);
        CHECK(result->context.state_data.at("name") == Value{"guest"});
        CHECK(result->html.starts_with(R"(<h1 data-cs-component="h1")"));
        CHECK(result->html.find(">Hello, guest</h1>") != std::string::npos);
        CHECK(result->html.find(R"(<script type="application/json" id="cs-hydration">)") != std::string::npos);

        auto decoded = Hydration::decodeHydrationContext(result->context_json);
        REQUIRE(decoded);
        CHECK(*decoded == result->context);
    }

    TEST_CASE("The context script can be left out") {
        auto result = renderToString(greeting, {.embed_context = false, .timestamp = 1});
        REQUIRE(result);
        CHECK(result->html.find("<script") == std::string::npos);
        CHECK_FALSE(result->context_json.empty());
    }

    TEST_CASE("Each request gets its own state") {
        auto first  = renderToString(greeting, {.timestamp = 1, .initial_state = {{"name", Value{"Ada"}}}});
        auto second = renderToString(greeting, {.timestamp = 1});
        REQUIRE(first);
        REQUIRE(second);
        CHECK(first->html.find("Hello, Ada") != std::string::npos);
        CHECK(second->html.find("Hello, guest") != std::string::npos);
        CHECK(second->context.state_data.at("name") == Value{"guest"});
    }

    TEST_CASE("Embedded payloads cannot close the script element") {
        CHECK(embedContextScript(R"({"a":"</script>"})")
              == R"(<script type="application/json" id="cs-hydration">{"a":"\u003c/script>"}</script>)");

        auto result = renderToString(greeting, {.timestamp = 1, .initial_state = {{"name", Value{"</script><b>"}}}});
        REQUIRE(result);
        CHECK(result->html.find("</script><b>") == std::string::npos);
        CHECK(result->html.find("Hello, &lt;/script&gt;&lt;b&gt;") != std::string::npos);
    }

    TEST_CASE("Render failures are returned") {
        Testing::RecordingDiagnostics diagnostics;
        auto result = renderToString([](Composer&) { throw std::runtime_error("server bug"); },
                                     {.timestamp = 1, .diagnostics = &diagnostics});
        REQUIRE_FALSE(result);
        CHECK(result.error().code == Error::Code::RenderFailure);
        CHECK(diagnostics.count(Error::Code::RenderFailure) == 1);
    }
}
