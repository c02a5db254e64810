#include <composespace/hydration/HydrationCodec.hpp>

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace CS;
using namespace CS::Hydration;

namespace {

auto formTree() -> ComponentNode {
    ComponentNode save{.type = "button", .key = "save", .events = {"click"}};
    ComponentNode later{.type   = "button",
                        .props  = {{std::string{kPriorityProp}, Value{"deferred"}}},
                        .key    = "later",
                        .events = {"click", "focus"}};
    ComponentNode note{.type = "p", .key = "2"};
    return ComponentNode{.type = "form", .children = {save, later, note}, .key = "root"};
}

auto sampleContext() -> HydrationContext {
    HydrationContext context;
    context.component_tree    = formTree();
    context.state_data        = {{"count", Value{3}}, {"name", Value{"Ada"}}, {"ratio", Value{0.5}}};
    context.hydration_markers = *generateMarkers(context.component_tree);
    context.timestamp         = 1700000000000;
    return context;
}

} // namespace

TEST_SUITE_BEGIN("hydration.codec");

TEST_CASE("Markers cover the root and every interactive node") {
    auto markers = generateMarkers(formTree());
    REQUIRE(markers);
    REQUIRE(markers->size() == 3);

    auto const& root = (*markers)[0];
    CHECK(root.id == "root");
    CHECK(root.type == "form");
    CHECK(root.priority() == HydrationPriority::Critical);
    CHECK(root.attributes.at(std::string{kMarkerIdAttribute}) == "root");

    auto const& save = (*markers)[1];
    CHECK(save.id == "root/save");
    CHECK(save.priority() == HydrationPriority::Visible);
    CHECK(save.attributes.at(std::string{kMarkerComponentAttribute}) == "button");
    CHECK(save.attributes.at(std::string{kMarkerKeyAttribute}) == "save");
    CHECK(save.attributes.at(std::string{kMarkerEventsAttribute}) == "click");

    auto const& later = (*markers)[2];
    CHECK(later.id == "root/later");
    CHECK(later.priority() == HydrationPriority::Deferred);
    CHECK(later.attributes.at(std::string{kMarkerEventsAttribute}) == "click,focus");
}

TEST_CASE("Marker ids must be unique") {
    std::vector<DOMMarker> markers{DOMMarker{.id = "root", .type = "div"}, DOMMarker{.id = "root", .type = "span"}};
    auto                   valid = validateMarkers(markers);
    REQUIRE_FALSE(valid);
    CHECK(valid.error().code == Error::Code::DuplicateMarker);

    auto context              = sampleContext();
    context.hydration_markers = markers;
    auto encoded              = encodeHydrationContext(context);
    REQUIRE_FALSE(encoded);
    CHECK(encoded.error().code == Error::Code::DuplicateMarker);
}

TEST_CASE("Encoding requires a positive timestamp") {
    auto context      = sampleContext();
    context.timestamp = 0;
    auto encoded      = encodeHydrationContext(context);
    REQUIRE_FALSE(encoded);
    CHECK(encoded.error().code == Error::Code::MalformedInput);
}

TEST_CASE("Contexts survive the wire") {
    auto context = sampleContext();
    auto encoded = encodeHydrationContext(context);
    REQUIRE(encoded);
    CHECK(encoded->find("\"componentTree\"") != std::string::npos);
    CHECK(encoded->find("\"stateData\"") != std::string::npos);
    CHECK(encoded->find("\"hydrationMarkers\"") != std::string::npos);

    auto decoded = decodeHydrationContext(*encoded);
    REQUIRE(decoded);
    CHECK(*decoded == context);
    REQUIRE(decoded->findMarker("root/later") != nullptr);
    CHECK(decoded->findMarker("root/2") == nullptr);
}

TEST_CASE("Optional sections may be absent") {
    auto decoded = decodeHydrationContext(R"({"componentTree":{"type":"main","key":"root"},"timestamp":5})");
    REQUIRE(decoded);
    CHECK(decoded->state_data.empty());
    CHECK(decoded->hydration_markers.empty());
    CHECK(decoded->timestamp == 5);
}

TEST_CASE("Malformed contexts are rejected") {
    auto expectFailure = [](std::string const& payload) {
        auto decoded = decodeHydrationContext(payload);
        REQUIRE_FALSE(decoded);
        CHECK(decoded.error().code == Error::Code::DeserializationFailure);
        return decoded.error();
    };

    SUBCASE("Not JSON") {
        auto error = expectFailure("invalid json content");
        CHECK(error.message == std::optional<std::string>{"context: JSON parse error"});
    }
    SUBCASE("Missing component tree") {
        auto error = expectFailure(R"({"timestamp":5})");
        CHECK(error.message == std::optional<std::string>{"componentTree: is required"});
    }
    SUBCASE("Missing timestamp") {
        expectFailure(R"({"componentTree":{"type":"main"}})");
    }
    SUBCASE("Timestamp of the wrong type") {
        expectFailure(R"({"componentTree":{"type":"main"},"timestamp":"yesterday"})");
    }
    SUBCASE("Negative timestamp") {
        expectFailure(R"({"componentTree":{"type":"main"},"timestamp":-4})");
    }
    SUBCASE("Non-scalar state") {
        expectFailure(R"({"componentTree":{"type":"main"},"timestamp":5,"stateData":{"list":[1,2]}})");
    }
    SUBCASE("Markers not an array") {
        expectFailure(R"({"componentTree":{"type":"main"},"timestamp":5,"hydrationMarkers":{}})");
    }
    SUBCASE("Marker without id") {
        expectFailure(R"({"componentTree":{"type":"main"},"timestamp":5,"hydrationMarkers":[{"type":"main"}]})");
    }
    SUBCASE("Repeated marker ids") {
        expectFailure(R"({"componentTree":{"type":"main"},"timestamp":5,)"
                      R"("hydrationMarkers":[{"id":"root","type":"main"},{"id":"root","type":"main"}]})");
    }
}

TEST_CASE("Priority names") {
    for (auto priority : {HydrationPriority::Critical, HydrationPriority::Visible, HydrationPriority::Near,
                          HydrationPriority::Deferred}) {
        CHECK(parseHydrationPriority(hydrationPriorityToString(priority)) == priority);
    }
    CHECK_FALSE(parseHydrationPriority("urgent").has_value());

    DOMMarker marker{.id = "root/x", .attributes = {{std::string{kMarkerPriorityAttribute}, "urgent"}}};
    CHECK(marker.priority() == HydrationPriority::Visible);
}

TEST_CASE("Timestamps are epoch milliseconds") {
    // 2020-01-01T00:00:00Z
    CHECK(currentTimestampMs() > 1577836800000);
}

TEST_SUITE_END();
