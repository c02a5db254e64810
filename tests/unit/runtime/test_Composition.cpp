#include "ComposeSpaceTestHelper.hpp"

#include <composespace/runtime/Composition.hpp>

#include <doctest/doctest.h>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace CS;
using namespace CS::Runtime;
using CS::Testing::RecordingDiagnostics;
using CS::Testing::RecordingRenderer;

namespace {

auto textOf(ComponentNode const& node) -> std::string {
    if (auto it = node.props.find(std::string{kTextValueProp}); it != node.props.end()) {
        return it->second.toString();
    }
    return {};
}

} // namespace

TEST_SUITE_BEGIN("runtime.composition");

TEST_CASE("Initial composition produces a keyed snapshot") {
    Composition composition;
    auto        result = composition.setContent([](Composer& cx) {
        cx.node("div", {.props = {{"class", Value{"app"}}}}, [](Composer& cx) {
            cx.node("button", {.handlers = {{"click", [](EventPayload const&) {}}}}, [](Composer& cx) { cx.text("Go"); });
            cx.node("input", {.props = {{"disabled", Value{true}}}, .key = "name"});
        });
    });
    REQUIRE(result);

    auto tree = composition.snapshot();
    REQUIRE(tree);
    CHECK(tree->type == "div");
    CHECK(tree->key == "root");
    CHECK(tree->props.at("class") == Value{"app"});
    REQUIRE(tree->children.size() == 2);

    auto const& button = tree->children[0];
    CHECK(button.key == "0");
    CHECK(button.events == std::vector<std::string>{"click"});
    REQUIRE(button.children.size() == 1);
    CHECK(button.children[0].type == "#text");
    CHECK(textOf(button.children[0]) == "Go");

    CHECK(tree->children[1].key == "name");
    CHECK(tree->children[1].events.empty());
}

TEST_CASE("Several top-level nodes are wrapped in a fragment") {
    Composition composition;
    REQUIRE(composition.setContent([](Composer& cx) {
        cx.node("header");
        cx.node("main");
    }));
    auto tree = composition.snapshot();
    REQUIRE(tree);
    CHECK(tree->type == "#fragment");
    CHECK(tree->key == "root");
    REQUIRE(tree->children.size() == 2);
    CHECK(tree->children[1].type == "main");
    CHECK(tree->children[1].key == "1");
}

TEST_CASE("Writing an equal value schedules nothing") {
    Composition     composition;
    StateCell<int>* cell = nullptr;
    std::size_t     runs = 0;
    REQUIRE(composition.setContent([&](Composer& cx) {
        ++runs;
        auto& count = cx.state(0);
        cell        = &count;
        cx.text(std::to_string(count.read()));
    }));
    REQUIRE(cell != nullptr);

    CHECK_FALSE(cell->write(0));
    CHECK_FALSE(composition.scheduler().hasPending());
    CHECK(composition.flush().executions == 0);
    CHECK(runs == 1);
}

TEST_CASE("Only scopes that read a changed cell re-execute") {
    Composition                composition;
    auto&                      left  = composition.makeState(0);
    auto&                      right = composition.makeState(std::string{"r"});
    std::map<std::string, int> runs;
    REQUIRE(composition.setContent([&](Composer& cx) {
        ++runs["root"];
        cx.node("div", [&](Composer& cx) {
            cx.scope("left", [&](Composer& cx) {
                ++runs["left"];
                cx.text(std::to_string(left.read()));
            });
            cx.scope("right", [&](Composer& cx) {
                ++runs["right"];
                cx.text(right.read());
            });
        });
    }));

    CHECK(left.write(5));
    auto report = composition.flush();
    CHECK(report.executions == 1);
    CHECK(report.errors.empty());
    CHECK(runs["root"] == 1);
    CHECK(runs["left"] == 2);
    CHECK(runs["right"] == 1);

    auto tree = composition.snapshot();
    REQUIRE(tree);
    REQUIRE(tree->children.size() == 2);
    CHECK(textOf(tree->children[0]) == "5");
    CHECK(textOf(tree->children[1]) == "r");
}

TEST_CASE("Dependencies follow the last execution") {
    Composition composition;
    auto&       useFirst = composition.makeState(true);
    auto&       first    = composition.makeState(1);
    auto&       second   = composition.makeState(2);
    std::size_t runs     = 0;
    REQUIRE(composition.setContent([&](Composer& cx) {
        ++runs;
        cx.text(std::to_string(useFirst.read() ? first.read() : second.read()));
    }));

    CHECK(second.write(3));
    CHECK(composition.flush().executions == 0);

    CHECK(useFirst.write(false));
    CHECK(composition.flush().executions == 1);

    CHECK(first.write(10));
    CHECK(composition.flush().executions == 0);
    CHECK(second.write(4));
    CHECK(composition.flush().executions == 1);
    CHECK(runs == 3);
}

TEST_CASE("A parent re-runs before its children and runs them once") {
    Composition              composition;
    auto&                    outer = composition.makeState(0);
    auto&                    inner = composition.makeState(0);
    std::vector<std::string> order;
    REQUIRE(composition.setContent([&](Composer& cx) {
        order.push_back("parent");
        cx.text(std::to_string(outer.read()), "label");
        cx.scope("child", [&](Composer& cx) {
            order.push_back("child");
            cx.text(std::to_string(inner.read()));
        });
    }));
    order.clear();

    CHECK(inner.write(1));
    CHECK(outer.write(1));
    auto report = composition.flush();
    CHECK(order == std::vector<std::string>{"parent", "child"});
    CHECK(report.executions == 1);
}

TEST_CASE("A self-invalidating scope overflows without stopping its siblings") {
    RecordingDiagnostics diagnostics;
    Composition          composition{{.scheduler = {.max_reexecutions_per_flush = 3}, .diagnostics = &diagnostics}};
    auto&                counter = composition.makeState(0);
    auto&                other   = composition.makeState(0);
    REQUIRE(composition.setContent([&](Composer& cx) {
        cx.node("div", [&](Composer& cx) {
            cx.scope("loop", [&](Composer& cx) {
                auto value = counter.read();
                counter.write(value + 1);
                cx.text(std::to_string(value));
            });
            cx.scope("steady", [&](Composer& cx) { cx.text(std::to_string(other.read())); });
        });
    }));
    auto loop = composition.findChild(composition.rootScope(), "loop");
    REQUIRE(loop != kNoScope);

    CHECK(other.write(7));
    auto report = composition.flush();
    CHECK(report.executions == 4);
    REQUIRE(report.errors.size() == 1);
    CHECK(report.errors.front().code == Error::Code::SchedulingOverflow);
    CHECK(diagnostics.count(Error::Code::SchedulingOverflow) == 1);

    auto const* scope = composition.findScope(loop);
    REQUIRE(scope != nullptr);
    CHECK(scope->failed());
    REQUIRE(scope->lastError());
    CHECK(scope->lastError()->code == Error::Code::SchedulingOverflow);

    auto tree = composition.snapshot();
    REQUIRE(tree);
    CHECK(textOf(tree->children[1]) == "7");

    // A failed scope no longer reacts to writes.
    (void)counter.write(100);
    CHECK_FALSE(composition.scheduler().hasPending());
}

TEST_CASE("Batch modes") {
    SUBCASE("Immediate writes flush synchronously") {
        Composition composition{{.scheduler = {.mode = BatchMode::Immediate}}};
        auto&       count = composition.makeState(0);
        std::size_t runs  = 0;
        REQUIRE(composition.setContent([&](Composer& cx) {
            ++runs;
            cx.text(std::to_string(count.read()));
        }));

        CHECK(count.write(1));
        CHECK(runs == 2);
        CHECK(composition.scheduler().lastReport().executions == 1);

        auto report = composition.batch([&] {
            CHECK(count.write(2));
            CHECK(count.write(3));
            CHECK(runs == 2);
        });
        CHECK(report.executions == 1);
        CHECK(runs == 3);
    }
    SUBCASE("Deferred writes wait for the posted flush") {
        std::vector<std::function<void()>> frames;
        Composition                        composition{{.scheduler = {.mode = BatchMode::Deferred,
                                                                      .post = [&](std::function<void()> fn) {
                                                                          frames.push_back(std::move(fn));
                                                                      }}}};
        auto&       first  = composition.makeState(0);
        auto&       second = composition.makeState(0);
        std::size_t runs   = 0;
        REQUIRE(composition.setContent([&](Composer& cx) {
            ++runs;
            cx.text(std::to_string(first.read() + second.read()));
        }));

        CHECK(first.write(1));
        CHECK(second.write(1));
        CHECK(frames.size() == 1);
        CHECK(runs == 1);

        frames.front()();
        CHECK(runs == 2);
        auto tree = composition.snapshot();
        REQUIRE(tree);
        CHECK(textOf(*tree) == "2");
    }
}

TEST_CASE("A throwing render keeps the previous output") {
    RecordingDiagnostics diagnostics;
    Composition          composition{{.diagnostics = &diagnostics}};
    auto&                broken = composition.makeState(false);
    REQUIRE(composition.setContent([&](Composer& cx) {
        cx.node("div", [&](Composer& cx) {
            cx.scope("child", [&](Composer& cx) {
                if (broken.read()) {
                    throw std::runtime_error("kaput");
                }
                cx.text("fine");
            });
            cx.text("sibling");
        });
    }));
    auto child = composition.findChild(composition.rootScope(), "child");

    CHECK(broken.write(true));
    auto report = composition.flush();
    REQUIRE(report.errors.size() == 1);
    CHECK(report.errors.front().code == Error::Code::RenderFailure);
    CHECK(diagnostics.count(Error::Code::RenderFailure) == 1);
    REQUIRE(composition.findScope(child) != nullptr);
    CHECK(composition.findScope(child)->lastError().has_value());

    auto tree = composition.snapshot();
    REQUIRE(tree);
    CHECK(textOf(tree->children[0]) == "fine");
    CHECK(textOf(tree->children[1]) == "sibling");

    // The scope stays subscribed and recovers on the next change.
    CHECK(broken.write(false));
    CHECK(composition.flush().errors.empty());
    CHECK_FALSE(composition.findScope(child)->lastError().has_value());
}

TEST_CASE("Duplicate keys are rejected") {
    SUBCASE("Sibling scopes") {
        Composition composition;
        auto        result = composition.setContent([](Composer& cx) {
            cx.scope("item", [](Composer& cx) { cx.text("a"); });
            cx.scope("item", [](Composer& cx) { cx.text("b"); });
        });
        REQUIRE_FALSE(result);
        CHECK(result.error().code == Error::Code::DuplicateKey);
    }
    SUBCASE("Sibling nodes") {
        Composition composition;
        auto        result = composition.setContent([](Composer& cx) {
            cx.node("ul", [](Composer& cx) {
                cx.node("li", {.key = "same"});
                cx.node("li", {.key = "same"});
            });
        });
        REQUIRE_FALSE(result);
        CHECK(result.error().code == Error::Code::DuplicateKey);
    }
    SUBCASE("Keys containing the path separator") {
        Composition composition;
        auto        result = composition.setContent([](Composer& cx) { cx.node("a", {.key = "x/y"}); });
        REQUIRE_FALSE(result);
        CHECK(result.error().code == Error::Code::MalformedInput);
    }
}

TEST_CASE("Slots persist across executions") {
    Composition composition;
    auto&       tick   = composition.makeState(0);
    auto&       toggle = composition.makeState(false);
    std::vector<int*> counters;
    std::string       label;
    REQUIRE(composition.setContent([&](Composer& cx) {
        if (!toggle.read()) {
            auto& counter = cx.remember<int>([] { return 41; });
            ++counter;
            counters.push_back(&counter);
        } else {
            label = cx.remember<std::string>([] { return std::string{"fresh"}; });
        }
        cx.text(std::to_string(tick.read()));
    }));

    CHECK(tick.write(1));
    (void)composition.flush();
    REQUIRE(counters.size() == 2);
    CHECK(counters[0] == counters[1]);
    CHECK(*counters[1] == 43);

    SUBCASE("A slot reached with another type is replaced") {
        CHECK(toggle.write(true));
        (void)composition.flush();
        CHECK(label == "fresh");
        CHECK(composition.findScope(composition.rootScope())->slotCount() == 1);
    }
}

TEST_CASE("Effects run after commit and clean up") {
    Composition              composition;
    auto&                    dependency = composition.makeState(1);
    std::vector<std::string> log;
    REQUIRE(composition.setContent([&](Composer& cx) {
        auto value = dependency.read();
        cx.effect({Value{value}}, [&log, value] {
            log.push_back("run " + std::to_string(value));
            return [&log, value] { log.push_back("cleanup " + std::to_string(value)); };
        });
        cx.onMount([&log] { log.push_back("mount"); });
        cx.onDispose([&log] { log.push_back("dispose"); });
        cx.text(std::to_string(value));
    }));
    CHECK(log == std::vector<std::string>{"run 1", "mount"});

    CHECK(dependency.write(2));
    (void)composition.flush();
    CHECK(log == std::vector<std::string>{"run 1", "mount", "cleanup 1", "run 2"});

    composition.dispose();
    CHECK(composition.isDisposed());
    CHECK(log
          == std::vector<std::string>{"run 1", "mount", "cleanup 1", "run 2", "dispose", "cleanup 2"});

    auto again = composition.setContent([](Composer& cx) { cx.text("late"); });
    REQUIRE_FALSE(again);
    CHECK(again.error().code == Error::Code::InvalidState);
}

TEST_CASE("A throwing effect is reported and the composition carries on") {
    RecordingDiagnostics diagnostics;
    Composition          composition{{.diagnostics = &diagnostics}};
    auto&                count = composition.makeState(0);
    REQUIRE(composition.setContent([&](Composer& cx) {
        cx.onMount([] { throw std::runtime_error("nope"); });
        cx.text(std::to_string(count.read()));
    }));
    CHECK(diagnostics.count(Error::Code::RenderFailure) == 1);
    CHECK(diagnostics.entries.front().origin == "effect");

    CHECK(count.write(1));
    CHECK(composition.flush().executions == 1);
}

TEST_CASE("Undeclared children are disposed") {
    Composition composition;
    auto&       show     = composition.makeState(true);
    bool        disposed = false;
    REQUIRE(composition.setContent([&](Composer& cx) {
        cx.node("div", [&](Composer& cx) {
            if (show.read()) {
                cx.scope("panel", [&](Composer& cx) {
                    cx.onDispose([&] { disposed = true; });
                    cx.text("panel");
                });
            }
        });
    }));
    auto panel = composition.findChild(composition.rootScope(), "panel");
    REQUIRE(panel != kNoScope);
    auto const before = composition.scopeCount();

    CHECK(show.write(false));
    (void)composition.flush();
    CHECK(disposed);
    CHECK(composition.findScope(panel) == nullptr);
    CHECK(composition.scopeCount() == before - 1);
}

TEST_CASE("Replacing the content disposes the old tree") {
    Composition composition;
    bool        disposed = false;
    REQUIRE(composition.setContent([&](Composer& cx) {
        cx.onDispose([&] { disposed = true; });
        cx.text("old");
    }));
    REQUIRE(composition.setContent([](Composer& cx) { cx.text("new"); }));
    CHECK(disposed);
    CHECK(composition.scopeCount() == 1);
    auto tree = composition.snapshot();
    REQUIRE(tree);
    CHECK(textOf(*tree) == "new");
}

TEST_CASE("Composition locals reach nested scopes") {
    Composition                   composition;
    CompositionLocal<std::string> theme{"light"};
    auto&                         provided = composition.makeState(std::string{"dark"});
    std::vector<std::string>      seen;
    REQUIRE(composition.setContent([&](Composer& cx) {
        seen.push_back(cx.current(theme));
        cx.provide(theme, provided.read(), [&](Composer& cx) {
            cx.scope("child", [&](Composer& cx) {
                seen.push_back(cx.current(theme));
                cx.text("child");
            });
        });
        seen.push_back(cx.current(theme));
    }));
    CHECK(seen == std::vector<std::string>{"light", "dark", "light"});

    seen.clear();
    CHECK(provided.write("dim"));
    (void)composition.flush();
    CHECK(seen == std::vector<std::string>{"light", "dim", "light"});
}

TEST_CASE("Clean children with unchanged inputs are skipped") {
    Composition composition;
    auto&       unrelated = composition.makeState(0);
    std::size_t rowRuns   = 0;
    std::size_t plainRuns = 0;
    REQUIRE(composition.setContent([&](Composer& cx) {
        cx.text(std::to_string(unrelated.read()), "label");
        cx.scope(ScopeOptions{.key = "row", .type = "row", .inputs = std::vector<Value>{Value{1}}}, [&](Composer& cx) {
            ++rowRuns;
            cx.text("row");
        });
        cx.scope("plain", [&](Composer& cx) {
            ++plainRuns;
            cx.text("plain");
        });
    }));

    CHECK(unrelated.write(1));
    (void)composition.flush();
    CHECK(rowRuns == 1);
    CHECK(plainRuns == 2);
}

TEST_CASE("Awaiting an async value suspends the scope until it resolves") {
    Composition composition;
    auto&       profile = composition.makeAsync<std::string>();
    REQUIRE(composition.setContent([&](Composer& cx) {
        cx.scope("profile", [&](Composer& cx) {
            if (auto const* name = cx.await(profile)) {
                cx.text(*name);
            } else {
                cx.text("loading");
            }
        });
    }));
    auto id = composition.findChild(composition.rootScope(), "profile");
    REQUIRE(composition.findScope(id) != nullptr);
    CHECK(composition.findScope(id)->suspended());
    CHECK(textOf(*composition.snapshot()) == "loading");

    CHECK(profile.resolve("Ada"));
    CHECK(composition.flush().executions == 1);
    CHECK_FALSE(composition.findScope(id)->suspended());
    CHECK(textOf(*composition.snapshot()) == "Ada");
}

TEST_CASE("Saved state is seeded from and mirrored into the registry") {
    InMemorySavedStateRegistry registry{StateData{{"count", Value{7}}, {"mode", Value{"not a number"}}}};
    Composition                composition{{.saved_state = &registry}};
    StateCell<int>*            count = nullptr;
    StateCell<int>*            mode  = nullptr;
    REQUIRE(composition.setContent([&](Composer& cx) {
        count       = &cx.savedState("count", 0);
        mode        = &cx.savedState("mode", 3);
        auto& label = cx.savedState<std::string>("label", "hi");
        cx.text(label.read() + std::to_string(count->read()));
    }));
    REQUIRE(count != nullptr);
    CHECK(count->peek() == 7);
    CHECK(mode->peek() == 3);
    CHECK(registry.get("mode") == Value{3});
    CHECK(registry.get("label") == Value{"hi"});

    CHECK(count->write(8));
    CHECK(registry.get("count") == Value{8});
    (void)composition.flush();
    CHECK(textOf(*composition.snapshot()) == "hi8");
}

TEST_CASE("Committed changes reach the renderer") {
    RecordingRenderer renderer;
    Composition       composition{{.renderer = &renderer}};
    auto&             count = composition.makeState(0);
    REQUIRE(composition.setContent([&](Composer& cx) {
        cx.node("div", [&](Composer& cx) {
            cx.node("h1", [](Composer& cx) { cx.text("Counter"); });
            cx.scope("value", [&](Composer& cx) {
                cx.node("span", [&](Composer& cx) { cx.text(std::to_string(count.read())); });
            });
            cx.node("button", {.handlers = {{"click", [&](EventPayload const&) { count.update([](int& v) { ++v; }); }}}},
                    [](Composer& cx) { cx.text("+"); });
        });
    }));
    REQUIRE(renderer.updates.size() == 1);
    CHECK(renderer.updates[0].path == "root");
    CHECK(renderer.bound == std::vector<std::string>{"root/2"});

    REQUIRE(renderer.fire("root/2", "click"));
    renderer.updates.clear();
    renderer.bound.clear();
    (void)composition.flush();

    REQUIRE(renderer.updates.size() == 1);
    CHECK(renderer.updates[0].path == "root/1");
    CHECK(renderer.updates[0].node.type == "span");
    CHECK(textOf(renderer.updates[0].node.children[0]) == "1");
    CHECK(renderer.bound.empty());
}

TEST_CASE("A scope whose node set changes updates the enclosing node") {
    RecordingRenderer renderer;
    Composition       composition{{.renderer = &renderer}};
    auto&             items = composition.makeState(1);
    REQUIRE(composition.setContent([&](Composer& cx) {
        cx.node("ul", [&](Composer& cx) {
            cx.scope("items", [&](Composer& cx) {
                for (int index = 0; index < items.read(); ++index) {
                    cx.node("li", {.key = "item" + std::to_string(index)});
                }
            });
            cx.node("li", {.key = "footer"});
        });
    }));
    renderer.clear();

    CHECK(items.write(2));
    (void)composition.flush();
    REQUIRE(renderer.updates.size() == 1);
    CHECK(renderer.updates[0].path == "root");
    CHECK(renderer.updates[0].node.children.size() == 3);
}

TEST_CASE("A renderer failure surfaces from setContent") {
    RecordingRenderer renderer;
    renderer.fail_path = "root";
    RecordingDiagnostics diagnostics;
    Composition          composition{{.renderer = &renderer, .diagnostics = &diagnostics}};
    auto                 result = composition.setContent([](Composer& cx) { cx.node("div"); });
    REQUIRE_FALSE(result);
    CHECK(result.error().code == Error::Code::RenderFailure);
    CHECK(diagnostics.count(Error::Code::RenderFailure) == 1);
}

TEST_CASE("Initial rendering can be held back") {
    RecordingRenderer renderer;
    Composition       composition{{.renderer = &renderer, .render_initial = false}};
    auto&             count = composition.makeState(0);
    REQUIRE(composition.setContent([&](Composer& cx) { cx.node("p", [&](Composer& cx) { cx.text(std::to_string(count.read())); }); }));
    CHECK(renderer.updates.empty());

    CHECK(count.write(1));
    (void)composition.flush();
    REQUIRE(renderer.updates.size() == 1);
    CHECK(renderer.updates[0].path == "root");
}

TEST_SUITE_END();
