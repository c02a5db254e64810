#include <composespace/runtime/DependencyTracker.hpp>
#include <composespace/runtime/StateCell.hpp>

#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <vector>

using namespace CS::Runtime;

namespace {

struct RecordingSink final : InvalidationSink {
    std::vector<ScopeId> invalidated;

    auto invalidate(ScopeId scope) -> void override {
        invalidated.push_back(scope);
    }
};

} // namespace

TEST_SUITE_BEGIN("runtime.tracker");

TEST_CASE("reads inside a frame register the scope as a reader") {
    RecordingSink     sink;
    DependencyTracker tracker{sink};
    StateCell<int>    cell{tracker, kNoScope, 1};

    DependencySet dependencies;
    {
        auto frame = tracker.enter(7, dependencies);
        CHECK(tracker.currentScope() == 7);
        CHECK(cell.read() == 1);
    }
    CHECK(tracker.currentScope() == kNoScope);
    CHECK(cell.readers().contains(7));
    CHECK(dependencies.contains(cell.id()));

    CHECK(cell.write(2));
    CHECK(sink.invalidated == std::vector<ScopeId>{7});
    CHECK(cell.readers().empty());
    CHECK(cell.version() == 1);
}

TEST_CASE("writing an equal value changes nothing") {
    RecordingSink     sink;
    DependencyTracker tracker{sink};
    StateCell<std::string> cell{tracker, kNoScope, "same"};

    DependencySet dependencies;
    {
        auto frame = tracker.enter(3, dependencies);
        (void)cell.read();
    }
    CHECK_FALSE(cell.write("same"));
    CHECK_FALSE(cell.update([](std::string&) {}));
    CHECK(sink.invalidated.empty());
    CHECK(cell.version() == 0);
    CHECK(cell.readers().contains(3));
}

TEST_CASE("untracked reads do not subscribe") {
    RecordingSink     sink;
    DependencyTracker tracker{sink};
    StateCell<int>    cell{tracker, kNoScope, 0};

    SUBCASE("Outside any frame") {
        (void)cell.read();
    }
    SUBCASE("Inside a suspended frame") {
        DependencySet dependencies;
        auto          frame = tracker.enter(5, dependencies);
        {
            auto paused = tracker.suspend();
            CHECK(tracker.currentScope() == kNoScope);
            (void)cell.read();
        }
        CHECK(dependencies.empty());
    }
    SUBCASE("Through peek") {
        DependencySet dependencies;
        auto          frame = tracker.enter(5, dependencies);
        CHECK(cell.peek() == 0);
    }

    CHECK(cell.readers().empty());
    CHECK(cell.write(1));
    CHECK(sink.invalidated.empty());
}

TEST_CASE("releasing dependencies drops the scope from every cell") {
    RecordingSink     sink;
    DependencyTracker tracker{sink};
    StateCell<int>    first{tracker, kNoScope, 0};
    StateCell<int>    second{tracker, kNoScope, 0};

    DependencySet dependencies;
    {
        auto frame = tracker.enter(9, dependencies);
        (void)first.read();
        (void)second.read();
    }
    CHECK(dependencies.size() == 2);

    tracker.releaseDependencies(9, dependencies);
    CHECK(dependencies.empty());
    CHECK(first.readers().empty());
    CHECK(second.readers().empty());
    CHECK(first.write(1));
    CHECK(sink.invalidated.empty());
}

TEST_CASE("cells unregister when destroyed") {
    RecordingSink     sink;
    DependencyTracker tracker{sink};
    CellId            id = 0;
    {
        auto cell = std::make_unique<StateCell<int>>(tracker, kNoScope, 0);
        id        = cell->id();
        CHECK(tracker.findCell(id) == cell.get());
        CHECK(tracker.cellCount() == 1);
    }
    CHECK(tracker.findCell(id) == nullptr);
    CHECK(tracker.cellCount() == 0);
}

TEST_CASE("write hooks see every changed value") {
    RecordingSink     sink;
    DependencyTracker tracker{sink};
    StateCell<int>    cell{tracker, kNoScope, 0};

    std::vector<int> mirrored;
    cell.setWriteHook([&](int const& value) { mirrored.push_back(value); });
    CHECK(cell.write(1));
    CHECK_FALSE(cell.write(1));
    CHECK(cell.update([](int& value) { value += 10; }));
    CHECK(mirrored == std::vector<int>{1, 11});
}

TEST_CASE("async values behave like state") {
    RecordingSink       sink;
    DependencyTracker   tracker{sink};
    AsyncValue<std::string> value{tracker, kNoScope};

    DependencySet dependencies;
    {
        auto frame = tracker.enter(4, dependencies);
        CHECK(value.status() == AsyncStatus::Pending);
        CHECK(value.value() == nullptr);
        CHECK_FALSE(value.error().has_value());
    }

    CHECK(value.resolve("done"));
    CHECK(sink.invalidated == std::vector<ScopeId>{4});
    REQUIRE(value.value() != nullptr);
    CHECK(*value.value() == "done");
    CHECK(value.status() == AsyncStatus::Ready);
    CHECK_FALSE(value.resolve("done"));

    CHECK(value.fail("timeout"));
    CHECK(value.value() == nullptr);
    CHECK(value.error() == std::optional<std::string>{"timeout"});

    CHECK(value.reset());
    CHECK(value.status() == AsyncStatus::Pending);
}

TEST_SUITE_END();
