#include <rstate/runtime/reactive_engine.h>

#include <catch2/catch_test_macros.hpp>

namespace rstate::test {

struct ArenaTestTag;

TEST_CASE("SubscriberList keeps subscription order and ignores duplicates", "[graph]") {
    SubscriberList list;
    ComputationId first{0, 0};
    ComputationId second{1, 0};

    REQUIRE(list.subscribe(second));
    REQUIRE(list.subscribe(first));
    REQUIRE_FALSE(list.subscribe(second));
    REQUIRE(list.size() == 2);
    REQUIRE(list.subscribers() == std::vector<ComputationId>{second, first});

    REQUIRE(list.unsubscribe(second));
    REQUIRE_FALSE(list.unsubscribe(second));
    REQUIRE(list.subscribers() == std::vector<ComputationId>{first});
}

TEST_CASE("SubscriberList rejects invalid ids", "[graph]") {
    SubscriberList list;
    REQUIRE_FALSE(list.subscribe(ComputationId{}));
    REQUIRE(list.empty());
}

TEST_CASE("Stale ids do not resolve after the slot is reused", "[graph]") {
    SlotArena<int, ArenaTestTag> arena;
    auto first = arena.insert([](auto) { return std::make_shared<int>(1); });
    REQUIRE(arena.erase(first) != nullptr);
    auto second = arena.insert([](auto) { return std::make_shared<int>(2); });

    REQUIRE(first.index == second.index);
    REQUIRE_FALSE(arena.contains(first));
    REQUIRE(*arena.get(second) == 2);
    REQUIRE(arena.size() == 1);
}

TEST_CASE("Tracked reads create field entries, the subscription set is the last run's reads", "[graph]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}, {"b", 2}}));
    const auto &graph = engine.dependency_graph();

    auto disposer = engine.run_tracked([&] { (void)state.get("a"); });

    auto key_a = FieldKey::container(state.id(), "a");
    auto key_b = FieldKey::container(state.id(), "b");
    REQUIRE(graph.subscribers(key_a) == std::vector<ComputationId>{disposer.id()});
    REQUIRE_FALSE(graph.has_entry(key_b));
    REQUIRE(engine.find_computation(disposer.id())->subscriptions().size() == 1);
}

TEST_CASE("Reads outside a computation are not tracked", "[graph]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}}));

    REQUIRE(state.get("a") == Value{1});
    REQUIRE(engine.dependency_graph().entry_count() == 0);
}

TEST_CASE("Untracked reads inside a computation are not attributed", "[graph]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}, {"b", 2}}));
    int runs = 0;

    auto disposer = engine.run_tracked([&] {
        ++runs;
        (void)state.get("a");
        engine.untracked([&] { return state.get("b"); });
    });

    state.set("b", 3);
    REQUIRE(runs == 1);
    state.set("a", 5);
    REQUIRE(runs == 2);
}

TEST_CASE("Nested computations attribute reads to the innermost one", "[graph]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"outer", 1}, {"inner", 2}}));
    int outer_runs = 0;
    int inner_runs = 0;
    Disposer inner;

    auto outer = engine.run_tracked([&] {
        ++outer_runs;
        (void)state.get("outer");
        if (!inner) {
            inner = engine.run_tracked([&] {
                ++inner_runs;
                (void)state.get("inner");
            });
        }
    });

    state.set("inner", 3);
    REQUIRE(inner_runs == 2);
    REQUIRE(outer_runs == 1);

    state.set("outer", 4);
    REQUIRE(outer_runs == 2);
    REQUIRE(inner_runs == 2);
}

TEST_CASE("Releasing a container drops its field entries", "[graph]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}, {"child", PlainValue::record({{"x", 1}})}}));
    auto child = state.get("child").as_record();

    auto disposer = engine.run_tracked([&] {
        (void)state.get("a");
        (void)child.get("x");
    });
    REQUIRE(engine.dependency_graph().entry_count() == 2);
    REQUIRE(engine.container_count() == 2);

    engine.release(state);

    REQUIRE(engine.dependency_graph().entry_count() == 0);
    REQUIRE(engine.container_count() == 0);
    REQUIRE_FALSE(state.is_alive());
    REQUIRE_FALSE(child.is_alive());
    REQUIRE_THROWS_AS(state.get("a"), ReleasedContainerError);
}

} // namespace rstate::test
