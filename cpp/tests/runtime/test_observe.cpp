#include <rstate/runtime/reactive_engine.h>

#include <catch2/catch_test_macros.hpp>

#include <utility>
#include <vector>

namespace rstate::test {

namespace {
    struct Transition {
        Value new_value;
        Value old_value;

        bool operator==(const Transition &) const = default;
    };

    on_change_fn record_into(std::vector<Transition> &transitions) {
        return [&transitions](const Value &new_value, const Value &old_value) {
            transitions.push_back(Transition{new_value, old_value});
        };
    }
} // namespace

TEST_CASE("A watcher is not called on registration and reports (new, old) afterwards", "[observe]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"count", 1}}));
    std::vector<Transition> transitions;

    auto disposer = engine.observe([state] { return state.get("count"); }, record_into(transitions));
    REQUIRE(transitions.empty());

    state.set("count", 2);
    state.set("count", 5);

    REQUIRE(transitions == std::vector<Transition>{{Value{2}, Value{1}}, {Value{5}, Value{2}}});
}

TEST_CASE("A watcher is not called when the watched expression does not change", "[observe]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"count", 1}}));
    std::vector<Transition> transitions;

    auto disposer = engine.observe([state] { return Value{state.get("count").as_int() % 2 == 0}; },
                                   record_into(transitions));

    state.set("count", 3);
    REQUIRE(transitions.empty());
    REQUIRE(engine.find_computation(disposer.id())->run_count() == 2);

    state.set("count", 4);
    REQUIRE(transitions == std::vector<Transition>{{Value{true}, Value{false}}});
}

TEST_CASE("Watching a record field", "[observe]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"name", "a"}, {"other", 0}}), "form");
    std::vector<Transition> transitions;

    auto disposer = engine.observe(state, "name", record_into(transitions));
    state.set("other", 1);
    state.set("name", "b");

    REQUIRE(transitions == std::vector<Transition>{{Value{"b"}, Value{"a"}}});
    REQUIRE(engine.find_computation(disposer.id())->label() == "form.name");
}

TEST_CASE("Reads made by the change callback are not tracked", "[observe]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"watched", 1}, {"side", 1}}));
    int calls = 0;

    auto disposer = engine.observe(state, "watched", [&](const Value &, const Value &) {
        ++calls;
        (void)state.get("side");
    });

    state.set("watched", 2);
    REQUIRE(calls == 1);
    state.set("side", 2);
    REQUIRE(calls == 1);
    REQUIRE(engine.find_computation(disposer.id())->subscriptions().size() == 1);
}

TEST_CASE("Watchers of a derived value are disposed with it", "[observe]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"x", 1}}));
    auto doubled = engine.derive([state] { return Value{state.get("x").as_int() * 2}; });
    std::vector<Transition> transitions;

    auto watcher = doubled.observe(record_into(transitions));
    state.set("x", 2);
    REQUIRE(transitions == std::vector<Transition>{{Value{int64_t{4}}, Value{int64_t{2}}}});

    doubled.dispose();
    REQUIRE_FALSE(watcher.is_active());

    state.set("x", 3);
    REQUIRE(transitions.size() == 1);
    REQUIRE_THROWS_AS(doubled.observe(record_into(transitions)), ReactiveError);
}

} // namespace rstate::test
