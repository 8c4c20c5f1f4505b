#include <rstate/runtime/reactive_engine.h>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <vector>

namespace rstate::test {

TEST_CASE("A computation re-runs once per value-changing write, never for a same-value write", "[record]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}}));
    int runs = 0;
    auto disposer = engine.run_tracked([&] {
        ++runs;
        (void)state.get("a");
    });

    state.set("a", 2);
    REQUIRE(runs == 2);
    state.set("a", 2);
    REQUIRE(runs == 2);
}

TEST_CASE("Conditional reads change the subscription set", "[record]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"flag", true}, {"a", "A"}, {"b", "B"}}));
    std::vector<std::string> seen;
    auto disposer = engine.run_tracked([&] {
        seen.push_back(state.get("flag").as_bool() ? state.get("a").as_string() : state.get("b").as_string());
    });

    state.set("b", "B2");
    REQUIRE(seen.size() == 1);

    state.set("flag", false);
    REQUIRE(seen.back() == "B2");

    state.set("a", "A2");
    REQUIRE(seen.size() == 2);

    state.set("b", "B3");
    REQUIRE(seen.back() == "B3");
    REQUIRE(seen.size() == 3);
}

TEST_CASE("Reading a missing field is tracked", "[record]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({}));
    std::vector<Value> seen;
    auto disposer = engine.run_tracked([&] { seen.push_back(state.get("late")); });

    REQUIRE(seen.back().is_null());
    state.set("late", 5);
    REQUIRE(seen.back() == Value{5});
}

TEST_CASE("Membership readers re-run when fields are created or removed", "[record]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}}));
    std::vector<size_t> sizes;
    auto disposer = engine.run_tracked([&] { sizes.push_back(state.keys().size()); });

    state.set("a", 2);
    REQUIRE(sizes == std::vector<size_t>{1});

    state.set("b", 1);
    REQUIRE(sizes == std::vector<size_t>{1, 2});

    REQUIRE(state.remove("a"));
    REQUIRE(sizes == std::vector<size_t>{1, 2, 1});

    REQUIRE_FALSE(state.remove("a"));
    REQUIRE(sizes.size() == 3);
    REQUIRE(state.keys() == std::vector<std::string>{"b"});
}

TEST_CASE("has() re-runs when the field appears", "[record]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({}));
    std::vector<bool> seen;
    auto disposer = engine.run_tracked([&] { seen.push_back(state.has("x")); });

    state.set("x", 0);
    REQUIRE(seen == std::vector<bool>{false, true});
}

TEST_CASE("update() applies its writes as one batch", "[record]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}, {"b", 2}}));
    std::vector<int64_t> seen;
    auto disposer = engine.run_tracked([&] { seen.push_back(state.get("a").as_int() * state.get("b").as_int()); });

    state.update({{"a", 3}, {"b", 4}});

    REQUIRE(seen == std::vector<int64_t>{2, 12});
}

TEST_CASE("notify() re-runs subscribers without a write", "[record]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}, {"b", 1}}));
    int a_runs = 0;
    int b_runs = 0;
    auto on_a = engine.run_tracked([&] {
        ++a_runs;
        (void)state.get("a");
    });
    auto on_b = engine.run_tracked([&] {
        ++b_runs;
        (void)state.get("b");
    });

    state.notify("a");
    REQUIRE(a_runs == 2);
    REQUIRE(b_runs == 1);

    state.notify_all();
    REQUIRE(a_runs == 3);
    REQUIRE(b_runs == 2);
}

TEST_CASE("Nested records are reactive containers of their own", "[record]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"user", PlainValue::record({{"name", "ada"}})}}));
    std::vector<std::string> seen;
    auto disposer = engine.run_tracked([&] { seen.push_back(state.get("user").as_record().get("name").as_string()); });

    state.get("user").as_record().set("name", "grace");
    REQUIRE(seen.back() == "grace");

    state.set_plain("user", PlainValue::record({{"name", "linus"}}));
    REQUIRE(seen.back() == "linus");
    REQUIRE(seen.size() == 3);
}

TEST_CASE("Writing a container handle back into its field is not a change", "[record]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"items", PlainValue::list({1, 2})}}));
    int runs = 0;
    auto disposer = engine.run_tracked([&] {
        ++runs;
        (void)state.get("items");
    });

    state.set("items", state.get("items"));
    REQUIRE(runs == 1);
}

TEST_CASE("Computed fields read their derived value and are read-only", "[record]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"first", "Ada"}, {"last", "Lovelace"}}), "person");
    auto full = state.computed("full", [state] {
        return Value{state.get("first").as_string() + " " + state.get("last").as_string()};
    });
    std::vector<std::string> seen;
    auto disposer = engine.run_tracked([&] { seen.push_back(state.get("full").as_string()); });

    REQUIRE(seen.back() == "Ada Lovelace");
    state.set("first", "Augusta");
    REQUIRE(seen.back() == "Augusta Lovelace");
    REQUIRE(full.get() == Value{"Augusta Lovelace"});

    REQUIRE_THROWS_AS(state.set("full", "x"), ReadOnlyFieldError);
    REQUIRE_THROWS_AS(state.remove("full"), ReadOnlyFieldError);
    REQUIRE(state.has("full"));
    REQUIRE(state.keys() == std::vector<std::string>{"first", "last", "full"});
    REQUIRE(full.computation()->label() == "person.full");
}

TEST_CASE("The shape field name is reserved", "[record]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({}));
    REQUIRE_THROWS_AS(state.set(SHAPE_FIELD, 1), std::invalid_argument);
}

TEST_CASE("snapshot() is a detached deep copy of the stored fields", "[record]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"n", 1}, {"tags", PlainValue::list({"a", "b"})}}));
    (void)state.computed("double", [state] { return Value{state.get("n").as_int() * 2}; });
    int runs = 0;
    PlainValue copy;
    auto disposer = engine.run_tracked([&] {
        ++runs;
        copy = state.snapshot();
    });

    REQUIRE(copy.to_string() == R"({"n": 1, "tags": ["a", "b"]})");

    state.set("n", 2);
    REQUIRE(runs == 1);
    REQUIRE(copy["n"].as_int() == 1);
}

TEST_CASE("snapshot() refuses a record that contains itself", "[record]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({}));
    state.set("self", state);
    REQUIRE_THROWS_AS(state.snapshot(), ReactiveError);
}

TEST_CASE("ref() wraps a single value", "[record]") {
    ReactiveEngine engine;
    auto counter = engine.ref(0, "counter");
    std::vector<int64_t> seen;
    auto disposer = engine.run_tracked([&] { seen.push_back(counter.get("value").as_int()); });

    counter.set("value", 1);
    REQUIRE(seen == std::vector<int64_t>{0, 1});
    REQUIRE(counter.label() == "counter");
}

TEST_CASE("wrap() rejects non-record input", "[record]") {
    ReactiveEngine engine;
    REQUIRE_THROWS_AS(engine.wrap(PlainValue{1}), std::invalid_argument);
    REQUIRE_THROWS_AS(engine.wrap_sequence(PlainValue::record({})), std::invalid_argument);
}

TEST_CASE("A released record refuses access", "[record]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}}));
    engine.release(state);

    REQUIRE_FALSE(state.is_alive());
    REQUIRE_THROWS_AS(state.get("a"), ReleasedContainerError);
    REQUIRE_THROWS_AS(state.set("a", 2), ReleasedContainerError);
    REQUIRE_THROWS_AS(engine.release(state), ReleasedContainerError);
    REQUIRE_THROWS_AS(Record{}.get("a"), ReleasedContainerError);
}

TEST_CASE("Nested records replaced by plain data are released", "[record]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"n", PlainValue::record({{"a", 0}})}}));
    REQUIRE(engine.container_count() == 2);

    auto first = state.get("n").as_record();
    for (int i = 1; i <= 100; ++i) { state.set_plain("n", PlainValue::record({{"a", i}})); }
    REQUIRE(engine.container_count() == 2);
    REQUIRE_FALSE(first.is_alive());
    REQUIRE(state.get("n").as_record().get("a") == Value{100});

    // Still held by another field, so overwriting the first one keeps it
    state.set("copy", state.get("n"));
    state.set("n", 0);
    REQUIRE(engine.container_count() == 2);
    REQUIRE(state.get("copy").as_record().get("a") == Value{100});

    REQUIRE(state.remove("copy"));
    REQUIRE(engine.container_count() == 1);

    state.computed("total", [] { return Value{0}; });
    REQUIRE_THROWS_AS(state.set_plain("total", PlainValue::record({{"a", 1}})), ReadOnlyFieldError);
    REQUIRE(engine.container_count() == 1);
}

} // namespace rstate::test
