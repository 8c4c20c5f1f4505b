#include <rstate/runtime/reactive_engine.h>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <vector>

namespace rstate::test {

TEST_CASE("A derived value runs only when read, and once per change", "[derived]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"x", 3}}));
    int runs = 0;
    auto doubled = engine.derive([&] {
        ++runs;
        return Value{state.get("x").as_int() * 2};
    });

    REQUIRE(runs == 0);
    REQUIRE(doubled.is_dirty());
    REQUIRE(doubled.get() == Value{6});
    REQUIRE(doubled.get() == Value{6});
    REQUIRE(runs == 1);

    state.set("x", 4);
    REQUIRE(runs == 1);
    REQUIRE(doubled.is_dirty());
    REQUIRE(doubled.get() == Value{8});
    REQUIRE(runs == 2);
}

TEST_CASE("Each link of a derived chain recomputes at most once per flush", "[derived]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"x", 1}}));
    int first_runs = 0;
    int second_runs = 0;
    int effect_runs = 0;
    auto first = engine.derive([&] {
        ++first_runs;
        return Value{state.get("x").as_int() * 2};
    });
    auto second = engine.derive([&] {
        ++second_runs;
        return Value{first.get().as_int() + 1};
    });
    std::vector<int64_t> seen;
    auto disposer = engine.run_tracked([&] {
        ++effect_runs;
        seen.push_back(second.get().as_int());
    });

    engine.run_batched([&] {
        state.set("x", 2);
        state.set("x", 3);
        state.set("x", 4);
    });

    REQUIRE(seen == std::vector<int64_t>{3, 9});
    REQUIRE(first_runs == 2);
    REQUIRE(second_runs == 2);
    REQUIRE(effect_runs == 2);
}

TEST_CASE("A computation reached along two derived paths sees consistent values", "[derived]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"x", 1}}));
    auto doubled = engine.derive([state] { return Value{state.get("x").as_int() * 2}; });
    auto incremented = engine.derive([state] { return Value{state.get("x").as_int() + 1}; });
    std::vector<int64_t> seen;
    auto disposer = engine.run_tracked([&] { seen.push_back(doubled.get().as_int() + incremented.get().as_int()); });

    state.set("x", 10);

    REQUIRE(seen == std::vector<int64_t>{4, 31});
}

TEST_CASE("A derived value that reads itself is a circular dependency", "[derived]") {
    ReactiveEngine engine;
    Derived self;
    self = engine.derive([&] { return self.get(); }, "self");

    REQUIRE_THROWS_AS(self.get(), CircularDependencyError);
    REQUIRE(self.is_dirty());
}

TEST_CASE("A failing derived value stays dirty and re-throws to the reader", "[derived]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"divisor", 0}}));
    auto ratio = engine.derive([state] {
        auto divisor = state.get("divisor").as_int();
        if (divisor == 0) { throw std::domain_error("division by zero"); }
        return Value{100 / divisor};
    });

    REQUIRE_THROWS_AS(ratio.get(), std::domain_error);
    REQUIRE(ratio.is_dirty());

    state.set("divisor", 4);
    REQUIRE(ratio.get() == Value{int64_t{25}});
}

TEST_CASE("Readers of a failing derived value are notified again once it recovers", "[derived]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"x", 1}}));
    auto doubled = engine.derive([state] {
        auto x = state.get("x").as_int();
        if (x < 0) { throw std::domain_error("negative"); }
        return Value{x * 2};
    });
    std::vector<Value> seen;
    auto effect = engine.run_tracked([&] { seen.push_back(doubled.get()); });
    REQUIRE(seen.size() == 1);

    REQUIRE_THROWS_AS(state.set("x", -1), std::domain_error);
    REQUIRE(doubled.is_dirty());

    state.set("x", 5);
    REQUIRE(seen.size() == 2);
    REQUIRE(seen.back() == Value{int64_t{10}});
    REQUIRE_FALSE(doubled.is_dirty());

    state.set("x", 6);
    REQUIRE(seen.size() == 3);
    REQUIRE(seen.back() == Value{int64_t{12}});
}

TEST_CASE("A disposed derived value answers with its last value", "[derived]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"x", 1}}));
    int runs = 0;
    auto derived = engine.derive([&] {
        ++runs;
        return state.get("x");
    });
    REQUIRE(derived.get() == Value{1});

    derived.dispose();
    state.set("x", 2);

    REQUIRE_FALSE(derived.is_active());
    REQUIRE(derived.get() == Value{1});
    REQUIRE(runs == 1);
    REQUIRE(engine.dependency_graph().entry_count() == 0);
}

TEST_CASE("Readers of a derived value stop depending on it once they stop reading it", "[derived]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"use", true}, {"x", 1}}));
    auto derived = engine.derive([state] { return state.get("x"); });
    int runs = 0;
    auto disposer = engine.run_tracked([&] {
        ++runs;
        if (state.get("use").as_bool()) { (void)derived.get(); }
    });

    state.set("use", false);
    REQUIRE(runs == 2);
    REQUIRE(engine.dependency_graph().subscriber_count(derived.computation()->source_key()) == 0);

    state.set("x", 2);
    REQUIRE(runs == 2);
}

} // namespace rstate::test
