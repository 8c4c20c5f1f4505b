#include <rstate/runtime/reactive_engine.h>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <vector>

namespace rstate::test {

TEST_CASE("Writes inside a batch run each dependent computation once, with the final values", "[scheduler]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}, {"b", 2}}));
    std::vector<int64_t> seen;

    auto disposer = engine.run_tracked([&] { seen.push_back(state.get("a").as_int() + state.get("b").as_int()); });

    engine.run_batched([&] {
        state.set("a", 3);
        state.set("b", 4);
        state.set("a", 5);
        REQUIRE(seen.size() == 1);
        REQUIRE(engine.scheduler().pending_count() == 1);
    });

    REQUIRE(seen == std::vector<int64_t>{3, 9});
    REQUIRE_FALSE(engine.scheduler().is_batching());
}

TEST_CASE("Nested batches flush when the outermost batch closes", "[scheduler]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}}));
    int runs = 0;
    auto disposer = engine.run_tracked([&] {
        ++runs;
        (void)state.get("a");
    });

    engine.run_batched([&] {
        engine.run_batched([&] { state.set("a", 2); });
        REQUIRE(runs == 1);
        REQUIRE(engine.scheduler().batch_depth() == 1);
        state.set("a", 3);
    });

    REQUIRE(runs == 2);
}

TEST_CASE("run_batched returns the result of its function", "[scheduler]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}}));

    auto result = engine.run_batched([&] {
        state.set("a", 41);
        return state.get("a").as_int() + 1;
    });

    REQUIRE(result == 42);
}

TEST_CASE("A throwing batch function still closes the batch", "[scheduler]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}}));
    std::vector<int64_t> seen;
    auto disposer = engine.run_tracked([&] { seen.push_back(state.get("a").as_int()); });

    REQUIRE_THROWS_AS(engine.run_batched([&] {
        state.set("a", 2);
        throw std::runtime_error("abandoned");
    }), std::runtime_error);

    REQUIRE(engine.scheduler().batch_depth() == 0);
    REQUIRE(seen == std::vector<int64_t>{1, 2});
}

TEST_CASE("The batch function's exception wins over any failure while closing the batch", "[scheduler]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}}));
    auto disposer = engine.run_tracked([&] {
        if (state.get("a").as_int() == 2) { throw 2; }
    });

    REQUIRE_THROWS_AS(engine.run_batched([&] {
        state.set("a", 2);
        throw std::runtime_error("abandoned");
    }), std::runtime_error);
    REQUIRE(engine.scheduler().batch_depth() == 0);
}

TEST_CASE("A failing computation leaves the rest of its generation pending", "[scheduler]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}}));
    int healthy_runs = 0;

    auto failing = engine.run_tracked([&] {
        if (state.get("a").as_int() == 2) { throw std::runtime_error("failed on 2"); }
    });
    auto healthy = engine.run_tracked([&] {
        ++healthy_runs;
        (void)state.get("a");
    });

    REQUIRE_THROWS_AS(engine.run_batched([&] { state.set("a", 2); }), std::runtime_error);
    REQUIRE(healthy_runs == 1);
    REQUIRE(engine.scheduler().is_pending(healthy.id()));

    engine.flush();
    REQUIRE(healthy_runs == 2);
    REQUIRE(engine.scheduler().pending_count() == 0);
}

TEST_CASE("A failing computation propagates from the write that triggered it", "[scheduler]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}}));
    auto disposer = engine.run_tracked([&] {
        if (state.get("a").as_int() < 0) { throw std::invalid_argument("negative"); }
    });

    REQUIRE_THROWS_AS(state.set("a", -1), std::invalid_argument);
    REQUIRE(state.get("a") == Value{-1});
    REQUIRE(disposer.is_active());

    state.set("a", 1);
    REQUIRE(engine.find_computation(disposer.id())->run_count() == 2);
}

TEST_CASE("exit_batch without a batch is a logic error", "[scheduler]") {
    ReactiveEngine engine;
    REQUIRE_THROWS_AS(engine.scheduler().exit_batch(), std::logic_error);
}

TEST_CASE("A computation writing its own dependency re-runs until it settles", "[scheduler]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"count", 0}}));
    int runs = 0;

    auto disposer = engine.run_tracked([&] {
        ++runs;
        auto count = state.get("count").as_int();
        if (count < 3) { state.set("count", count + 1); }
    });

    REQUIRE(state.get("count") == Value{3});
    REQUIRE(runs == 4);
}

TEST_CASE("Computations scheduled during a flush run in the next generation", "[scheduler]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"x", 1}, {"y", 0}}));
    std::vector<std::string> order;

    auto copy = engine.run_tracked([&] {
        order.emplace_back("copy");
        state.set("y", state.get("x").as_int() * 10);
    }, "copy");
    auto reader = engine.run_tracked([&] {
        order.emplace_back(fmt::format("read {}", state.get("y").as_int()));
    }, "reader");
    order.clear();

    auto generations = engine.scheduler().generation_count();
    engine.run_batched([&] { state.set("x", 2); });

    REQUIRE(order == std::vector<std::string>{"copy", "read 20"});
    REQUIRE(engine.scheduler().generation_count() == generations + 2);
}

TEST_CASE("Pending runs of a disposed computation are dropped", "[scheduler]") {
    ReactiveEngine engine;
    auto state = engine.wrap(PlainValue::record({{"a", 1}}));
    int runs = 0;
    auto disposer = engine.run_tracked([&] {
        ++runs;
        (void)state.get("a");
    });

    engine.run_batched([&] {
        state.set("a", 2);
        REQUIRE(engine.scheduler().is_pending(disposer.id()));
        disposer.dispose();
        REQUIRE_FALSE(engine.scheduler().is_pending(disposer.id()));
    });

    REQUIRE(runs == 1);
}

} // namespace rstate::test
