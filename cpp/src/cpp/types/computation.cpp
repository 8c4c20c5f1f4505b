#include <rstate/runtime/reactive_engine.h>
#include <rstate/types/computation.h>

namespace rstate {

    std::string_view to_string(ComputationKind kind) {
        switch (kind) {
            case ComputationKind::EFFECT: return "effect";
            case ComputationKind::DERIVED: return "derived";
            case ComputationKind::WATCH: return "watch";
        }
        return "unknown";
    }

    Computation::Computation(ReactiveEngine &engine, ComputationId id, std::string label)
        : _engine{engine}, _id{id}, _label{std::move(label)} {}

    std::string Computation::display_name() const {
        if (!_label.empty()) { return _label; }
        return fmt::format("{}#{}", to_string(kind()), _id.index);
    }

    EffectComputation::EffectComputation(ReactiveEngine &engine, ComputationId id, std::string label, effect_fn fn)
        : Computation(engine, id, std::move(label)), _fn{std::move(fn)} {}

    void EffectComputation::notify() {
        if (is_disposed()) { return; }
        engine().scheduler().schedule(id());
    }

    void EffectComputation::do_execute() { _fn(); }

    DerivedComputation::DerivedComputation(ReactiveEngine &engine, ComputationId id, std::string label, reader_fn fn)
        : Computation(engine, id, std::move(label)), _fn{std::move(fn)} {}

    void DerivedComputation::notify() {
        if (is_disposed() || (_dirty && !_failed)) { return; }
        _dirty = true;
        engine().dependency_graph().trigger(source_key());
    }

    void DerivedComputation::do_execute() {
        // If the function throws the value stays dirty, a failed result is never cached
        _failed = true;
        _cached = _fn();
        _dirty = false;
        _failed = false;
    }

    WatchComputation::WatchComputation(ReactiveEngine &engine, ComputationId id, std::string label, reader_fn reader,
                                       on_change_fn on_change)
        : Computation(engine, id, std::move(label)), _reader{std::move(reader)}, _on_change{std::move(on_change)} {}

    void WatchComputation::notify() {
        if (is_disposed()) { return; }
        engine().scheduler().schedule(id());
    }

    void WatchComputation::do_execute() {
        auto next = _reader();
        if (!_initialised) {
            _previous = std::move(next);
            _initialised = true;
            return;
        }
        if (next == _previous) { return; }
        auto old = _previous;
        engine().untracked([&] { _on_change(next, old); });
        _previous = std::move(next);
    }

} // namespace rstate
