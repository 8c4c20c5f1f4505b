#include <rstate/runtime/reactive_engine.h>
#include <rstate/types/derived.h>

namespace rstate {

    Derived::Derived(engine_ptr engine, derived_s_ptr computation)
        : _engine{engine}, _computation{std::move(computation)} {}

    Value Derived::get() const {
        if (_engine == nullptr || !_computation) { throw_error<ReactiveError>("Derived handle is empty"); }
        return _engine->read_derived(_computation);
    }

    bool Derived::is_dirty() const { return _computation && _computation->is_dirty(); }

    bool Derived::is_active() const { return _computation && !_computation->is_disposed(); }

    ComputationId Derived::id() const { return _computation ? _computation->id() : ComputationId{}; }

    Disposer Derived::disposer() const { return Disposer{_engine, id()}; }

    void Derived::dispose() const {
        if (_engine != nullptr && _computation) { _engine->dispose(_computation->id()); }
    }

    Disposer Derived::observe(on_change_fn on_change, std::string label) const {
        if (_engine == nullptr) { throw_error<ReactiveError>("Derived handle is empty"); }
        return _engine->observe(*this, std::move(on_change), std::move(label));
    }

} // namespace rstate
