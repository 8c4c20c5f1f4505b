#include <rstate/runtime/observers/reactive_trace.h>
#include <rstate/runtime/reactive_engine.h>

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace rstate {

    namespace {
        // Marks the computation running for the life-time of the guard, also when the run throws
        struct RunningGuard {
            explicit RunningGuard(bool &running) : _running{running} { _running = true; }
            ~RunningGuard() { _running = false; }

        private:
            bool &_running;
        };
    } // namespace

    ReactiveEngine::ReactiveEngine(EngineConfig config)
        : _config{std::move(config)}, _graph{_computations}, _scheduler{*this} {
        for (auto observer: _config.observers) { add_life_cycle_observer(observer); }
        if (_config.trace) {
            _trace = std::make_unique<ReactiveTrace>(_config.trace_filter, true, true, true, true,
                                                     _config.trace_to_stderr);
            add_life_cycle_observer(_trace.get());
        }
    }

    ReactiveEngine::~ReactiveEngine() {
        // Computations capture handles, drop them before the containers they refer to
        _observers.clear();
        _computations.clear();
        _containers.clear();
    }

    Record ReactiveEngine::wrap(const PlainValue &record, std::string label) {
        if (!record.is_record()) {
            throw_error<std::invalid_argument>("wrap expects a record, got: {}", record.type_name());
        }
        auto id = create_container(ContainerKind::RECORD, std::move(label));
        populate(id, record);
        return Record{this, id};
    }

    Sequence ReactiveEngine::wrap_sequence(const PlainValue &items, std::string label) {
        if (!items.is_list()) {
            throw_error<std::invalid_argument>("wrap_sequence expects a list, got: {}", items.type_name());
        }
        auto id = create_container(ContainerKind::SEQUENCE, std::move(label));
        populate(id, items);
        return Sequence{this, id};
    }

    Record ReactiveEngine::ref(Value value, std::string label) {
        auto id = create_container(ContainerKind::RECORD, std::move(label));
        _containers.get(id)->put_field("value", std::move(value));
        return Record{this, id};
    }

    Disposer ReactiveEngine::run_tracked(effect_fn fn, std::string label) {
        return start_eager(create_computation<EffectComputation>(std::move(label), std::move(fn)));
    }

    Derived ReactiveEngine::derive(reader_fn fn, std::string label) {
        return Derived{this, create_computation<DerivedComputation>(std::move(label), std::move(fn))};
    }

    Disposer ReactiveEngine::observe(reader_fn reader, on_change_fn on_change, std::string label) {
        return start_eager(
            create_computation<WatchComputation>(std::move(label), std::move(reader), std::move(on_change)));
    }

    Disposer ReactiveEngine::observe(const Record &record, std::string field, on_change_fn on_change,
                                     std::string label) {
        if (label.empty()) { label = fmt::format("{}.{}", container(record.id()).display_name(), field); }
        return observe([record, field = std::move(field)] { return record.get(field); }, std::move(on_change),
                       std::move(label));
    }

    Disposer ReactiveEngine::observe(const Derived &derived, on_change_fn on_change, std::string label) {
        const auto &computation = derived.computation();
        if (!computation || computation->is_disposed()) {
            throw_error<ReactiveError>("Cannot observe a derived value that has been disposed");
        }
        auto watcher = create_computation<WatchComputation>(
            std::move(label), [this, computation] { return read_derived(computation); }, std::move(on_change));
        computation->_chained.push_back(watcher->id());
        return start_eager(watcher);
    }

    void ReactiveEngine::dispose(ComputationId id) {
        auto computation = _computations.find(id);
        if (!computation || computation->_disposed) { return; }
        auto &c = *computation;
        c._disposed = true;
        c._rerun_requested = false;
        clear_subscriptions(c);
        _scheduler.drop(id);
        if (c.kind() == ComputationKind::DERIVED) { _graph.release(id); }
        // A computation disposed while running stays alive through the caller's reference until its run completes
        _computations.erase(id);
        for (auto observer: _observers) { observer->on_computation_disposed(c); }
        auto chained = std::move(c._chained);
        for (auto child: chained) { dispose(child); }
    }

    bool ReactiveEngine::is_active(ComputationId id) const {
        auto computation = _computations.get(id);
        return computation != nullptr && !computation->is_disposed();
    }

    DisposerCollection ReactiveEngine::scope(const std::function<void(DisposerCollection &)> &fn) {
        DisposerCollection collection;
        try {
            fn(collection);
        } catch (...) {
            collection.dispose();
            throw;
        }
        return collection;
    }

    void ReactiveEngine::add_life_cycle_observer(ReactiveLifeCycleObserver::ptr observer) {
        if (observer == nullptr) { return; }
        if (std::find(_observers.begin(), _observers.end(), observer) != _observers.end()) { return; }
        _observers.push_back(observer);
    }

    void ReactiveEngine::remove_life_cycle_observer(ReactiveLifeCycleObserver::ptr observer) {
        auto it = std::find(_observers.begin(), _observers.end(), observer);
        if (it != _observers.end()) { _observers.erase(it); }
    }

    Value ReactiveEngine::read_derived(const derived_s_ptr &derived) {
        auto &d = *derived;
        if (d.is_disposed()) { return d.cached_value(); }
        if (d.is_running()) {
            throw_error<CircularDependencyError>("Derived value '{}' was read while computing itself",
                                                 d.display_name());
        }
        track(d.source_key());
        if (d.is_dirty()) { run_computation(derived); }
        return d.cached_value();
    }

    void ReactiveEngine::run_scheduled(ComputationId id) {
        if (auto computation = _computations.find(id); computation && !computation->is_disposed()) {
            run_computation(computation);
        }
    }

    void ReactiveEngine::notify_before_flush(size_t pending) {
        for (auto observer: _observers) { observer->on_before_flush(pending); }
    }

    void ReactiveEngine::notify_after_flush() {
        for (auto observer: _observers) { observer->on_after_flush(); }
    }

    void ReactiveEngine::abandon_batch() {
        try {
            _scheduler.exit_batch();
        } catch (const std::exception &e) {
            // The exception that abandoned the batch takes precedence
            fmt::print(stderr, "Warning: flush of an abandoned batch failed: {}\n", e.what());
        } catch (...) {
            fmt::print(stderr, "Warning: flush of an abandoned batch failed: unknown exception\n");
        }
    }

    template<typename T, typename... Args>
    std::shared_ptr<T> ReactiveEngine::create_computation(std::string label, Args &&...args) {
        std::shared_ptr<T> created;
        _computations.insert([&](ComputationId id) {
            created = std::make_shared<T>(*this, id, std::move(label), std::forward<Args>(args)...);
            return created;
        });
        return created;
    }

    Disposer ReactiveEngine::start_eager(const computation_s_ptr &computation) {
        try {
            run_computation(computation);
        } catch (...) {
            dispose(computation->id());
            throw;
        }
        return Disposer{this, computation->id()};
    }

    void ReactiveEngine::run_computation(const computation_s_ptr &computation) {
        auto &c = *computation;
        if (c._disposed) { return; }
        if (c._running) {
            // Re-triggered from inside its own run, collapse into a single follow-up run
            c._rerun_requested = true;
            return;
        }
        RunningGuard running{c._running};
        do {
            c._rerun_requested = false;
            clear_subscriptions(c);
            for (auto observer: _observers) { observer->on_before_computation(c); }
            try {
                ContextFrame frame{_context, c._id};
                c.do_execute();
            } catch (...) {
                c._rerun_requested = false;
                auto error = std::current_exception();
                for (auto observer: _observers) { observer->on_computation_error(c, error); }
                throw;
            }
            ++c._run_count;
            for (auto observer: _observers) { observer->on_after_computation(c); }
        } while (c._rerun_requested && !c._disposed);
    }

    void ReactiveEngine::clear_subscriptions(Computation &computation) {
        for (const auto &key: computation._subscriptions) { _graph.untrack(key, computation._id); }
        computation._subscriptions.clear();
    }

    void ReactiveEngine::track(const FieldKey &key) {
        auto current = _context.current();
        if (!current) { return; }
        auto computation = _computations.get(*current);
        if (computation == nullptr || computation->_disposed) { return; }
        if (_graph.track(key, *current)) { computation->_subscriptions.push_back(key); }
    }

    void ReactiveEngine::trigger_all(const std::vector<FieldKey> &keys) {
        // Inside a batch triggering only marks and schedules, no consumer code runs before exit_batch. Every
        // subscriber of every key is therefore notified before any effect observes the write.
        _scheduler.enter_batch();
        for (const auto &key: keys) { _graph.trigger(key); }
        _scheduler.exit_batch();
    }

    void ReactiveEngine::notify_field_write(const ContainerState &container, std::string_view field,
                                            const Value &old_value, const Value &new_value) {
        for (auto observer: _observers) { observer->on_field_write(container, field, old_value, new_value); }
    }

} // namespace rstate
