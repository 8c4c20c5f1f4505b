#ifndef RSTATE_REACTIVE_ENGINE_H
#define RSTATE_REACTIVE_ENGINE_H

#include <rstate/runtime/computation_context.h>
#include <rstate/runtime/dependency_graph.h>
#include <rstate/runtime/engine_config.h>
#include <rstate/runtime/scheduler.h>
#include <rstate/types/computation.h>
#include <rstate/types/container.h>
#include <rstate/types/derived.h>
#include <rstate/types/disposer.h>
#include <rstate/types/plain_value.h>

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace rstate {

    struct ReactiveTrace;

    /**
     * @brief Owns every reactive container and computation and ties them together.
     *
     * The engine is the composition of the dependency graph, the computation context and the scheduler. The
     * handles (Record, Sequence, Derived, Disposer) are thin references that route every access through it.
     *
     * Everything is single threaded and synchronous: a write outside a batch runs the affected computations before
     * it returns, a write inside a batch runs them when the outermost batch closes. Errors thrown by a consumer
     * computation propagate to whoever caused the run (the registration call, the write, or the closing batch).
     */
    struct RSTATE_EXPORT ReactiveEngine {
        explicit ReactiveEngine(EngineConfig config = {});

        ~ReactiveEngine();

        ReactiveEngine(const ReactiveEngine &) = delete;

        ReactiveEngine &operator=(const ReactiveEngine &) = delete;

        [[nodiscard]] const EngineConfig &config() const { return _config; }

        // Containers

        /**
         * Wrap a plain record as a reactive record. Nested records and lists become nested containers owned by the
         * new record.
         */
        Record wrap(const PlainValue &record, std::string label = {});

        /**
         * Wrap a plain list as a reactive sequence.
         */
        Sequence wrap_sequence(const PlainValue &items, std::string label = {});

        /**
         * A single-cell record holding the value under the field "value".
         */
        Record ref(Value value, std::string label = {});

        /**
         * An untracked deep copy of the stored fields (computed fields are not included).
         */
        [[nodiscard]] PlainValue snapshot(const Record &record) const;

        [[nodiscard]] PlainValue snapshot(const Sequence &sequence) const;

        /**
         * Release the container, the containers created on its behalf from plain data, and every field entry of
         * them in the dependency graph. Computed fields of released records are disposed.
         */
        void release(const Record &record);

        void release(const Sequence &sequence);

        [[nodiscard]] bool is_alive(ContainerId id) const { return _containers.contains(id); }

        // Computations

        /**
         * Register an effect and run it once, immediately, to establish its dependencies. If that first run throws
         * the effect is disposed before the exception propagates.
         */
        Disposer run_tracked(effect_fn fn, std::string label = {});

        /**
         * Register a derived value, it does not run until it is first read.
         */
        Derived derive(reader_fn fn, std::string label = {});

        /**
         * Watch the value produced by the reader, calling on_change(new, old) whenever it changes.
         */
        Disposer observe(reader_fn reader, on_change_fn on_change, std::string label = {});

        Disposer observe(const Record &record, std::string field, on_change_fn on_change, std::string label = {});

        /**
         * Watch a derived value, the watcher is disposed together with the derived value.
         */
        Disposer observe(const Derived &derived, on_change_fn on_change, std::string label = {});

        /**
         * Run fn with every triggered computation deferred until the outermost batch closes. Batches nest.
         *
         * The batch is closed also when fn throws. A failure while flushing in that case is reported to stderr and
         * does not replace the exception from fn.
         */
        template<typename Fn>
        decltype(auto) run_batched(Fn &&fn) {
            _scheduler.enter_batch();
            if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
                invoke_in_batch(std::forward<Fn>(fn));
                _scheduler.exit_batch();
            } else {
                decltype(auto) result = invoke_in_batch(std::forward<Fn>(fn));
                _scheduler.exit_batch();
                return result;
            }
        }

        /**
         * Run fn without attributing its reads to the current computation.
         */
        template<typename Fn>
        decltype(auto) untracked(Fn &&fn) {
            ContextFrame frame{_context, ComputationId{}};
            return std::invoke(std::forward<Fn>(fn));
        }

        /**
         * Run anything still pending, for example the remainder of a flush that failed.
         */
        void flush() { _scheduler.flush(); }

        /**
         * Dispose a computation, see Disposer.
         */
        void dispose(ComputationId id);

        [[nodiscard]] bool is_active(ComputationId id) const;

        /**
         * Run fn with a collection to gather the disposers it creates, returns the collection.
         */
        DisposerCollection scope(const std::function<void(DisposerCollection &)> &fn);

        // Observers

        void add_life_cycle_observer(ReactiveLifeCycleObserver::ptr observer);

        void remove_life_cycle_observer(ReactiveLifeCycleObserver::ptr observer);

        // Components

        [[nodiscard]] DependencyGraph &dependency_graph() { return _graph; }

        [[nodiscard]] const DependencyGraph &dependency_graph() const { return _graph; }

        [[nodiscard]] Scheduler &scheduler() { return _scheduler; }

        [[nodiscard]] const Scheduler &scheduler() const { return _scheduler; }

        [[nodiscard]] ComputationContext &context() { return _context; }

        [[nodiscard]] const ComputationContext &context() const { return _context; }

        [[nodiscard]] size_t container_count() const { return _containers.size(); }

        [[nodiscard]] size_t computation_count() const { return _computations.size(); }

        [[nodiscard]] computation_s_ptr find_computation(ComputationId id) const { return _computations.find(id); }

        /**
         * The state of a live container, throws ReleasedContainerError otherwise.
         */
        [[nodiscard]] const ContainerState &container(ContainerId id) const;

        // Container access, used by the Record, Sequence and Derived handles

        Value read_field(ContainerId id, std::string_view field);

        void write_field(ContainerId id, std::string_view field, Value value);

        void write_plain_field(ContainerId id, std::string_view field, const PlainValue &value);

        bool has_field(ContainerId id, std::string_view field);

        bool remove_field(ContainerId id, std::string_view field);

        std::vector<std::string> field_names(ContainerId id);

        size_t field_count(ContainerId id);

        void notify_field(ContainerId id, std::string_view field);

        void notify_all_fields(ContainerId id);

        Derived add_computed_field(ContainerId id, std::string field, reader_fn fn);

        size_t sequence_size(ContainerId id);

        Value sequence_at(ContainerId id, size_t index);

        std::vector<Value> sequence_values(ContainerId id);

        void sequence_set(ContainerId id, size_t index, Value value);

        void sequence_insert(ContainerId id, size_t index, Value value);

        void sequence_insert_plain(ContainerId id, size_t index, const PlainValue &value);

        Value sequence_erase(ContainerId id, size_t index);

        void sequence_clear(ContainerId id);

        void set_container_label(ContainerId id, std::string label);

        [[nodiscard]] std::string container_label(ContainerId id) const;

        /**
         * Read a derived value: track it, recompute it if dirty, return the cached value.
         */
        Value read_derived(const derived_s_ptr &derived);

        // Scheduler call-backs

        void run_scheduled(ComputationId id);

        void notify_before_flush(size_t pending);

        void notify_after_flush();

    private:
        template<typename Fn>
        decltype(auto) invoke_in_batch(Fn &&fn) {
            try {
                return std::invoke(std::forward<Fn>(fn));
            } catch (...) {
                abandon_batch();
                throw;
            }
        }

        void abandon_batch();

        template<typename T, typename... Args>
        std::shared_ptr<T> create_computation(std::string label, Args &&...args);

        Disposer start_eager(const computation_s_ptr &computation);

        void run_computation(const computation_s_ptr &computation);

        void clear_subscriptions(Computation &computation);

        void track(const FieldKey &key);

        /**
         * Trigger the keys of one write as a batch, so a computation reached along several paths runs once.
         */
        void trigger_all(const std::vector<FieldKey> &keys);

        ContainerState &live_container(ContainerId id) const;

        ContainerState &live_record(ContainerId id) const;

        ContainerState &live_sequence(ContainerId id) const;

        ContainerId create_container(ContainerKind kind, std::string label);

        /**
         * Scalars convert directly, records and lists become new containers adopted by the owner.
         */
        Value convert_plain(ContainerId owner, const PlainValue &value);

        void populate(ContainerId id, const PlainValue &value);

        void release_container(ContainerId id);

        /**
         * Release the containers among the values that the owner adopted and no longer holds.
         */
        void release_dropped(ContainerId owner, const std::vector<Value> &dropped);

        void check_writable(const ContainerState &state, std::string_view field) const;

        PlainValue snapshot_container(ContainerId id, std::vector<ContainerId> &visiting) const;

        PlainValue snapshot_value(const Value &value, std::vector<ContainerId> &visiting) const;

        void notify_field_write(const ContainerState &container, std::string_view field, const Value &old_value,
                                const Value &new_value);

        EngineConfig _config;
        computation_arena_type _computations{};
        SlotArena<ContainerState, ContainerTag> _containers{};
        DependencyGraph _graph;
        ComputationContext _context{};
        Scheduler _scheduler;
        std::vector<ReactiveLifeCycleObserver::ptr> _observers{};
        std::unique_ptr<ReactiveTrace> _trace{};
    };

} // namespace rstate

#endif  // RSTATE_REACTIVE_ENGINE_H
