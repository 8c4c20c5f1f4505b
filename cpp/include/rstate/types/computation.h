#pragma once

#include <rstate/types/field_key.h>
#include <rstate/types/notifiable.h>
#include <rstate/types/value.h>

#include <string>
#include <string_view>
#include <vector>

namespace rstate {

    enum class ComputationKind : uint8_t { EFFECT = 0, DERIVED = 1, WATCH = 2 };

    [[nodiscard]] RSTATE_EXPORT std::string_view to_string(ComputationKind kind);

    /**
     * @brief A registered callback plus the field entries it currently subscribes to.
     *
     * The subscription set is exactly the set of fields read during the most recent run: the engine drops every
     * subscription before a run starts and records the reads of the run as it goes. This is what lets a
     * computation with conditional reads stop depending on a field once it stops reading it.
     *
     * The engine drives the life-cycle (running, re-run requests, disposal), the concrete computation only
     * supplies what a run does (do_execute) and what a change notification means (notify).
     */
    struct RSTATE_EXPORT Computation : Notifiable {
        Computation(ReactiveEngine &engine, ComputationId id, std::string label);

        [[nodiscard]] virtual ComputationKind kind() const = 0;

        [[nodiscard]] ComputationId id() const { return _id; }

        [[nodiscard]] const std::string &label() const { return _label; }

        /**
         * The label, or effect#N / derived#N / watch#N when unlabelled.
         */
        [[nodiscard]] std::string display_name() const;

        [[nodiscard]] bool is_disposed() const { return _disposed; }

        [[nodiscard]] bool is_running() const { return _running; }

        /**
         * The number of completed runs.
         */
        [[nodiscard]] size_t run_count() const { return _run_count; }

        [[nodiscard]] const std::vector<FieldKey> &subscriptions() const { return _subscriptions; }

    protected:
        friend struct ReactiveEngine;

        virtual void do_execute() = 0;

        [[nodiscard]] ReactiveEngine &engine() const { return _engine; }

    private:
        ReactiveEngine &_engine;
        ComputationId _id;
        std::string _label;
        std::vector<FieldKey> _subscriptions{};
        // Watchers chained onto this computation, disposed with it
        std::vector<ComputationId> _chained{};
        size_t _run_count{0};
        bool _disposed{false};
        bool _running{false};
        bool _rerun_requested{false};
    };

    /**
     * @brief Eager computation: runs on registration and again on every relevant change.
     */
    struct RSTATE_EXPORT EffectComputation : Computation {
        EffectComputation(ReactiveEngine &engine, ComputationId id, std::string label, effect_fn fn);

        [[nodiscard]] ComputationKind kind() const override { return ComputationKind::EFFECT; }

        void notify() override;

    protected:
        void do_execute() override;

    private:
        effect_fn _fn;
    };

    /**
     * @brief Lazy computation with a cached result.
     *
     * A change notification only marks the value dirty and, on the transition from clean to dirty, forwards the
     * notification to the computations that read this derived value. The function runs again on the next read.
     * Forwarding only on that transition is what limits every link of a chain of derived values to a single
     * recomputation per flush, however many upstream writes there were. After a failed run the value is dirty
     * but its readers saw the failure rather than a value, so every later notification is forwarded until a run
     * succeeds.
     */
    struct RSTATE_EXPORT DerivedComputation : Computation {
        DerivedComputation(ReactiveEngine &engine, ComputationId id, std::string label, reader_fn fn);

        [[nodiscard]] ComputationKind kind() const override { return ComputationKind::DERIVED; }

        void notify() override;

        [[nodiscard]] bool is_dirty() const { return _dirty; }

        [[nodiscard]] const Value &cached_value() const { return _cached; }

        /**
         * The field entry readers of this derived value subscribe to.
         */
        [[nodiscard]] FieldKey source_key() const { return FieldKey::derived(id()); }

    protected:
        void do_execute() override;

    private:
        reader_fn _fn;
        Value _cached{};
        bool _dirty{true};
        bool _failed{false};
    };

    /**
     * @brief Eager computation reporting transitions of a tracked expression.
     *
     * The first run only records the value. Later runs call the change callback with (new, old) when the value
     * differs from the recorded one, then record the new value. The callback runs untracked, reads it makes do not
     * become dependencies of the watcher.
     */
    struct RSTATE_EXPORT WatchComputation : Computation {
        WatchComputation(ReactiveEngine &engine, ComputationId id, std::string label, reader_fn reader,
                         on_change_fn on_change);

        [[nodiscard]] ComputationKind kind() const override { return ComputationKind::WATCH; }

        void notify() override;

        [[nodiscard]] const Value &previous_value() const { return _previous; }

    protected:
        void do_execute() override;

    private:
        reader_fn _reader;
        on_change_fn _on_change;
        Value _previous{};
        bool _initialised{false};
    };

} // namespace rstate
