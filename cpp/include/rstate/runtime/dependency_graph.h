#ifndef RSTATE_DEPENDENCY_GRAPH_H
#define RSTATE_DEPENDENCY_GRAPH_H

#include <rstate/types/field_key.h>
#include <rstate/types/subscriber_list.h>

#include <vector>

namespace rstate {

    using computation_arena_type = SlotArena<Computation, ComputationTag>;

    /**
     * @brief Registry of (container, field) -> subscribed computations.
     *
     * The graph holds ids only. Triggering a field resolves each id through the computation arena and notifies the
     * computation, ids of computations that have since been disposed no longer resolve and are skipped.
     *
     * An entry is created on the first tracked read of a field and removed once its last subscriber leaves or its
     * source is released, so the graph never grows beyond the dependencies that are currently live.
     */
    struct RSTATE_EXPORT DependencyGraph {
        explicit DependencyGraph(const computation_arena_type &computations);

        /**
         * Subscribe the computation to the field.
         * @return true if this is a new subscription
         */
        bool track(const FieldKey &key, ComputationId computation);

        /**
         * Remove one subscription, dropping the entry once it is empty.
         */
        void untrack(const FieldKey &key, ComputationId computation);

        /**
         * Notify every subscriber of the field, in subscription order.
         *
         * The subscriber list is copied before the first notification: computations that run as a result rebuild
         * their subscriptions, and those changes only affect the next trigger.
         */
        void trigger(const FieldKey &key) const;

        /**
         * Drop every entry belonging to the container.
         */
        void release(ContainerId container);

        /**
         * Drop the value entry of a derived value.
         */
        void release(ComputationId derived);

        [[nodiscard]] bool has_entry(const FieldKey &key) const { return _entries.contains(key); }

        [[nodiscard]] std::vector<ComputationId> subscribers(const FieldKey &key) const;

        [[nodiscard]] size_t subscriber_count(const FieldKey &key) const;

        [[nodiscard]] size_t entry_count() const { return _entries.size(); }

    private:
        const computation_arena_type &_computations;
        ankerl::unordered_dense::map<FieldKey, SubscriberList, FieldKeyHash> _entries{};
    };

} // namespace rstate

#endif  // RSTATE_DEPENDENCY_GRAPH_H
