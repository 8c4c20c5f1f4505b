#ifndef RSTATE_SCHEDULER_H
#define RSTATE_SCHEDULER_H

#include <rstate/rstate_base.h>

#include <vector>

namespace rstate {

    /**
     * @brief Decides when a triggered computation runs.
     *
     * Outside a batch a scheduled computation runs immediately. Inside a batch (counter > 0) it is added to the
     * pending set instead, once, however often it is scheduled. When the counter returns to zero the pending set
     * is flushed.
     *
     * A flush runs generation by generation: the pending set is swapped out before any of it runs, and anything
     * scheduled while the generation runs is queued for the next generation. A computation that keeps writing to
     * its own dependencies therefore makes progress one generation at a time rather than recursing on the stack.
     */
    struct RSTATE_EXPORT Scheduler {
        explicit Scheduler(ReactiveEngine &engine);

        void schedule(ComputationId id);

        void enter_batch();

        /**
         * Leave a batch, flushing the pending set when the outermost batch closes.
         * The counter is decremented before the flush, a failing flush leaves the scheduler out of the batch.
         */
        void exit_batch();

        /**
         * Run everything pending until nothing is left. If a computation throws, the exception propagates and the
         * unrun remainder of its generation stays pending for the next flush.
         */
        void flush();

        /**
         * Remove a computation from the pending set (used on disposal).
         */
        void drop(ComputationId id);

        [[nodiscard]] size_t batch_depth() const { return _depth; }

        [[nodiscard]] bool is_batching() const { return _depth > 0; }

        [[nodiscard]] bool is_flushing() const { return _flushing; }

        [[nodiscard]] bool is_pending(ComputationId id) const { return _pending_set.contains(id); }

        [[nodiscard]] size_t pending_count() const { return _pending.size(); }

        /**
         * The number of generations run by flushes so far.
         */
        [[nodiscard]] size_t generation_count() const { return _generations; }

    private:
        void enqueue(ComputationId id);

        void run_generation();

        ReactiveEngine &_engine;
        size_t _depth{0};
        size_t _generations{0};
        bool _flushing{false};
        std::vector<ComputationId> _pending{};
        ankerl::unordered_dense::set<ComputationId, ComputationIdHash> _pending_set{};
    };

} // namespace rstate

#endif  // RSTATE_SCHEDULER_H
