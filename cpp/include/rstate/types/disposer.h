#pragma once

#include <rstate/rstate_base.h>

#include <vector>

namespace rstate {

    /**
     * @brief Permanently unregisters a computation.
     *
     * Every registration returns one. Disposing removes the computation from every field entry it subscribes to,
     * drops any pending run, and refuses any further scheduling. Disposal is idempotent, and copies of a Disposer
     * all refer to the same computation.
     *
     * Disposing a computation from inside its own run is allowed, the run completes and nothing runs after it.
     */
    struct RSTATE_EXPORT Disposer {
        Disposer() = default;

        Disposer(engine_ptr engine, ComputationId id) : _engine{engine}, _id{id} {}

        void dispose() const;

        void operator()() const { dispose(); }

        /**
         * True until the computation has been disposed.
         */
        [[nodiscard]] bool is_active() const;

        [[nodiscard]] ComputationId id() const { return _id; }

        explicit operator bool() const { return _engine != nullptr && _id.valid(); }

    private:
        engine_ptr _engine{nullptr};
        ComputationId _id{};
    };

    /**
     * @brief Gathers disposers so they can be disposed together.
     *
     * Once the collection is disposed, anything added to it is disposed immediately.
     */
    struct RSTATE_EXPORT DisposerCollection {
        DisposerCollection &add(Disposer disposer);

        DisposerCollection &operator+=(Disposer disposer) { return add(disposer); }

        void dispose();

        [[nodiscard]] size_t size() const { return _disposers.size(); }

        [[nodiscard]] bool is_disposed() const { return _disposed; }

    private:
        std::vector<Disposer> _disposers{};
        bool _disposed{false};
    };

} // namespace rstate
