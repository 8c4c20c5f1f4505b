#pragma once

#include <rstate/types/disposer.h>
#include <rstate/types/value.h>

#include <string>

namespace rstate {

    /**
     * @brief Handle to a derived value.
     *
     * get() behaves like a field read: inside a computation it makes the computation depend on the derived value,
     * and it recomputes the value first if one of the derived value's own dependencies changed since the last read.
     *
     * The handle keeps the derived computation alive, a disposed derived value keeps answering with its last
     * cached value but no longer tracks or recomputes.
     */
    class RSTATE_EXPORT Derived {
    public:
        Derived() = default;

        Derived(engine_ptr engine, derived_s_ptr computation);

        [[nodiscard]] Value get() const;

        [[nodiscard]] bool is_dirty() const;

        [[nodiscard]] bool is_active() const;

        [[nodiscard]] ComputationId id() const;

        [[nodiscard]] Disposer disposer() const;

        /**
         * Disposes the derived value and every observer chained onto it.
         */
        void dispose() const;

        /**
         * Chain an observer onto this derived value, it is disposed together with the derived value.
         */
        Disposer observe(on_change_fn on_change, std::string label = {}) const;

        [[nodiscard]] const derived_s_ptr &computation() const { return _computation; }

        bool operator==(const Derived &other) const { return _computation == other._computation; }

    private:
        engine_ptr _engine{nullptr};
        derived_s_ptr _computation{};
    };

} // namespace rstate
