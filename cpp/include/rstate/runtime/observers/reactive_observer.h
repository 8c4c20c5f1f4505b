#ifndef RSTATE_REACTIVE_OBSERVER_H
#define RSTATE_REACTIVE_OBSERVER_H

#include <rstate/rstate_base.h>

#include <exception>
#include <string_view>

namespace rstate {

    // ReactiveLifeCycleObserver - externally managed observer, the engine holds a non-owning pointer
    struct ReactiveLifeCycleObserver {
        using ptr = ReactiveLifeCycleObserver *;

        virtual ~ReactiveLifeCycleObserver() = default;

        virtual void on_container_created(const ContainerState &) {
        };

        virtual void on_container_released(const ContainerState &) {
        };

        virtual void on_before_computation(const Computation &) {
        };

        virtual void on_after_computation(const Computation &) {
        };

        /**
         * A value-changing write. Structural writes to a sequence report the shape field with the old and new
         * sizes.
         */
        virtual void on_field_write(const ContainerState &, std::string_view, const Value &, const Value &) {
        };

        virtual void on_computation_disposed(const Computation &) {
        };

        virtual void on_before_flush(size_t) {
        };

        virtual void on_after_flush() {
        };

        /**
         * Called before an exception thrown by a computation leaves the engine.
         */
        virtual void on_computation_error(const Computation &, std::exception_ptr) {
        };
    };

} // namespace rstate

#endif  // RSTATE_REACTIVE_OBSERVER_H
