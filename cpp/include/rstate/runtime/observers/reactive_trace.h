#pragma once

#include <rstate/runtime/observers/reactive_observer.h>

#include <optional>
#include <string>

namespace rstate {

    /**
     * @brief Logs out the different steps as the engine creates containers, runs computations and applies writes.
     *
     * This is voluminous but can be helpful tracing down unexpected re-runs (or missing ones).
     */
    struct RSTATE_EXPORT ReactiveTrace : ReactiveLifeCycleObserver {
        /**
         * @param filter Used to restrict which container and computation events to report (substring match)
         * @param containers Log container creation and release
         * @param computations Log computation runs, errors and disposal
         * @param writes Log field writes
         * @param flushes Log flush generations
         * @param to_stderr Write to stderr, otherwise stdout
         */
        explicit ReactiveTrace(const std::optional<std::string> &filter = std::nullopt, bool containers = true,
                               bool computations = true, bool writes = true, bool flushes = true,
                               bool to_stderr = true);

        void on_container_created(const ContainerState &container) override;
        void on_container_released(const ContainerState &container) override;
        void on_before_computation(const Computation &computation) override;
        void on_after_computation(const Computation &computation) override;
        void on_field_write(const ContainerState &container, std::string_view field, const Value &old_value,
                            const Value &new_value) override;
        void on_computation_disposed(const Computation &computation) override;
        void on_before_flush(size_t pending) override;
        void on_after_flush() override;
        void on_computation_error(const Computation &computation, std::exception_ptr error) override;

        /**
         * The number of lines written so far, also the sequence number printed with each line.
         */
        [[nodiscard]] size_t line_count() const { return _sequence; }

    private:
        void _print(const std::string &msg);
        [[nodiscard]] bool _should_log(const std::string &name) const;

        std::optional<std::string> _filter;
        bool _containers;
        bool _computations;
        bool _writes;
        bool _flushes;
        bool _to_stderr;
        size_t _sequence{0};
    };

} // namespace rstate
