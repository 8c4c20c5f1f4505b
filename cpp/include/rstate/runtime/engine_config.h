#ifndef RSTATE_ENGINE_CONFIG_H
#define RSTATE_ENGINE_CONFIG_H

#include <rstate/runtime/observers/reactive_observer.h>

#include <optional>
#include <string>
#include <vector>

namespace rstate {

    /**
     * @brief Construction-time settings of a ReactiveEngine.
     */
    struct RSTATE_EXPORT EngineConfig {
        /**
         * Observers attached on construction, they must outlive the engine (or be removed first).
         */
        std::vector<ReactiveLifeCycleObserver::ptr> observers{};

        /**
         * Attach a ReactiveTrace owned by the engine.
         */
        bool trace{false};

        /**
         * Substring filter applied by the trace to container and computation names.
         */
        std::optional<std::string> trace_filter{};

        /**
         * Trace to stderr (default) or stdout.
         */
        bool trace_to_stderr{true};

        /**
         * Settings from the environment:
         *
         * * RSTATE_TRACE - any value enables the trace
         * * RSTATE_TRACE_FILTER - the trace filter
         * * RSTATE_TRACE_STDOUT - any value sends the trace to stdout
         */
        static EngineConfig from_environment();
    };

} // namespace rstate

#endif  // RSTATE_ENGINE_CONFIG_H
