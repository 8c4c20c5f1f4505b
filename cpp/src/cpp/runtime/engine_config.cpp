#include <rstate/runtime/engine_config.h>

#include <cstdlib>

namespace rstate {

    EngineConfig EngineConfig::from_environment() {
        EngineConfig config;
        config.trace = std::getenv("RSTATE_TRACE") != nullptr;
        if (const char *filter = std::getenv("RSTATE_TRACE_FILTER"); filter != nullptr && *filter != '\0') {
            config.trace_filter = std::string{filter};
        }
        config.trace_to_stderr = std::getenv("RSTATE_TRACE_STDOUT") == nullptr;
        return config;
    }

} // namespace rstate
