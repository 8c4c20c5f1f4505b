#include <rstate/runtime/observers/reactive_trace.h>
#include <rstate/types/computation.h>
#include <rstate/types/container.h>

#include <iostream>

namespace rstate {

    ReactiveTrace::ReactiveTrace(const std::optional<std::string> &filter, bool containers, bool computations,
                                 bool writes, bool flushes, bool to_stderr)
        : _filter(filter), _containers(containers), _computations(computations), _writes(writes), _flushes(flushes),
          _to_stderr(to_stderr) {}

    void ReactiveTrace::_print(const std::string &msg) {
        std::string formatted = fmt::format("[{}] {}", ++_sequence, msg);
        if (_to_stderr) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    bool ReactiveTrace::_should_log(const std::string &name) const {
        if (!_filter.has_value()) { return true; }
        return name.find(_filter.value()) != std::string::npos;
    }

    void ReactiveTrace::on_container_created(const ContainerState &container) {
        auto name = container.display_name();
        if (!_containers || !_should_log(name)) { return; }
        _print(fmt::format("[{}] Created", name));
    }

    void ReactiveTrace::on_container_released(const ContainerState &container) {
        auto name = container.display_name();
        if (!_containers || !_should_log(name)) { return; }
        _print(fmt::format("[{}] Released", name));
    }

    void ReactiveTrace::on_before_computation(const Computation &computation) {
        auto name = computation.display_name();
        if (!_computations || !_should_log(name)) { return; }
        _print(fmt::format("[{}:{}] Run {} ...", to_string(computation.kind()), name, computation.run_count() + 1));
    }

    void ReactiveTrace::on_after_computation(const Computation &computation) {
        auto name = computation.display_name();
        if (!_computations || !_should_log(name)) { return; }
        _print(fmt::format("[{}:{}] Completed, {} subscription(s)", to_string(computation.kind()), name,
                           computation.subscriptions().size()));
    }

    void ReactiveTrace::on_field_write(const ContainerState &container, std::string_view field,
                                       const Value &old_value, const Value &new_value) {
        auto name = container.display_name();
        if (!_writes || !_should_log(name)) { return; }
        _print(fmt::format("[{}.{}] {} -> {}", name, field, old_value, new_value));
    }

    void ReactiveTrace::on_computation_disposed(const Computation &computation) {
        auto name = computation.display_name();
        if (!_computations || !_should_log(name)) { return; }
        _print(fmt::format("[{}:{}] Disposed", to_string(computation.kind()), name));
    }

    void ReactiveTrace::on_before_flush(size_t pending) {
        if (!_flushes) { return; }
        _print(fmt::format("Flush generation with {} pending", pending));
    }

    void ReactiveTrace::on_after_flush() {
        if (!_flushes) { return; }
        _print("Flush generation done");
    }

    void ReactiveTrace::on_computation_error(const Computation &computation, std::exception_ptr error) {
        auto name = computation.display_name();
        if (!_computations || !_should_log(name)) { return; }
        std::string what{"unknown exception"};
        try {
            std::rethrow_exception(error);
        } catch (const std::exception &e) {
            what = e.what();
        } catch (...) {
            // Not a std::exception, reported as unknown
        }
        _print(fmt::format("[{}:{}] Failed: {}", to_string(computation.kind()), name, what));
    }

} // namespace rstate
