#include <rstate/runtime/reactive_engine.h>
#include <rstate/runtime/scheduler.h>

#include <algorithm>

namespace rstate {

    namespace {
        struct FlushGuard {
            explicit FlushGuard(bool &flushing) : _flushing{flushing} { _flushing = true; }
            ~FlushGuard() { _flushing = false; }

        private:
            bool &_flushing;
        };
    } // namespace

    Scheduler::Scheduler(ReactiveEngine &engine) : _engine{engine} {}

    void Scheduler::schedule(ComputationId id) {
        // While a flush is running, anything newly scheduled belongs to the next generation
        if (_depth > 0 || _flushing) {
            enqueue(id);
            return;
        }
        _engine.run_scheduled(id);
    }

    void Scheduler::enter_batch() { ++_depth; }

    void Scheduler::exit_batch() {
        if (_depth == 0) { throw_error<std::logic_error>("exit_batch called without a matching enter_batch"); }
        if (--_depth == 0) { flush(); }
    }

    void Scheduler::flush() {
        // A flush requested from inside a flush (a batch closing in a computation) is picked up by the outer loop
        if (_flushing || _depth > 0) { return; }
        FlushGuard guard{_flushing};
        while (!_pending.empty()) { run_generation(); }
    }

    void Scheduler::drop(ComputationId id) {
        if (_pending_set.erase(id) == 0) { return; }
        auto it = std::find(_pending.begin(), _pending.end(), id);
        if (it != _pending.end()) { _pending.erase(it); }
    }

    void Scheduler::enqueue(ComputationId id) {
        if (_pending_set.insert(id).second) { _pending.push_back(id); }
    }

    void Scheduler::run_generation() {
        std::vector<ComputationId> generation;
        generation.swap(_pending);
        _pending_set.clear();
        ++_generations;

        _engine.notify_before_flush(generation.size());
        for (size_t i = 0; i < generation.size(); ++i) {
            try {
                _engine.run_scheduled(generation[i]);
            } catch (...) {
                // The remainder of this generation goes back to the front of the queue, ahead of anything the
                // generation scheduled before it failed.
                std::vector<ComputationId> next;
                next.swap(_pending);
                _pending_set.clear();
                for (size_t j = i + 1; j < generation.size(); ++j) { enqueue(generation[j]); }
                for (auto id: next) { enqueue(id); }
                throw;
            }
        }
        _engine.notify_after_flush();
    }

} // namespace rstate
