#include <rstate/runtime/computation_context.h>

#include <algorithm>

namespace rstate {

    void ComputationContext::push(ComputationId id) { _stack.push_back(id); }

    void ComputationContext::pop() {
        if (_stack.empty()) { throw_error<std::logic_error>("Computation context popped with no frame pushed"); }
        _stack.pop_back();
    }

    std::optional<ComputationId> ComputationContext::current() const {
        if (_stack.empty() || !_stack.back().valid()) { return std::nullopt; }
        return _stack.back();
    }

    bool ComputationContext::contains(ComputationId id) const {
        return std::find(_stack.begin(), _stack.end(), id) != _stack.end();
    }

} // namespace rstate
