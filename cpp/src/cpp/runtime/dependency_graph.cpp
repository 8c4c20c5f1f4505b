#include <rstate/runtime/dependency_graph.h>
#include <rstate/types/computation.h>

namespace rstate {

    DependencyGraph::DependencyGraph(const computation_arena_type &computations) : _computations{computations} {}

    bool DependencyGraph::track(const FieldKey &key, ComputationId computation) {
        return _entries[key].subscribe(computation);
    }

    void DependencyGraph::untrack(const FieldKey &key, ComputationId computation) {
        auto it = _entries.find(key);
        if (it == _entries.end()) { return; }
        it->second.unsubscribe(computation);
        if (it->second.empty()) { _entries.erase(it); }
    }

    void DependencyGraph::trigger(const FieldKey &key) const {
        auto it = _entries.find(key);
        if (it == _entries.end()) { return; }
        for (auto id: it->second.snapshot()) {
            // Hold a reference, the notification may dispose the computation
            if (auto computation = _computations.find(id); computation && !computation->is_disposed()) {
                computation->notify();
            }
        }
    }

    void DependencyGraph::release(ContainerId container) {
        std::vector<FieldKey> released;
        for (const auto &[key, _]: _entries) {
            if (key.belongs_to(container)) { released.push_back(key); }
        }
        for (const auto &key: released) { _entries.erase(key); }
    }

    void DependencyGraph::release(ComputationId derived) { _entries.erase(FieldKey::derived(derived)); }

    std::vector<ComputationId> DependencyGraph::subscribers(const FieldKey &key) const {
        auto it = _entries.find(key);
        if (it == _entries.end()) { return {}; }
        return it->second.snapshot();
    }

    size_t DependencyGraph::subscriber_count(const FieldKey &key) const {
        auto it = _entries.find(key);
        return it == _entries.end() ? 0 : it->second.size();
    }

} // namespace rstate
