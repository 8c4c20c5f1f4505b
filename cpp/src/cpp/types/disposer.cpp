#include <rstate/runtime/reactive_engine.h>
#include <rstate/types/disposer.h>

namespace rstate {

    void Disposer::dispose() const {
        if (_engine != nullptr) { _engine->dispose(_id); }
    }

    bool Disposer::is_active() const { return _engine != nullptr && _engine->is_active(_id); }

    DisposerCollection &DisposerCollection::add(Disposer disposer) {
        if (_disposed) {
            disposer.dispose();
            return *this;
        }
        _disposers.push_back(disposer);
        return *this;
    }

    void DisposerCollection::dispose() {
        if (_disposed) { return; }
        _disposed = true;
        // Most recently added first
        for (auto it = _disposers.rbegin(); it != _disposers.rend(); ++it) { it->dispose(); }
        _disposers.clear();
    }

} // namespace rstate
