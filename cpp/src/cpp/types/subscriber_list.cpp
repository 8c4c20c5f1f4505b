#include <rstate/types/subscriber_list.h>

#include <algorithm>

namespace rstate {

    bool SubscriberList::subscribe(ComputationId id) {
        if (!id.valid()) { return false; }
        auto [it, inserted] = _members.insert(id);
        if (inserted) { _order.push_back(id); }
        return inserted;
    }

    bool SubscriberList::unsubscribe(ComputationId id) {
        if (_members.erase(id) == 0) { return false; }
        auto it = std::find(_order.begin(), _order.end(), id);
        if (it != _order.end()) { _order.erase(it); }
        return true;
    }

    void SubscriberList::clear() {
        _order.clear();
        _members.clear();
    }

} // namespace rstate
