#pragma once

/**
 * @file subscriber_list.h
 * @brief SubscriberList - the computations subscribed to one field entry.
 *
 * SubscriberList is the atomic unit of the dependency graph. Each (container, field) read by at least one
 * computation has its own list, so a write notifies only the computations that read that exact field.
 */

#include <rstate/rstate_base.h>

#include <vector>

namespace rstate {

/**
 * @brief Ordered set of subscriber ids.
 *
 * Key characteristics:
 * - Holds ComputationIds (non-owning, resolved through the engine's computation arena)
 * - Subscribing the same computation twice stores it once
 * - Iteration follows subscription order, which keeps notification order deterministic
 * - Safe to snapshot and mutate while a snapshot is being notified
 */
class RSTATE_EXPORT SubscriberList {
public:
    using id_set = ankerl::unordered_dense::set<ComputationId, ComputationIdHash>;

    /**
     * @brief Add a subscriber.
     * @return true if the subscriber was not already present
     */
    bool subscribe(ComputationId id);

    /**
     * @brief Remove a subscriber, no-op if absent.
     * @return true if the subscriber was present
     */
    bool unsubscribe(ComputationId id);

    [[nodiscard]] bool contains(ComputationId id) const { return _members.contains(id); }

    [[nodiscard]] bool empty() const { return _order.empty(); }

    [[nodiscard]] size_t size() const { return _order.size(); }

    /**
     * @brief The subscribers in subscription order.
     */
    [[nodiscard]] const std::vector<ComputationId> &subscribers() const { return _order; }

    /**
     * @brief A copy of the subscribers, to iterate while notifications modify the list.
     */
    [[nodiscard]] std::vector<ComputationId> snapshot() const { return _order; }

    void clear();

private:
    std::vector<ComputationId> _order{};
    id_set _members{};
};

} // namespace rstate
