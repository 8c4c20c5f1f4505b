#ifndef RSTATE_FORWARD_DECLARATIONS_H
#define RSTATE_FORWARD_DECLARATIONS_H

#include <functional>
#include <memory>
#include <string>

#include <rstate/util/slot_arena.h>

namespace rstate {
    // Engine - owns every container and computation, handles hold a raw pointer back to it
    struct ReactiveEngine;
    using engine_ptr = ReactiveEngine *;

    // Containers - arena owned, addressed by ContainerId
    struct ContainerTag;
    using ContainerId = SlotId<ContainerTag>;
    using ContainerIdHash = SlotIdHash<ContainerTag>;

    struct ContainerState;
    using container_s_ptr = std::shared_ptr<ContainerState>;

    // Computations - arena owned (shared_ptr so a running computation survives its own disposal)
    struct ComputationTag;
    using ComputationId = SlotId<ComputationTag>;
    using ComputationIdHash = SlotIdHash<ComputationTag>;

    struct Computation;
    using computation_ptr = Computation *;
    using computation_s_ptr = std::shared_ptr<Computation>;

    struct EffectComputation;
    struct WatchComputation;

    struct DerivedComputation;
    using derived_s_ptr = std::shared_ptr<DerivedComputation>;

    // Values
    class Value;
    class PlainValue;

    // Handles
    class Record;
    class Sequence;
    class Derived;
    struct Disposer;
    struct DisposerCollection;

    // Runtime
    struct FieldKey;
    struct DependencyGraph;
    struct ComputationContext;
    struct Scheduler;
    struct EngineConfig;
    struct ReactiveLifeCycleObserver;

    using effect_fn = std::function<void()>;
    using reader_fn = std::function<Value()>;
    using on_change_fn = std::function<void(const Value &new_value, const Value &old_value)>;
} // namespace rstate

#endif  // RSTATE_FORWARD_DECLARATIONS_H
