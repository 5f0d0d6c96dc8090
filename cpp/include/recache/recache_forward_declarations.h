//
// Forward declarations and the small id types shared by every recache header.
//

#ifndef RECACHE_FORWARD_DECLARATIONS_H
#define RECACHE_FORWARD_DECLARATIONS_H

#include <cstdint>
#include <memory>

namespace recache {
    // Generation - number of completed passes; a pass in progress stamps with generation() + 1
    using generation_t = std::uint64_t;
    constexpr generation_t NO_GENERATION = 0;

    // GroupId - stable id of a group record, survives reordering of the slot table
    using GroupId = std::uint64_t;
    constexpr GroupId NO_GROUP = 0;

    // CellId - stable id of a state cell
    using CellId = std::uint64_t;
    constexpr CellId NO_CELL = 0;

    struct CallSiteId;
    struct CallTag;

    class SlotTable;
    class SlotWriter;

    // InvalidationTracker - owned by the Cache, raw pointer only
    class InvalidationTracker;
    using invalidation_tracker_ptr = InvalidationTracker*;

    // PendingMutationQueue - shared between the Cache and the handles it hands out
    class PendingMutationQueue;
    using pending_mutation_queue_ptr = PendingMutationQueue*;
    using pending_mutation_queue_s_ptr = std::shared_ptr<PendingMutationQueue>;
    using pending_mutation_queue_w_ptr = std::weak_ptr<PendingMutationQueue>;

    // PassState - liveness marker of one pass, observed weakly by state handles
    struct PassState;
    using pass_state_s_ptr = std::shared_ptr<PassState>;
    using pass_state_w_ptr = std::weak_ptr<PassState>;

    class CacheContext;
    using cache_context_ptr = CacheContext*;

    class Cache;
    using cache_ptr = Cache*;

    // PassLifeCycleObserver - externally managed observer
    struct PassLifeCycleObserver;
    using pass_observer_ptr = PassLifeCycleObserver*;
    using pass_observer_s_ptr = std::shared_ptr<PassLifeCycleObserver>;

    template<typename T>
    class StateHandle;

    template<typename T>
    class StateSetter;

    class InvalidationToken;
} // namespace recache

#endif //RECACHE_FORWARD_DECLARATIONS_H
