//
// Hooks into the life-cycle of a pass.
//

#ifndef RECACHE_PASS_OBSERVER_H
#define RECACHE_PASS_OBSERVER_H

#include <recache/runtime/pass_statistics.h>
#include <recache/types/call_key.h>

#include <string_view>

namespace recache {

    struct GroupEvent {
        GroupId group{NO_GROUP};
        CallTag tag{};
        CallKey key{};
        std::size_t depth{0};
        generation_t generation{NO_GENERATION};
    };

    /**
     * Observer of passes run by a Cache. All hooks default to no-ops, override the ones of interest.
     * Hooks are called on the thread running the pass.
     */
    struct RECACHE_EXPORT PassLifeCycleObserver {
        virtual ~PassLifeCycleObserver() = default;

        virtual void on_before_pass(const Cache &cache, generation_t generation) {}

        virtual void on_after_pass(const Cache &cache, const PassStatistics &statistics) {}

        // The pass threw, everything it did was rolled back
        virtual void on_pass_abandoned(const Cache &cache, generation_t generation, std::string_view reason) {}

        virtual void on_group_evaluated(const GroupEvent &event) {}

        virtual void on_group_traversed(const GroupEvent &event) {}

        virtual void on_group_skipped(const GroupEvent &event) {}

        virtual void on_group_torn_down(const GroupEvent &event) {}

        // A queued write or invalidation whose target was torn down
        virtual void on_mutation_dropped(std::string_view description) {}

        virtual void on_teardown_failure(GroupId group, std::string_view what) {}
    };

} // namespace recache

#endif //RECACHE_PASS_OBSERVER_H
