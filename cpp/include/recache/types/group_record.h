//
// Tracker-side records of groups and state cells.
//

#ifndef RECACHE_GROUP_RECORD_H
#define RECACHE_GROUP_RECORD_H

#include <recache/types/call_key.h>
#include <recache/types/value/type_meta.h>

#include <ankerl/unordered_dense.h>

#include <functional>
#include <string_view>
#include <vector>

namespace recache {

    /**
     * Fresh -> Evaluating   first visit
     * Evaluating -> Cached  body completed, generation stamped
     * Cached -> Stale       dependency write or token fired after the stamp
     * Stale -> Evaluating   next pass reaches the group
     */
    enum class GroupState : std::uint8_t { Fresh, Stale, Evaluating, Cached };

    RECACHE_EXPORT std::string_view to_string(GroupState state);

    struct GroupRecord {
        GroupId parent{NO_GROUP};
        CallTag tag{};
        CallKey key{};
        // Number of groups above this one, 0 for the root
        std::size_t depth{0};
        GroupState state{GroupState::Fresh};
        // Set by a token or a write to a cell read by the group; forces the whole subtree to evaluate
        bool dirty{false};
        // Some group below this one is dirty; the body runs as a traversal
        bool descendant_dirty{false};
        generation_t evaluated_generation{NO_GENERATION};
        ankerl::unordered_dense::set<CellId> reads;
        std::vector<std::function<void()>> teardown_hooks;
        // A hook was registered since the body last started running
        bool hooks_replaced{false};
    };

    struct CellRecord {
        GroupId owner{NO_GROUP};
        generation_t write_generation{NO_GENERATION};
        // Heap storage of the owning Value slot, stable while the slot exists
        value::TypedPtr storage{};
        ankerl::unordered_dense::set<GroupId> readers;
    };

} // namespace recache

template<>
struct fmt::formatter<recache::GroupState> : fmt::formatter<std::string_view> {
    auto format(recache::GroupState state, fmt::format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(recache::to_string(state), ctx);
    }
};

#endif //RECACHE_GROUP_RECORD_H
