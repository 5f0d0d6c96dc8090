//
// Dependency and invalidation bookkeeping for groups and state cells.
//

#ifndef RECACHE_INVALIDATION_TRACKER_H
#define RECACHE_INVALIDATION_TRACKER_H

#include <recache/types/group_record.h>
#include <recache/types/value/scalar_type.h>
#include <recache/util/journaled_map.h>

#include <exception>
#include <functional>
#include <utility>
#include <vector>

namespace recache {

    /**
     * Owns the GroupRecord and CellRecord registries.
     *
     * A group records the cells it read during its last evaluation, a cell records the groups that read it.
     * A write to a cell bumps its write generation and marks every reader dirty, which in turn flags every
     * ancestor of the reader with descendant_dirty so that the next pass can reach it.
     *
     * All changes are journaled and can be rolled back until commit(). Teardown hooks of removed groups are only
     * invoked at commit.
     */
    class RECACHE_EXPORT InvalidationTracker {
    public:
        using teardown_hook = std::function<void()>;
        using torn_down_fn = std::function<void(GroupId, const CallTag &, CallKey, std::size_t depth)>;
        using hook_failure_fn = std::function<void(GroupId, const std::exception &)>;

        InvalidationTracker() = default;
        InvalidationTracker(const InvalidationTracker &) = delete;
        InvalidationTracker &operator=(const InvalidationTracker &) = delete;

        // Groups

        GroupId create_group(GroupId parent, const CallTag &tag);

        [[nodiscard]] const GroupRecord *find_group(GroupId group) const { return _groups.find(group); }

        // Throws UsageError when the group does not exist
        [[nodiscard]] const GroupRecord &group(GroupId group) const;

        [[nodiscard]] bool contains_group(GroupId group) const { return _groups.contains(group); }

        [[nodiscard]] std::size_t group_count() const { return _groups.size(); }

        // Removes the record, its hooks fire at commit
        void retire_group(GroupId group);

        // The body of the group is about to run: previous reads are forgotten
        void begin_run(GroupId group);

        void finish_run(GroupId group, generation_t generation);

        /**
         * Registers a hook invoked when the group is torn down. Hooks registered by a run replace the ones of the
         * earlier runs; a run that registers none keeps them.
         */
        void add_teardown_hook(GroupId group, teardown_hook hook);

        // False when the group no longer exists
        bool mark_dirty(GroupId group);

        [[nodiscard]] bool is_stale(GroupId group) const;

        // Cells

        CellId create_cell(GroupId owner, value::TypedPtr storage, generation_t generation);

        [[nodiscard]] const CellRecord *find_cell(CellId cell) const { return _cells.find(cell); }

        [[nodiscard]] std::size_t cell_count() const { return _cells.size(); }

        void retire_cell(CellId cell);

        void record_read(GroupId reader, CellId cell);

        /**
         * Applies a queued write. The previous content is kept for rollback. Returns false when the cell no
         * longer exists or the value has a different type.
         */
        bool write_cell(CellId cell, value::ConstTypedPtr value, generation_t generation);

        bool update_cell(CellId cell, const value::TypeMeta *meta, const std::function<void(value::TypedPtr)> &fn,
                         generation_t generation);

        // Transaction

        /**
         * Makes the pass permanent and invokes the pending teardown hooks, children before parents.
         * Hook failures derived from std::exception are handed to on_failure and do not stop the remaining hooks.
         * Returns the number of groups torn down.
         */
        std::size_t commit(const torn_down_fn &on_torn_down = {}, const hook_failure_fn &on_failure = {});

        void rollback();

        // Retires every record and invokes every hook, used when the owning cache is destroyed
        void teardown_all(const hook_failure_fn &on_failure = {});

    private:
        struct RetiredGroup {
            GroupId group;
            CallTag tag;
            CallKey key;
            std::size_t depth;
        };

        struct PendingHooks {
            GroupId group;
            std::vector<teardown_hook> hooks;
        };

        struct SavedValue {
            value::TypedPtr storage;
            value::TypedValue previous;
        };

        bool set_dirty(GroupId group);
        CellRecord *begin_cell_write(CellId cell, generation_t generation);
        static void invoke_hooks(PendingHooks &pending, const hook_failure_fn &on_failure);

        JournaledMap<GroupId, GroupRecord> _groups;
        JournaledMap<CellId, CellRecord> _cells;
        // Ids are never reused, not even the ones handed out by a pass that was rolled back
        GroupId _next_group{NO_GROUP + 1};
        CellId _next_cell{NO_CELL + 1};

        std::vector<RetiredGroup> _retired;
        std::vector<PendingHooks> _pending_hooks;
        std::vector<SavedValue> _value_journal;
    };

} // namespace recache

#endif //RECACHE_INVALIDATION_TRACKER_H
