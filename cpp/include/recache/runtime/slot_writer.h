//
// The per-pass cursor over the slot table.
//

#ifndef RECACHE_SLOT_WRITER_H
#define RECACHE_SLOT_WRITER_H

#include <recache/runtime/invalidation_tracker.h>
#include <recache/types/error_type.h>
#include <recache/types/slot_table.h>
#include <recache/util/errors.h>

#include <vector>

namespace recache {

    /**
     * Walks the slot table during a pass, matching calls to the entries recorded by the previous pass.
     *
     * The writer keeps one frame per open group holding the index of the group's GroupEnd. Every insertion or
     * removal updates the open frames, so the end of the current group is always known and skipping a group
     * is a single assignment.
     *
     * Matching a call (begin_group, claim_value):
     *  - the entry at the cursor carries the tag: used as is;
     *  - otherwise the siblings after the cursor, up to the end of the enclosing group, are searched nearest
     *    first for the tag, at most max_search_distance entries away; a match is rotated to the cursor;
     *  - otherwise a new entry is inserted at the cursor.
     *
     * Entries between the cursor and the end of a group that were not matched when the group is closed were
     * not reached by this pass and are removed, their groups and cells retired in the tracker.
     */
    class RECACHE_EXPORT SlotWriter {
    public:
        using index_t = SlotTable::index_t;

        struct Frame {
            index_t start;
            index_t end; // index of the GroupEnd
            GroupId group;
        };

        struct GroupEntry {
            GroupId group;
            bool created;
        };

        SlotWriter(SlotTable &table, InvalidationTracker &tracker, std::size_t max_search_distance);

        [[nodiscard]] index_t position() const { return _pos; }

        [[nodiscard]] std::size_t depth() const { return _frames.size(); }

        [[nodiscard]] const Frame &current_frame() const;

        [[nodiscard]] GroupId current_group() const { return _frames.empty() ? NO_GROUP : _frames.back().group; }

        GroupEntry begin_group(const CallTag &tag);

        void end_group();

        // Moves the cursor onto the GroupEnd of the current group, keeping the recorded children
        void skip_to_matching_end();

        // Removes everything between the cursor and the end of the current group (or of the table at top level)
        void truncate_unused_tail();

        /**
         * Replaces the current group by a new empty group with the same tag: children and values are retired and
         * a new record is created. Returns the new group id.
         */
        GroupId recreate_current_group();

        // Index of the Value or Tag entry for tag, created as a Tag entry when not found
        index_t claim_value(const CallTag &tag);

        [[nodiscard]] bool has_value(index_t index) const;

        // Type of the payload at index, nullptr for a Tag entry
        [[nodiscard]] const value::TypeMeta *value_meta(index_t index) const;

        /**
         * Payload at index, nullptr when the entry has no payload yet.
         * Throws UsageError when the payload is of a different type.
         */
        template<typename T>
        [[nodiscard]] const T *read_value(index_t index) const {
            auto &slot = _table.at(index);
            if (std::holds_alternative<TagSlot>(slot)) { return nullptr; }
            auto *v = std::get_if<ValueSlot>(&slot);
            if (v == nullptr) {
                throw_error<UsageError>("Slot {} is a {} entry, not a value", index, slot_kind(slot));
            }
            if (!v->value.template is<T>()) {
                throw_error<UsageError>("Slot {} ({}) holds a {}, read as a {}", index, v->tag,
                                        v->value.meta()->type_name_str(),
                                        value::scalar_type_meta<T>()->type_name_str());
            }
            return &v->value.template as<T>();
        }

        [[nodiscard]] CellId cell_at(index_t index) const;

        [[nodiscard]] const value::TypedValue *typed_value_at(index_t index) const;

        // Stores a payload at index, retiring the cell of the previous payload when it is a different cell
        void write_value(index_t index, value::TypedValue value, generation_t generation, CellId cell = NO_CELL);

        // Turns the entry back into a Tag entry, retiring its cell
        void reset_value(index_t index);

    private:
        std::optional<index_t> find_in_frame(const CallTag &tag, bool group) const;
        [[nodiscard]] index_t frame_limit() const;
        void insert_at_cursor(Slot slot);
        void erase_range(index_t first, index_t last);
        void retire_range(index_t first, index_t last);

        SlotTable &_table;
        InvalidationTracker &_tracker;
        std::size_t _max_search_distance;
        index_t _pos{0};
        std::vector<Frame> _frames;
    };

} // namespace recache

#endif //RECACHE_SLOT_WRITER_H
