//
// The slot table: an ordered sequence of entries addressed by position.
//

#ifndef RECACHE_SLOT_TABLE_H
#define RECACHE_SLOT_TABLE_H

#include <recache/types/slot.h>

#include <cstdio>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace recache {

    /**
     * Flat storage of every group, value and tag entry recorded by the last committed pass.
     *
     * The table only knows about positions, it has no notion of a cursor; SlotWriter drives it during a pass.
     * Every structural change is recorded in an undo journal until commit() or rollback() is called:
     *  - commit() drops the journal, which is the point where erased payloads are destroyed.
     *  - rollback() replays the journal backwards, restoring the exact previous sequence of entries and the
     *    heap storage of every payload (storage addresses do not change across a rollback).
     */
    class RECACHE_EXPORT SlotTable {
    public:
        using index_t = std::size_t;

        SlotTable() = default;
        SlotTable(const SlotTable &) = delete;
        SlotTable &operator=(const SlotTable &) = delete;
        SlotTable(SlotTable &&) = default;
        SlotTable &operator=(SlotTable &&) = default;

        [[nodiscard]] index_t size() const { return _slots.size(); }
        [[nodiscard]] bool empty() const { return _slots.empty(); }

        [[nodiscard]] const Slot &at(index_t index) const;

        // Mutable payload access, used for in-place value updates that are journaled elsewhere
        [[nodiscard]] Slot &at(index_t index);

        [[nodiscard]] const std::vector<Slot> &slots() const { return _slots; }

        void insert(index_t at, Slot slot);

        // Inserts an empty group (GroupStart + GroupEnd)
        void insert_group(index_t at, const CallTag &tag, GroupId group);

        // Erases [first, last), the slots are held by the journal until commit
        void erase(index_t first, index_t last);

        // std::rotate semantics: [middle, last) ends up at first
        void rotate(index_t first, index_t middle, index_t last);

        void replace(index_t at, Slot slot);

        void set_length(index_t at, std::uint32_t length);

        void commit();

        void rollback();

        [[nodiscard]] bool has_uncommitted_changes() const { return !_journal.empty(); }

        /**
         * One line per entry, indented by nesting depth. annotate, when given, is called for every
         * GroupStart and its result appended to the line (dirty flags, states).
         */
        [[nodiscard]] std::string dump(std::optional<index_t> cursor = std::nullopt,
                                       const std::function<std::string(GroupId)> &annotate = {}) const;

        void dump(std::FILE *out, std::optional<index_t> cursor = std::nullopt,
                  const std::function<std::string(GroupId)> &annotate = {}) const;

    private:
        struct Inserted {
            index_t at;
            index_t count;
        };

        struct Erased {
            index_t at;
            std::vector<Slot> slots;
        };

        struct Rotated {
            index_t first;
            index_t middle;
            index_t last;
        };

        struct Replaced {
            index_t at;
            Slot previous;
        };

        struct LengthChanged {
            index_t at;
            std::uint32_t previous;
        };

        using JournalEntry = std::variant<Inserted, Erased, Rotated, Replaced, LengthChanged>;

        void check_index(index_t index, std::string_view operation) const;

        std::vector<Slot> _slots;
        std::vector<JournalEntry> _journal;
    };

} // namespace recache

#endif //RECACHE_SLOT_TABLE_H
