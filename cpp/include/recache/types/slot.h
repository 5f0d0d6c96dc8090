//
// Entries of the slot table.
//

#ifndef RECACHE_SLOT_H
#define RECACHE_SLOT_H

#include <recache/types/call_key.h>
#include <recache/types/value/scalar_type.h>

#include <string_view>
#include <variant>

namespace recache {

    /**
     * Opens the region produced by one call site. length counts every entry of the group including this
     * GroupStart and the matching GroupEnd, so an empty group has length 2.
     */
    struct GroupStartSlot {
        CallTag tag;
        GroupId group{NO_GROUP};
        std::uint32_t length{2};
    };

    struct GroupEndSlot {};

    /**
     * One stored value: a state cell, a memoized argument set, a memoized result or a changed() baseline.
     * cell is set for state cells only.
     */
    struct ValueSlot {
        CallTag tag;
        value::TypedValue value;
        generation_t generation{NO_GENERATION};
        CellId cell{NO_CELL};
    };

    // Reserved for a call site whose payload has not been written yet
    struct TagSlot {
        CallTag tag;
    };

    using Slot = std::variant<GroupStartSlot, GroupEndSlot, ValueSlot, TagSlot>;

    // nullptr for GroupEnd
    [[nodiscard]] inline const CallTag *slot_tag(const Slot &slot) {
        return std::visit(
            []<typename S>(const S &s) -> const CallTag * {
                if constexpr (std::is_same_v<S, GroupEndSlot>) {
                    return nullptr;
                } else {
                    return &s.tag;
                }
            },
            slot);
    }

    // Number of table entries covered by the entry, a whole group for a GroupStart
    [[nodiscard]] inline std::size_t slot_span(const Slot &slot) {
        if (auto *start = std::get_if<GroupStartSlot>(&slot)) { return start->length; }
        return 1;
    }

    [[nodiscard]] inline std::string_view slot_kind(const Slot &slot) {
        switch (slot.index()) {
            case 0: return "GroupStart";
            case 1: return "GroupEnd";
            case 2: return "Value";
            case 3: return "Tag";
            default: return "?";
        }
    }

} // namespace recache

#endif //RECACHE_SLOT_H
