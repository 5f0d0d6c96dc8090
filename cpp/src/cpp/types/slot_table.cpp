#include <recache/types/slot_table.h>
#include <recache/types/error_type.h>
#include <recache/util/errors.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace recache {

    namespace {
        std::ptrdiff_t offset(SlotTable::index_t index) { return static_cast<std::ptrdiff_t>(index); }
    } // namespace

    const Slot &SlotTable::at(index_t index) const {
        check_index(index, "at");
        return _slots[index];
    }

    Slot &SlotTable::at(index_t index) {
        check_index(index, "at");
        return _slots[index];
    }

    void SlotTable::insert(index_t at, Slot slot) {
        if (at > _slots.size()) {
            throw_error<UsageError>("SlotTable::insert at {} past the end of a table of {} entries", at, _slots.size());
        }
        _slots.insert(_slots.begin() + offset(at), std::move(slot));
        _journal.emplace_back(Inserted{at, 1});
    }

    void SlotTable::insert_group(index_t at, const CallTag &tag, GroupId group) {
        if (at > _slots.size()) {
            throw_error<UsageError>("SlotTable::insert_group at {} past the end of a table of {} entries", at,
                                    _slots.size());
        }
        std::vector<Slot> pair;
        pair.reserve(2);
        pair.emplace_back(GroupStartSlot{tag, group, 2});
        pair.emplace_back(GroupEndSlot{});
        _slots.insert(_slots.begin() + offset(at), std::make_move_iterator(pair.begin()),
                      std::make_move_iterator(pair.end()));
        _journal.emplace_back(Inserted{at, 2});
    }

    void SlotTable::erase(index_t first, index_t last) {
        if (first > last || last > _slots.size()) {
            throw_error<UsageError>("SlotTable::erase of [{}, {}) outside a table of {} entries", first, last,
                                    _slots.size());
        }
        if (first == last) { return; }
        std::vector<Slot> removed;
        removed.reserve(last - first);
        std::move(_slots.begin() + offset(first), _slots.begin() + offset(last), std::back_inserter(removed));
        _slots.erase(_slots.begin() + offset(first), _slots.begin() + offset(last));
        _journal.emplace_back(Erased{first, std::move(removed)});
    }

    void SlotTable::rotate(index_t first, index_t middle, index_t last) {
        if (first > middle || middle > last || last > _slots.size()) {
            throw_error<UsageError>("SlotTable::rotate of [{}, {}, {}) outside a table of {} entries", first, middle,
                                    last, _slots.size());
        }
        if (first == middle || middle == last) { return; }
        std::rotate(_slots.begin() + offset(first), _slots.begin() + offset(middle), _slots.begin() + offset(last));
        _journal.emplace_back(Rotated{first, middle, last});
    }

    void SlotTable::replace(index_t at, Slot slot) {
        check_index(at, "replace");
        Slot previous = std::exchange(_slots[at], std::move(slot));
        _journal.emplace_back(Replaced{at, std::move(previous)});
    }

    void SlotTable::set_length(index_t at, std::uint32_t length) {
        check_index(at, "set_length");
        auto *start = std::get_if<GroupStartSlot>(&_slots[at]);
        if (start == nullptr) {
            throw_error<UsageError>("SlotTable::set_length at {} which is a {} entry", at, slot_kind(_slots[at]));
        }
        if (start->length == length) { return; }
        _journal.emplace_back(LengthChanged{at, start->length});
        start->length = length;
    }

    void SlotTable::commit() { _journal.clear(); }

    void SlotTable::rollback() {
        while (!_journal.empty()) {
            auto entry = std::move(_journal.back());
            _journal.pop_back();
            std::visit(
                [this]<typename E>(E &e) {
                    if constexpr (std::is_same_v<E, Inserted>) {
                        _slots.erase(_slots.begin() + offset(e.at), _slots.begin() + offset(e.at + e.count));
                    } else if constexpr (std::is_same_v<E, Erased>) {
                        _slots.insert(_slots.begin() + offset(e.at), std::make_move_iterator(e.slots.begin()),
                                      std::make_move_iterator(e.slots.end()));
                    } else if constexpr (std::is_same_v<E, Rotated>) {
                        std::rotate(_slots.begin() + offset(e.first),
                                    _slots.begin() + offset(e.first + (e.last - e.middle)),
                                    _slots.begin() + offset(e.last));
                    } else if constexpr (std::is_same_v<E, Replaced>) {
                        _slots[e.at] = std::move(e.previous);
                    } else {
                        std::get<GroupStartSlot>(_slots[e.at]).length = e.previous;
                    }
                },
                entry);
        }
    }

    std::string SlotTable::dump(std::optional<index_t> cursor,
                                const std::function<std::string(GroupId)> &annotate) const {
        std::string out;
        std::size_t depth = 0;
        for (index_t i = 0; i < _slots.size(); ++i) {
            const auto &slot = _slots[i];
            if (std::holds_alternative<GroupEndSlot>(slot) && depth > 0) { --depth; }
            auto marker = cursor && *cursor == i ? "->" : "  ";
            auto indent = std::string(depth * 2, ' ');
            std::visit(
                [&]<typename S>(const S &s) {
                    if constexpr (std::is_same_v<S, GroupStartSlot>) {
                        out += fmt::format("{} {:>4} {}GroupStart {} group={} len={}{}\n", marker, i, indent, s.tag,
                                           s.group, s.length, annotate ? annotate(s.group) : std::string{});
                    } else if constexpr (std::is_same_v<S, GroupEndSlot>) {
                        out += fmt::format("{} {:>4} {}GroupEnd\n", marker, i, indent);
                    } else if constexpr (std::is_same_v<S, ValueSlot>) {
                        out += fmt::format("{} {:>4} {}Value {} = {} gen={}{}\n", marker, i, indent, s.tag,
                                           s.value.to_string(), s.generation,
                                           s.cell != NO_CELL ? fmt::format(" cell={}", s.cell) : std::string{});
                    } else {
                        out += fmt::format("{} {:>4} {}Tag {}\n", marker, i, indent, s.tag);
                    }
                },
                slot);
            if (std::holds_alternative<GroupStartSlot>(slot)) { ++depth; }
        }
        if (cursor && *cursor >= _slots.size()) { out += fmt::format("-> {:>4} <end>\n", *cursor); }
        return out;
    }

    void SlotTable::dump(std::FILE *out, std::optional<index_t> cursor,
                         const std::function<std::string(GroupId)> &annotate) const {
        fmt::print(out, "{}", dump(cursor, annotate));
    }

    void SlotTable::check_index(index_t index, std::string_view operation) const {
        if (index >= _slots.size()) {
            throw_error<UsageError>("SlotTable::{} at {} outside a table of {} entries", operation, index,
                                    _slots.size());
        }
    }

} // namespace recache
