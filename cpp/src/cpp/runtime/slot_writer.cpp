#include <recache/runtime/slot_writer.h>

namespace recache {

    SlotWriter::SlotWriter(SlotTable &table, InvalidationTracker &tracker, std::size_t max_search_distance)
        : _table{table}, _tracker{tracker}, _max_search_distance{max_search_distance} {
    }

    const SlotWriter::Frame &SlotWriter::current_frame() const {
        if (_frames.empty()) { throw_error<UsageError>("No group is open at position {}", _pos); }
        return _frames.back();
    }

    SlotWriter::GroupEntry SlotWriter::begin_group(const CallTag &tag) {
        bool created = false;
        GroupId group{NO_GROUP};
        if (auto found = find_in_frame(tag, true)) {
            auto &start = std::get<GroupStartSlot>(_table.at(*found));
            group = start.group;
            if (*found != _pos) { _table.rotate(_pos, *found, *found + start.length); }
            if (!_tracker.contains_group(group)) {
                throw_error<UsageError>("Group {} at {} has no tracker record", tag, _pos);
            }
        } else {
            group = _tracker.create_group(current_group(), tag);
            _table.insert_group(_pos, tag, group);
            for (auto &f : _frames) { f.end += 2; }
            created = true;
        }
        auto length = std::get<GroupStartSlot>(_table.at(_pos)).length;
        _frames.push_back({_pos, _pos + length - 1, group});
        ++_pos;
        return {group, created};
    }

    void SlotWriter::end_group() {
        if (_frames.empty()) { throw_error<UsageError>("end_group() without an open group at position {}", _pos); }
        if (_pos > _frames.back().end) {
            throw_error<UsageError>("Cursor at {} is past the end {} of the current group", _pos, _frames.back().end);
        }
        // Whatever was not reached by this pass goes
        if (_pos < _frames.back().end) { erase_range(_pos, _frames.back().end); }
        auto frame = _frames.back();
        _table.set_length(frame.start, static_cast<std::uint32_t>(frame.end - frame.start + 1));
        _pos = frame.end + 1;
        _frames.pop_back();
    }

    void SlotWriter::skip_to_matching_end() { _pos = current_frame().end; }

    void SlotWriter::truncate_unused_tail() {
        auto limit = frame_limit();
        if (_pos < limit) { erase_range(_pos, limit); }
    }

    GroupId SlotWriter::recreate_current_group() {
        auto frame = current_frame();
        if (frame.end > frame.start + 1) { erase_range(frame.start + 1, frame.end); }
        auto tag = std::get<GroupStartSlot>(_table.at(frame.start)).tag;
        _tracker.retire_group(frame.group);
        auto parent = _frames.size() > 1 ? _frames[_frames.size() - 2].group : NO_GROUP;
        auto group = _tracker.create_group(parent, tag);
        _table.replace(frame.start, GroupStartSlot{tag, group, 2});
        _frames.back().group = group;
        _pos = frame.start + 1;
        return group;
    }

    SlotWriter::index_t SlotWriter::claim_value(const CallTag &tag) {
        if (auto found = find_in_frame(tag, false)) {
            if (*found != _pos) { _table.rotate(_pos, *found, *found + 1); }
        } else {
            insert_at_cursor(TagSlot{tag});
        }
        return _pos++;
    }

    bool SlotWriter::has_value(index_t index) const { return std::holds_alternative<ValueSlot>(_table.at(index)); }

    const value::TypeMeta *SlotWriter::value_meta(index_t index) const {
        auto *v = std::get_if<ValueSlot>(&_table.at(index));
        return v ? v->value.meta() : nullptr;
    }

    CellId SlotWriter::cell_at(index_t index) const {
        auto *v = std::get_if<ValueSlot>(&_table.at(index));
        return v ? v->cell : NO_CELL;
    }

    const value::TypedValue *SlotWriter::typed_value_at(index_t index) const {
        auto *v = std::get_if<ValueSlot>(&_table.at(index));
        return v ? &v->value : nullptr;
    }

    void SlotWriter::write_value(index_t index, value::TypedValue value, generation_t generation, CellId cell) {
        auto &slot = _table.at(index);
        if (!std::holds_alternative<ValueSlot>(slot) && !std::holds_alternative<TagSlot>(slot)) {
            throw_error<UsageError>("Cannot write a value into the {} entry at {}", slot_kind(slot), index);
        }
        auto tag = *slot_tag(slot);
        if (auto *v = std::get_if<ValueSlot>(&slot); v && v->cell != NO_CELL && v->cell != cell) {
            _tracker.retire_cell(v->cell);
        }
        _table.replace(index, ValueSlot{tag, std::move(value), generation, cell});
    }

    void SlotWriter::reset_value(index_t index) {
        auto &slot = _table.at(index);
        auto *v = std::get_if<ValueSlot>(&slot);
        if (v == nullptr) { return; }
        if (v->cell != NO_CELL) { _tracker.retire_cell(v->cell); }
        auto tag = v->tag;
        _table.replace(index, TagSlot{tag});
    }

    std::optional<SlotWriter::index_t> SlotWriter::find_in_frame(const CallTag &tag, bool group) const {
        auto limit = frame_limit();
        for (auto i = _pos; i < limit && i - _pos <= _max_search_distance;) {
            const auto &slot = _table.at(i);
            bool kind_matches = group ? std::holds_alternative<GroupStartSlot>(slot)
                                      : std::holds_alternative<ValueSlot>(slot) || std::holds_alternative<TagSlot>(slot);
            if (kind_matches && *slot_tag(slot) == tag) { return i; }
            i += slot_span(slot);
        }
        return std::nullopt;
    }

    SlotWriter::index_t SlotWriter::frame_limit() const { return _frames.empty() ? _table.size() : _frames.back().end; }

    void SlotWriter::insert_at_cursor(Slot slot) {
        _table.insert(_pos, std::move(slot));
        for (auto &f : _frames) { ++f.end; }
    }

    void SlotWriter::erase_range(index_t first, index_t last) {
        retire_range(first, last);
        _table.erase(first, last);
        auto count = last - first;
        for (auto &f : _frames) { f.end -= count; }
    }

    void SlotWriter::retire_range(index_t first, index_t last) {
        for (auto i = first; i < last; ++i) {
            const auto &slot = _table.at(i);
            if (auto *start = std::get_if<GroupStartSlot>(&slot)) {
                _tracker.retire_group(start->group);
            } else if (auto *v = std::get_if<ValueSlot>(&slot); v && v->cell != NO_CELL) {
                _tracker.retire_cell(v->cell);
            }
        }
    }

} // namespace recache
