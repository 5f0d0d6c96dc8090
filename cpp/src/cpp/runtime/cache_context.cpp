#include <recache/runtime/cache_context.h>

namespace recache {

    void record_state_read(const PassState &pass, CellId cell) {
        if (pass.context != nullptr) { pass.context->_record_read(cell); }
    }

    CacheContext::CacheContext(SlotTable &table, InvalidationTracker &tracker, pending_mutation_queue_w_ptr queue,
                               pass_state_w_ptr pass, const std::vector<pass_observer_s_ptr> &observers,
                               PassStatistics &statistics, generation_t generation, std::size_t max_search_distance)
        : _tracker{tracker}, _writer{table, tracker, max_search_distance}, _queue{std::move(queue)},
          _pass{std::move(pass)}, _observers{observers}, _statistics{statistics}, _generation{generation} {
    }

    bool CacheContext::begin_group(CallSiteId site) { return _begin_bracket(_positional_tag(site)); }

    void CacheContext::skip_to_end() {
        if (!_frame().bracket) {
            throw_error<UsageError>("skip_to_end() is only valid in a group opened with begin_group(), not in {}",
                                    _frame().tag);
        }
        if (_frame().mode != RunMode::Skip) {
            throw_error<UsageError>("skip_to_end() in group {} which begin_group() reported as needing to run",
                                    _frame().tag);
        }
        _writer.skip_to_matching_end();
    }

    void CacheContext::end_group() {
        if (!_frame().bracket) {
            throw_error<UsageError>("end_group() without a matching begin_group(), the current group is {}",
                                    _frame().tag);
        }
        _leave_group();
    }

    InvalidationToken CacheContext::invalidation_token() const { return InvalidationToken{_queue, current_group()}; }

    void CacheContext::on_teardown(std::function<void()> hook) {
        _tracker.add_teardown_hook(current_group(), std::move(hook));
    }

    bool CacheContext::is_dirty() const { return _frame().forced; }

    CallKey CacheContext::current_call_key() const { return _frame().key; }

    GroupId CacheContext::current_group() const { return _frame().group; }

    CallTag CacheContext::_positional_tag(CallSiteId site) {
        if (site.is_reserved()) { throw_error<UsageError>("Call site id {:016X} is reserved", site.value); }
        auto ordinal = _frame().occurrences[site.value]++;
        return CallTag::positional(site, ordinal);
    }

    CallTag CacheContext::_keyed_tag(CallSiteId site, std::uint64_t hash, bool group) {
        if (site.is_reserved()) { throw_error<UsageError>("Call site id {:016X} is reserved", site.value); }
        auto tag = CallTag::keyed(site, hash);
        auto &keys = group ? _frame().group_keys : _frame().state_keys;
        if (!keys.insert(tag).second) {
            throw_error<UsageError>("Duplicate key {} in group {}: every keyed call of a group needs its own key", tag,
                                    _frame().tag);
        }
        return tag;
    }

    SlotWriter::GroupEntry CacheContext::_enter_group(const CallTag &tag) {
        auto entry = _writer.begin_group(tag);
        ContextFrame frame;
        frame.group = entry.group;
        frame.tag = tag;
        frame.key = _tracker.group(entry.group).key;
        _frames.push_back(std::move(frame));
        return entry;
    }

    GroupId CacheContext::_recreate_group() {
        auto group = _writer.recreate_current_group();
        auto &frame = _frame();
        frame.group = group;
        frame.key = _tracker.group(group).key;
        frame.occurrences.clear();
        frame.group_keys.clear();
        frame.state_keys.clear();
        return group;
    }

    bool CacheContext::_store_args(SlotWriter::index_t index, value::TypedValue args) {
        if (auto *existing = _writer.typed_value_at(index); existing != nullptr && existing->equals(args)) {
            return false;
        }
        _writer.write_value(index, std::move(args), _generation);
        return true;
    }

    CacheContext::RunMode CacheContext::_decide(bool created, bool args_changed, bool has_result) {
        auto &frame = _frame();
        bool inherited = _frames.size() > 1 && _frames[_frames.size() - 2].forced;
        bool stale = !created && _tracker.is_stale(frame.group);
        bool descendant_dirty = _tracker.group(frame.group).descendant_dirty;

        if (inherited || stale) {
            frame.mode = RunMode::Evaluate;
            frame.forced = true;
        } else if (created || args_changed || !has_result) {
            frame.mode = RunMode::Evaluate;
        } else if (descendant_dirty) {
            frame.mode = RunMode::Traverse;
        } else {
            frame.mode = RunMode::Skip;
        }

        auto event = _event(frame);
        switch (frame.mode) {
            case RunMode::Evaluate:
                ++_statistics.evaluated;
                if (created) { ++_statistics.created; }
                _notify(&PassLifeCycleObserver::on_group_evaluated, event);
                break;
            case RunMode::Traverse:
                ++_statistics.traversed;
                _notify(&PassLifeCycleObserver::on_group_traversed, event);
                break;
            case RunMode::Skip:
                ++_statistics.skipped;
                _notify(&PassLifeCycleObserver::on_group_skipped, event);
                return RunMode::Skip;
        }
        _tracker.begin_run(frame.group);
        return frame.mode;
    }

    void CacheContext::_leave_group() {
        auto &frame = _frame();
        if (frame.mode == RunMode::Skip) {
            _writer.skip_to_matching_end();
            _writer.end_group();
        } else {
            _writer.end_group();
            _tracker.finish_run(frame.group, _generation);
        }
        _frames.pop_back();
    }

    void CacheContext::_check_balanced(std::size_t depth) const {
        if (_frames.size() > depth) {
            throw_error<UsageError>("Group {} opened with begin_group() was not closed before its parent returned",
                                    _frames.back().tag);
        }
        if (_frames.size() < depth) {
            throw_error<UsageError>("end_group() closed more groups than were opened in the current group");
        }
    }

    bool CacheContext::_begin_bracket(const CallTag &tag) {
        auto entry = _enter_group(tag);
        _frame().bracket = true;
        return _decide(entry.created, false, true) != RunMode::Skip;
    }

    CacheContext::ContextFrame &CacheContext::_frame() {
        if (_frames.empty()) { throw_error<UsageError>("No group is open, the pass has not started or has ended"); }
        return _frames.back();
    }

    const CacheContext::ContextFrame &CacheContext::_frame() const {
        if (_frames.empty()) { throw_error<UsageError>("No group is open, the pass has not started or has ended"); }
        return _frames.back();
    }

    GroupEvent CacheContext::_event(const ContextFrame &frame) const {
        return GroupEvent{
            .group = frame.group,
            .tag = frame.tag,
            .key = frame.key,
            .depth = _frames.size() - 1,
            .generation = _generation,
        };
    }

    void CacheContext::_enter_root() {
        auto entry = _enter_group(CallTag::positional(CallSiteId::root(), 0));
        auto &frame = _frame();
        frame.forced = !entry.created && _tracker.is_stale(frame.group);
        frame.mode = RunMode::Evaluate;
        _tracker.begin_run(frame.group);
    }

    void CacheContext::_leave_root() {
        if (_frames.size() != 1) {
            throw_error<UsageError>("Group {} was not closed by the end of the pass, {} groups are still open",
                                    _frames.back().tag, _frames.size() - 1);
        }
        _leave_group();
        _writer.truncate_unused_tail();
    }

    void CacheContext::_record_read(CellId cell) {
        if (_frames.empty()) { return; }
        _tracker.record_read(_frames.back().group, cell);
    }

} // namespace recache
