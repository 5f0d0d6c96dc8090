#include <recache/runtime/invalidation_tracker.h>
#include <recache/types/error_type.h>
#include <recache/util/errors.h>

#include <algorithm>

namespace recache {

    std::string_view to_string(GroupState state) {
        switch (state) {
            case GroupState::Fresh: return "Fresh";
            case GroupState::Stale: return "Stale";
            case GroupState::Evaluating: return "Evaluating";
            case GroupState::Cached: return "Cached";
        }
        return "Unknown";
    }

    GroupId InvalidationTracker::create_group(GroupId parent, const CallTag &tag) {
        CallKey parent_key{};
        std::size_t depth = 0;
        if (parent != NO_GROUP) {
            auto &parent_record = group(parent);
            parent_key = parent_record.key;
            depth = parent_record.depth + 1;
        }
        auto id = _next_group++;
        _groups.emplace(id, GroupRecord{
                                .parent = parent,
                                .tag = tag,
                                .key = CallKey::chain(parent_key, tag),
                                .depth = depth,
                            });
        return id;
    }

    const GroupRecord &InvalidationTracker::group(GroupId group) const {
        auto *record = _groups.find(group);
        if (record == nullptr) { throw_error<UsageError>("No group record for group {}", group); }
        return *record;
    }

    void InvalidationTracker::retire_group(GroupId group) {
        auto *record = _groups.find(group);
        if (record == nullptr) { return; }
        _retired.push_back({group, record->tag, record->key, record->depth});
        if (!record->teardown_hooks.empty()) { _pending_hooks.push_back({group, record->teardown_hooks}); }
        for (auto cell : record->reads) {
            if (auto *c = _cells.modify(cell)) { c->readers.erase(group); }
        }
        _groups.erase(group);
    }

    void InvalidationTracker::begin_run(GroupId group) {
        auto *record = _groups.modify(group);
        if (record == nullptr) { throw_error<UsageError>("Cannot run group {}, it has no record", group); }
        record->state = GroupState::Evaluating;
        record->hooks_replaced = false;
        auto reads = std::move(record->reads);
        record->reads.clear();
        for (auto cell : reads) {
            if (auto *c = _cells.modify(cell)) { c->readers.erase(group); }
        }
    }

    void InvalidationTracker::finish_run(GroupId group, generation_t generation) {
        auto *record = _groups.modify(group);
        if (record == nullptr) { throw_error<UsageError>("Cannot finish group {}, it has no record", group); }
        record->dirty = false;
        record->descendant_dirty = false;
        record->evaluated_generation = generation;
        record->state = GroupState::Cached;
    }

    void InvalidationTracker::add_teardown_hook(GroupId group, teardown_hook hook) {
        auto *record = _groups.modify(group);
        if (record == nullptr) { throw_error<UsageError>("Cannot register a teardown hook on group {}", group); }
        // The first registration of a run replaces the hooks of earlier runs
        if (!record->hooks_replaced) {
            record->teardown_hooks.clear();
            record->hooks_replaced = true;
        }
        record->teardown_hooks.push_back(std::move(hook));
    }

    bool InvalidationTracker::mark_dirty(GroupId group) {
        if (!set_dirty(group)) { return false; }
        auto parent = _groups.find(group)->parent;
        while (parent != NO_GROUP) {
            auto *record = _groups.find(parent);
            if (record == nullptr || record->descendant_dirty) { break; }
            _groups.modify(parent)->descendant_dirty = true;
            parent = record->parent;
        }
        return true;
    }

    bool InvalidationTracker::set_dirty(GroupId group) {
        auto *record = _groups.modify(group);
        if (record == nullptr) { return false; }
        record->dirty = true;
        if (record->state == GroupState::Cached) { record->state = GroupState::Stale; }
        return true;
    }

    bool InvalidationTracker::is_stale(GroupId group) const {
        auto &record = this->group(group);
        if (record.dirty) { return true; }
        return std::ranges::any_of(record.reads, [&](CellId cell) {
            auto *c = _cells.find(cell);
            return c != nullptr && c->write_generation > record.evaluated_generation;
        });
    }

    CellId InvalidationTracker::create_cell(GroupId owner, value::TypedPtr storage, generation_t generation) {
        auto id = _next_cell++;
        _cells.emplace(id, CellRecord{.owner = owner, .write_generation = generation, .storage = storage});
        return id;
    }

    void InvalidationTracker::retire_cell(CellId cell) { _cells.erase(cell); }

    void InvalidationTracker::record_read(GroupId reader, CellId cell) {
        auto *group = _groups.find(reader);
        auto *c = _cells.find(cell);
        if (group == nullptr || c == nullptr) { return; }
        if (group->reads.contains(cell)) { return; }
        _groups.modify(reader)->reads.insert(cell);
        _cells.modify(cell)->readers.insert(reader);
    }

    CellRecord *InvalidationTracker::begin_cell_write(CellId cell, generation_t generation) {
        auto *record = _cells.modify(cell);
        if (record == nullptr) { return nullptr; }
        _value_journal.push_back({record->storage, value::TypedValue::copy_of(record->storage)});
        record->write_generation = generation;
        return record;
    }

    bool InvalidationTracker::write_cell(CellId cell, value::ConstTypedPtr value, generation_t generation) {
        auto *existing = _cells.find(cell);
        if (existing == nullptr || !value.valid() || existing->storage.meta != value.meta) { return false; }
        auto *record = begin_cell_write(cell, generation);
        record->storage.meta->copy_assign_at(record->storage.ptr, value.ptr);
        auto readers = record->readers;
        for (auto reader : readers) { mark_dirty(reader); }
        return true;
    }

    bool InvalidationTracker::update_cell(CellId cell, const value::TypeMeta *meta,
                                          const std::function<void(value::TypedPtr)> &fn, generation_t generation) {
        auto *existing = _cells.find(cell);
        if (existing == nullptr || existing->storage.meta != meta) { return false; }
        auto *record = begin_cell_write(cell, generation);
        fn(record->storage);
        auto readers = record->readers;
        for (auto reader : readers) { mark_dirty(reader); }
        return true;
    }

    std::size_t InvalidationTracker::commit(const torn_down_fn &on_torn_down, const hook_failure_fn &on_failure) {
        _groups.commit();
        _cells.commit();
        _value_journal.clear();
        auto retired = std::move(_retired);
        auto pending = std::move(_pending_hooks);
        _retired.clear();
        _pending_hooks.clear();
        if (on_torn_down) {
            for (auto &r : retired) { on_torn_down(r.group, r.tag, r.key, r.depth); }
        }
        for (auto it = pending.rbegin(); it != pending.rend(); ++it) { invoke_hooks(*it, on_failure); }
        return retired.size();
    }

    void InvalidationTracker::rollback() {
        // Restore values newest first, so the oldest saved copy wins
        for (auto it = _value_journal.rbegin(); it != _value_journal.rend(); ++it) {
            it->storage.meta->copy_assign_at(it->storage.ptr, it->previous.ptr().ptr);
        }
        _value_journal.clear();
        _groups.rollback();
        _cells.rollback();
        _retired.clear();
        _pending_hooks.clear();
    }

    void InvalidationTracker::teardown_all(const hook_failure_fn &on_failure) {
        std::vector<std::pair<std::size_t, GroupId>> by_depth;
        by_depth.reserve(_groups.size());
        for (const auto &[id, record] : _groups) {
            std::size_t depth = 0;
            for (auto p = record.parent; p != NO_GROUP;) {
                ++depth;
                auto *parent = _groups.find(p);
                p = parent ? parent->parent : NO_GROUP;
            }
            by_depth.emplace_back(depth, id);
        }
        // Deepest first, so children are torn down before their parents
        std::ranges::sort(by_depth, std::greater<>{});
        std::vector<PendingHooks> pending;
        for (auto &[depth, id] : by_depth) {
            auto &hooks = _groups.find(id)->teardown_hooks;
            if (!hooks.empty()) { pending.push_back({id, hooks}); }
        }
        _groups.clear();
        _cells.clear();
        _value_journal.clear();
        _retired.clear();
        _pending_hooks.clear();
        for (auto &p : pending) { invoke_hooks(p, on_failure); }
    }

    void InvalidationTracker::invoke_hooks(PendingHooks &pending, const hook_failure_fn &on_failure) {
        for (auto it = pending.hooks.rbegin(); it != pending.hooks.rend(); ++it) {
            try {
                (*it)();
            } catch (const std::exception &e) {
                if (on_failure) {
                    on_failure(pending.group, e);
                } else {
                    fmt::print(stderr, "recache: teardown hook of group {} failed: {}\n", pending.group, e.what());
                }
            }
        }
    }

} // namespace recache
