#include <recache/runtime/cache.h>
#include <recache/runtime/observers/pass_trace.h>

#include <algorithm>
#include <cstdlib>

namespace recache {

    Cache::Cache(CacheOptions options)
        : _options{std::move(options)}, _queue{std::make_shared<PendingMutationQueue>()} {
        if (std::getenv("RECACHE_DEBUG_DUMP") != nullptr) { _options.dump_after_pass = true; }
        if (std::getenv("RECACHE_TRACE") != nullptr) {
            std::optional<std::string> filter;
            if (const char *f = std::getenv("RECACHE_TRACE_FILTER"); f != nullptr && *f != '\0') { filter = f; }
            _observers.push_back(std::make_shared<PassTrace>(filter));
        }
    }

    Cache::~Cache() {
        _context.reset();
        _pass_state.reset();
        _tracker.teardown_all([this](GroupId group, const std::exception &e) {
            fmt::print(stderr, "recache[{}]: teardown hook of group {} failed while destroying the cache: {}\n",
                       _options.label, group, e.what());
        });
    }

    bool Cache::invalidate(const InvalidationToken &token) {
        if (token.group() == NO_GROUP || !token.issued_by(_queue)) { return false; }
        _queue->push(GroupInvalidation{token.group()});
        return true;
    }

    bool Cache::has_pending_mutations() const { return !_queue->empty(); }

    void Cache::dump(std::FILE *out) const { fmt::print(out, "{}", dump_string()); }

    std::string Cache::dump_string() const {
        auto header = fmt::format("Cache '{}' generation={} slots={} groups={} cells={}\n", _options.label,
                                  _generation, _table.size(), _tracker.group_count(), _tracker.cell_count());
        return header + _table.dump(_context ? std::optional{_context->position()} : std::nullopt,
                                    [this](GroupId group) -> std::string {
                                        auto *record = _tracker.find_group(group);
                                        if (record == nullptr) { return " <no record>"; }
                                        return fmt::format(" [{}{}{} gen={}]", record->state,
                                                           record->dirty ? " dirty" : "",
                                                           record->descendant_dirty ? " descendant_dirty" : "",
                                                           record->evaluated_generation);
                                    });
    }

    void Cache::add_observer(pass_observer_s_ptr observer) {
        if (in_pass()) { throw_error<UsageError>("Observers cannot be added while a pass is running"); }
        _observers.push_back(std::move(observer));
    }

    void Cache::remove_observer(const pass_observer_s_ptr &observer) {
        if (in_pass()) { throw_error<UsageError>("Observers cannot be removed while a pass is running"); }
        std::erase(_observers, observer);
    }

    void Cache::_begin_pass() {
        if (_context) {
            throw_error<ReentrancyError>("Cache '{}' is already running pass {}", _options.label, _generation + 1);
        }
        auto generation = _generation + 1;
        _statistics = PassStatistics{.generation = generation};
        _pass_state = std::make_shared<PassState>(PassState{.generation = generation});
        _context.emplace(_table, _tracker, _queue, _pass_state, _observers, _statistics, generation,
                         _options.max_search_distance);
        _pass_state->context = &*_context;
    }

    void Cache::_apply_pending() {
        for (const auto &observer : _observers) { observer->on_before_pass(*this, _statistics.generation); }
        _drained = _queue->drain();
        for (const auto &mutation : _drained) {
            if (_apply(mutation)) {
                ++_statistics.mutations_applied;
            } else {
                ++_statistics.mutations_dropped;
                auto description = describe(mutation);
                for (const auto &observer : _observers) { observer->on_mutation_dropped(description); }
            }
        }
    }

    bool Cache::_apply(const PendingMutation &mutation) {
        auto generation = _statistics.generation;
        return std::visit(
            [&]<typename M>(const M &m) -> bool {
                if constexpr (std::is_same_v<M, StateWrite>) {
                    return _tracker.write_cell(m.cell, m.value.ptr(), generation);
                } else if constexpr (std::is_same_v<M, StateUpdate>) {
                    return _tracker.update_cell(m.cell, m.meta, m.fn, generation);
                } else {
                    return _tracker.mark_dirty(m.group);
                }
            },
            mutation);
    }

    void Cache::_commit_pass() {
        _table.commit();
        _context.reset();
        _pass_state.reset();
        _drained.clear();
        _generation = _statistics.generation;
        _tracker.commit(
            [this](GroupId group, const CallTag &tag, CallKey key, std::size_t depth) {
                ++_statistics.torn_down;
                GroupEvent event{.group = group, .tag = tag, .key = key, .depth = depth, .generation = _generation};
                for (const auto &observer : _observers) { observer->on_group_torn_down(event); }
            },
            [this](GroupId group, const std::exception &e) { _report_hook_failure(group, e); });
        _last_statistics = _statistics;
        if (_options.dump_after_pass) { dump(stderr); }
        for (const auto &observer : _observers) { observer->on_after_pass(*this, _last_statistics); }
    }

    void Cache::_abandon_pass(std::string_view reason) {
        _context.reset();
        _pass_state.reset();
        _tracker.rollback();
        _table.rollback();
        _queue->restore_front(std::move(_drained));
        _drained.clear();
        for (const auto &observer : _observers) {
            observer->on_pass_abandoned(*this, _statistics.generation, reason);
        }
    }

    void Cache::_report_hook_failure(GroupId group, const std::exception &e) {
        fmt::print(stderr, "recache[{}]: teardown hook of group {} failed: {}\n", _options.label, group, e.what());
        for (const auto &observer : _observers) { observer->on_teardown_failure(group, e.what()); }
    }

} // namespace recache
