//
// Owner of the slot table and driver of passes.
//

#ifndef RECACHE_CACHE_H
#define RECACHE_CACHE_H

#include <recache/runtime/cache_context.h>
#include <recache/runtime/cache_options.h>

#include <cstdio>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace recache {

    /**
     * A positional memoization cache.
     *
     * run_pass() runs one rebuild: queued mutations are applied, then the root function is called with a
     * CacheContext and every group, state cell and value it reaches is matched against the previous pass.
     * When the root function returns, whatever it no longer reached is torn down and the generation advances.
     *
     * If anything escapes the root function the pass is abandoned: the table and the tracker are restored,
     * the applied mutations are queued again, no teardown hook fires and the generation does not advance.
     * The exception is rethrown unchanged.
     *
     * Passes run one at a time on the calling thread. State setters and invalidation tokens may be used from
     * any thread.
     */
    class RECACHE_EXPORT Cache {
    public:
        explicit Cache(CacheOptions options = {});

        ~Cache();

        Cache(const Cache &) = delete;
        Cache &operator=(const Cache &) = delete;
        Cache(Cache &&) = delete;
        Cache &operator=(Cache &&) = delete;

        template<typename Fn>
            requires std::invocable<Fn &, CacheContext &>
        group_result_t<Fn> run_pass(Fn &&fn) {
            using R = group_result_t<Fn>;
            _begin_pass();
            if constexpr (std::is_void_v<R>) {
                _guarded([&] {
                    _apply_pending();
                    _context->_run_root(fn);
                });
                _commit_pass();
            } else {
                std::optional<R> result;
                _guarded([&] {
                    _apply_pending();
                    result.emplace(_context->_run_root(fn));
                });
                _commit_pass();
                return std::move(*result);
            }
        }

        /**
         * Runs passes until no mutation is pending, at most max_passes. Writes made by a pass are applied by the
         * next one, so a root function that writes state on every pass never settles; has_pending_mutations()
         * tells whether the limit was hit.
         */
        template<typename Fn>
            requires std::invocable<Fn &, CacheContext &>
        group_result_t<Fn> run_until_settled(Fn &&fn, std::size_t max_passes = 16) {
            if (max_passes == 0) { throw_error<UsageError>("run_until_settled() needs at least one pass"); }
            for (std::size_t pass = 1;; ++pass) {
                if constexpr (std::is_void_v<group_result_t<Fn>>) {
                    run_pass(fn);
                    if (pass >= max_passes || !has_pending_mutations()) { return; }
                } else {
                    auto result = run_pass(fn);
                    if (pass >= max_passes || !has_pending_mutations()) { return result; }
                }
            }
        }

        // Queues an invalidation of the token's group, false for an empty token or a token of another cache
        bool invalidate(const InvalidationToken &token);

        [[nodiscard]] bool has_pending_mutations() const;

        // Number of committed passes
        [[nodiscard]] generation_t generation() const { return _generation; }

        [[nodiscard]] bool in_pass() const { return _context.has_value(); }

        [[nodiscard]] const PassStatistics &last_pass_statistics() const { return _last_statistics; }

        [[nodiscard]] const CacheOptions &options() const { return _options; }

        [[nodiscard]] const std::string &label() const { return _options.label; }

        [[nodiscard]] std::size_t slot_count() const { return _table.size(); }

        [[nodiscard]] std::size_t group_count() const { return _tracker.group_count(); }

        [[nodiscard]] std::size_t cell_count() const { return _tracker.cell_count(); }

        [[nodiscard]] const SlotTable &table() const { return _table; }

        [[nodiscard]] const InvalidationTracker &tracker() const { return _tracker; }

        void dump(std::FILE *out = stderr) const;

        [[nodiscard]] std::string dump_string() const;

        // Observers can only be changed between passes
        void add_observer(pass_observer_s_ptr observer);

        void remove_observer(const pass_observer_s_ptr &observer);

    private:
        template<typename F>
        void _guarded(F &&f) {
            try {
                f();
            } catch (const std::exception &e) {
                _abandon_pass(e.what());
                throw;
            } catch (...) {
                _abandon_pass("non-standard exception");
                throw;
            }
        }

        void _begin_pass();
        void _apply_pending();
        bool _apply(const PendingMutation &mutation);
        void _commit_pass();
        void _abandon_pass(std::string_view reason);
        void _report_hook_failure(GroupId group, const std::exception &e);

        CacheOptions _options;
        SlotTable _table;
        InvalidationTracker _tracker;
        pending_mutation_queue_s_ptr _queue;
        pass_state_s_ptr _pass_state;
        std::optional<CacheContext> _context;
        std::vector<pass_observer_s_ptr> _observers;
        std::vector<PendingMutation> _drained;
        generation_t _generation{NO_GENERATION};
        PassStatistics _statistics;
        PassStatistics _last_statistics;
    };

} // namespace recache

#endif //RECACHE_CACHE_H
