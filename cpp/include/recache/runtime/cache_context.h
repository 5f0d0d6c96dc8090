//
// The API a rebuild function talks to during a pass.
//

#ifndef RECACHE_CACHE_CONTEXT_H
#define RECACHE_CACHE_CONTEXT_H

#include <recache/runtime/invalidation_token.h>
#include <recache/runtime/observers/pass_observer.h>
#include <recache/runtime/slot_writer.h>
#include <recache/runtime/state_handle.h>

#include <ankerl/unordered_dense.h>

#include <concepts>
#include <functional>
#include <optional>
#include <type_traits>
#include <vector>

namespace recache {

    template<typename Body>
    using group_result_t = std::decay_t<std::invoke_result_t<Body &, CacheContext &>>;

    template<typename Body>
    concept GroupBody = std::invocable<Body &, CacheContext &> &&
                        (std::is_void_v<group_result_t<Body>> || std::copy_constructible<group_result_t<Body>>);

    template<typename Init>
    using state_type_t = std::decay_t<std::invoke_result_t<Init &>>;

    template<typename Init>
    concept StateInit = std::invocable<Init &> && std::copyable<state_type_t<Init>>;

    template<typename T>
    concept Memoizable = std::copyable<T> && std::equality_comparable<T>;

    /**
     * Cursor and bookkeeping of one pass, handed to every group body.
     *
     * Calls are identified by the call-site id the caller passes plus either the occurrence count of that site in
     * the enclosing group (positional calls) or a key (keyed calls). A call made from a loop should be keyed,
     * otherwise inserting an element in front re-associates every later element with its neighbour's state.
     *
     * A group body runs when:
     *  - the enclosing group is dirty, or the group itself is dirty or read a cell written since it last ran;
     *    every group below is then dirty as well;
     *  - the group is new, its arguments differ from the last run, or it has no stored result yet;
     *  - a group below it is dirty (the body is traversed, clean children still skip).
     * Otherwise the body is skipped and the stored result returned.
     *
     * Writes to state are never visible in the pass they are made in; they are applied at the start of the next
     * pass.
     */
    class RECACHE_EXPORT CacheContext {
    public:
        CacheContext(SlotTable &table, InvalidationTracker &tracker, pending_mutation_queue_w_ptr queue,
                     pass_state_w_ptr pass, const std::vector<pass_observer_s_ptr> &observers,
                     PassStatistics &statistics, generation_t generation, std::size_t max_search_distance);

        CacheContext(const CacheContext &) = delete;
        CacheContext &operator=(const CacheContext &) = delete;

        /**
         * Returns the state cell of this call, creating it with init() on the first visit.
         * A change of the state type between passes discards the old cell.
         */
        template<typename Init>
            requires StateInit<Init>
        StateHandle<state_type_t<Init>> state(CallSiteId site, Init &&init) {
            return _state<state_type_t<Init>>(_positional_tag(site), init);
        }

        template<typename K, typename Init>
            requires StateInit<Init>
        StateHandle<state_type_t<Init>> keyed_state(CallSiteId site, const K &key, Init &&init) {
            return _state<state_type_t<Init>>(_keyed_tag(site, key_hash(key), false), init);
        }

        template<typename Body>
            requires GroupBody<Body>
        group_result_t<Body> group(CallSiteId site, Body &&body) {
            return _run_group<group_result_t<Body>>(_positional_tag(site), std::nullopt, body);
        }

        template<typename K, typename Body>
            requires GroupBody<Body>
        group_result_t<Body> keyed_group(CallSiteId site, const K &key, Body &&body) {
            return _run_group<group_result_t<Body>>(_keyed_tag(site, key_hash(key), true), std::nullopt, body);
        }

        // A group that also runs when args differ from the previous pass
        template<typename Args, typename Body>
            requires Memoizable<Args> && GroupBody<Body>
        group_result_t<Body> memoize(CallSiteId site, const Args &args, Body &&body) {
            return _run_group<group_result_t<Body>>(_positional_tag(site), value::TypedValue::of(args), body);
        }

        template<typename K, typename Args, typename Body>
            requires Memoizable<Args> && GroupBody<Body>
        group_result_t<Body> keyed_memoize(CallSiteId site, const K &key, const Args &args, Body &&body) {
            return _run_group<group_result_t<Body>>(_keyed_tag(site, key_hash(key), true), value::TypedValue::of(args),
                                                    body);
        }

        // True when value differs from the value passed at this call site in the previous pass (or on first use)
        template<typename T>
            requires Memoizable<T>
        bool changed(CallSiteId site, const T &value) {
            auto index = _writer.claim_value(_positional_tag(site));
            if (auto *existing = _writer.typed_value_at(index);
                existing != nullptr && existing->template is<T>() && existing->template as<T>() == value) {
                return false;
            }
            _writer.write_value(index, value::TypedValue::of(value), _generation);
            return true;
        }

        /**
         * Explicit group brackets. Returns false when the group could be skipped, in which case the caller should
         * call skip_to_end() before end_group().
         */
        bool begin_group(CallSiteId site);

        template<typename K>
        bool begin_keyed_group(CallSiteId site, const K &key) {
            return _begin_bracket(_keyed_tag(site, key_hash(key), true));
        }

        // Keeps the recorded content of a group opened with begin_group, only valid when begin_group returned false
        void skip_to_end();

        void end_group();

        // Token marking the current group dirty
        [[nodiscard]] InvalidationToken invalidation_token() const;

        /**
         * Called once when the current group is torn down. Hooks registered by a run of the body replace those of
         * its earlier runs, so a body may register its cleanup on every run.
         */
        void on_teardown(std::function<void()> hook);

        // The current group runs because it, or a group above it, is dirty
        [[nodiscard]] bool is_dirty() const;

        [[nodiscard]] CallKey current_call_key() const;

        [[nodiscard]] GroupId current_group() const;

        // Generation stamped by this pass
        [[nodiscard]] generation_t generation() const { return _generation; }

        [[nodiscard]] std::size_t depth() const { return _frames.size(); }

        [[nodiscard]] SlotTable::index_t position() const { return _writer.position(); }

    private:
        enum class RunMode : std::uint8_t { Evaluate, Traverse, Skip };

        struct ContextFrame {
            GroupId group{NO_GROUP};
            CallTag tag{};
            CallKey key{};
            bool forced{false};
            bool bracket{false};
            RunMode mode{RunMode::Evaluate};
            ankerl::unordered_dense::map<std::uint64_t, std::uint64_t> occurrences;
            // Keys in use, separately for groups and for state cells
            ankerl::unordered_dense::set<CallTag, CallTagHash> group_keys;
            ankerl::unordered_dense::set<CallTag, CallTagHash> state_keys;
        };

        CallTag _positional_tag(CallSiteId site);
        CallTag _keyed_tag(CallSiteId site, std::uint64_t hash, bool group);

        SlotWriter::GroupEntry _enter_group(const CallTag &tag);
        GroupId _recreate_group();
        bool _store_args(SlotWriter::index_t index, value::TypedValue args);
        RunMode _decide(bool created, bool args_changed, bool has_result);
        void _leave_group();
        void _check_balanced(std::size_t depth) const;
        bool _begin_bracket(const CallTag &tag);
        ContextFrame &_frame();
        [[nodiscard]] const ContextFrame &_frame() const;
        [[nodiscard]] GroupEvent _event(const ContextFrame &frame) const;

        void _enter_root();
        void _leave_root();

        void _record_read(CellId cell);

        template<typename T, typename Init>
        StateHandle<T> _state(const CallTag &tag, Init &init) {
            auto index = _writer.claim_value(tag);
            if (auto *meta = _writer.value_meta(index); meta != nullptr && meta != value::scalar_type_meta<T>()) {
                _writer.reset_value(index);
            }
            if (!_writer.has_value(index)) {
                auto storage = value::TypedValue::create<T>(std::invoke(init));
                auto cell = _tracker.create_cell(current_group(), storage.ptr(), _generation);
                _writer.write_value(index, std::move(storage), _generation, cell);
            }
            return StateHandle<T>(_pass, _queue, _writer.cell_at(index), _writer.read_value<T>(index));
        }

        template<typename R, typename Body>
        R _run_group(const CallTag &tag, std::optional<value::TypedValue> args, Body &body) {
            auto entry = _enter_group(tag);
            std::optional<SlotWriter::index_t> args_index;
            std::optional<SlotWriter::index_t> result_index;
            if (args) { args_index = _writer.claim_value(CallTag::positional(CallSiteId::memo_args(), 0)); }
            if constexpr (!std::is_void_v<R>) {
                result_index = _writer.claim_value(CallTag::positional(CallSiteId::memo_result(), 0));
                auto *meta = _writer.value_meta(*result_index);
                if (meta != nullptr && meta != value::scalar_type_meta<R>()) {
                    // The result type changed, nothing recorded below can be trusted
                    _recreate_group();
                    entry.created = true;
                    if (args) { args_index = _writer.claim_value(CallTag::positional(CallSiteId::memo_args(), 0)); }
                    result_index = _writer.claim_value(CallTag::positional(CallSiteId::memo_result(), 0));
                }
            }
            bool args_changed = args && _store_args(*args_index, std::move(*args));
            bool has_result = !result_index || _writer.has_value(*result_index);

            if (_decide(entry.created, args_changed, has_result) == RunMode::Skip) {
                if constexpr (std::is_void_v<R>) {
                    _leave_group();
                    return;
                } else {
                    R cached = *_writer.read_value<R>(*result_index);
                    _leave_group();
                    return cached;
                }
            }

            auto depth = _frames.size();
            if constexpr (std::is_void_v<R>) {
                std::invoke(body, *this);
                _check_balanced(depth);
                _leave_group();
            } else {
                R result = std::invoke(body, *this);
                _check_balanced(depth);
                _writer.write_value(*result_index, value::TypedValue::create<R>(result), _generation);
                _leave_group();
                return result;
            }
        }

        template<typename Fn>
        auto _run_root(Fn &fn) -> group_result_t<Fn> {
            _enter_root();
            if constexpr (std::is_void_v<group_result_t<Fn>>) {
                std::invoke(fn, *this);
                _leave_root();
            } else {
                group_result_t<Fn> result = std::invoke(fn, *this);
                _leave_root();
                return result;
            }
        }

        template<typename Hook, typename... Args>
        void _notify(Hook hook, const Args &...args) const {
            for (const auto &observer : _observers) { ((*observer).*hook)(args...); }
        }

        InvalidationTracker &_tracker;
        SlotWriter _writer;
        pending_mutation_queue_w_ptr _queue;
        pass_state_w_ptr _pass;
        const std::vector<pass_observer_s_ptr> &_observers;
        PassStatistics &_statistics;
        generation_t _generation;
        std::vector<ContextFrame> _frames;

        friend class Cache;
        friend void record_state_read(const PassState &pass, CellId cell);
    };

} // namespace recache

#endif //RECACHE_CACHE_CONTEXT_H
