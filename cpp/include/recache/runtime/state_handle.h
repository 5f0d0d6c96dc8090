//
// Handles to state cells, handed out by CacheContext::state.
//

#ifndef RECACHE_STATE_HANDLE_H
#define RECACHE_STATE_HANDLE_H

#include <recache/runtime/pending_mutation_queue.h>
#include <recache/types/error_type.h>
#include <recache/util/errors.h>

#include <concepts>
#include <utility>

namespace recache {

    // Alive exactly as long as one pass runs
    struct PassState {
        generation_t generation{NO_GENERATION};
        cache_context_ptr context{nullptr};
    };

    // Registers a read of cell on the group the pass is currently in
    RECACHE_EXPORT void record_state_read(const PassState &pass, CellId cell);

    /**
     * Queues writes to a state cell. Usable from any thread while the cache is alive; the write is applied at
     * the start of the next pass.
     */
    template<typename T>
    class StateSetter {
    public:
        StateSetter() = default;

        void set(T value) const {
            queue()->push(StateWrite{_cell, value::TypedValue::of(std::move(value))});
        }

        void operator()(T value) const { set(std::move(value)); }

        template<typename Fn>
            requires std::invocable<Fn &, T &> && std::copy_constructible<Fn>
        void update(Fn fn) const {
            queue()->push(StateUpdate{
                _cell, value::scalar_type_meta<T>(),
                [fn = std::move(fn)](value::TypedPtr p) mutable { fn(p.as<T>()); }});
        }

        [[nodiscard]] CellId cell() const { return _cell; }

        // False once the cache that owns the cell is destroyed
        [[nodiscard]] bool valid() const { return !_queue.expired(); }

    protected:
        StateSetter(pending_mutation_queue_w_ptr queue, CellId cell) : _queue{std::move(queue)}, _cell{cell} {}

        [[nodiscard]] pending_mutation_queue_s_ptr queue() const {
            auto q = _queue.lock();
            if (!q) { throw_error<StaleHandleError>("State cell {} belongs to a cache that no longer exists", _cell); }
            return q;
        }

        pending_mutation_queue_w_ptr _queue;
        CellId _cell{NO_CELL};

        template<typename>
        friend class StateHandle;
    };

    /**
     * Read access to a state cell during the pass that produced the handle, plus the deferred writes of
     * StateSetter. Reading registers the cell as a dependency of the group the read happens in.
     */
    template<typename T>
    class StateHandle {
    public:
        StateHandle() = default;

        [[nodiscard]] const T &get() const {
            auto pass = _pass.lock();
            if (!pass) {
                throw_error<StaleHandleError>("State cell {} read outside of the pass that produced the handle",
                                              _setter.cell());
            }
            record_state_read(*pass, _setter.cell());
            return *_value;
        }

        [[nodiscard]] const T &operator*() const { return get(); }

        const T *operator->() const { return &get(); }

        void set(T value) const { _setter.set(std::move(value)); }

        template<typename Fn>
            requires std::invocable<Fn &, T &> && std::copy_constructible<Fn>
        void update(Fn fn) const {
            _setter.update(std::move(fn));
        }

        [[nodiscard]] StateSetter<T> setter() const { return _setter; }

        [[nodiscard]] CellId cell() const { return _setter.cell(); }

        // True while the pass that produced the handle runs
        [[nodiscard]] bool readable() const { return !_pass.expired(); }

    private:
        StateHandle(pass_state_w_ptr pass, pending_mutation_queue_w_ptr queue, CellId cell, const T *value)
            : _pass{std::move(pass)}, _setter{std::move(queue), cell}, _value{value} {
        }

        pass_state_w_ptr _pass;
        StateSetter<T> _setter;
        const T *_value{nullptr};

        friend class CacheContext;
    };

} // namespace recache

#endif //RECACHE_STATE_HANDLE_H
