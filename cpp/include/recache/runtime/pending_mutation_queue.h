//
// The write-back log: mutations requested outside of (or during) a pass, applied at the start of the next pass.
//

#ifndef RECACHE_PENDING_MUTATION_QUEUE_H
#define RECACHE_PENDING_MUTATION_QUEUE_H

#include <recache/recache_base.h>
#include <recache/types/value/scalar_type.h>

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace recache {

    struct StateWrite {
        CellId cell{NO_CELL};
        value::TypedValue value;
    };

    struct StateUpdate {
        CellId cell{NO_CELL};
        const value::TypeMeta *meta{nullptr};
        std::function<void(value::TypedPtr)> fn;
    };

    struct GroupInvalidation {
        GroupId group{NO_GROUP};
    };

    using PendingMutation = std::variant<StateWrite, StateUpdate, GroupInvalidation>;

    RECACHE_EXPORT std::string describe(const PendingMutation &mutation);

    /**
     * FIFO of pending mutations, safe to push to from any thread.
     *
     * Items pushed by one thread are drained in the order they were pushed. A drained batch that could not be
     * applied (the pass was abandoned) is put back in front of anything pushed since.
     */
    class RECACHE_EXPORT PendingMutationQueue {
    public:
        void push(PendingMutation mutation);

        [[nodiscard]] std::vector<PendingMutation> drain();

        void restore_front(std::vector<PendingMutation> mutations);

        [[nodiscard]] bool empty() const;

        [[nodiscard]] std::size_t size() const;

    private:
        mutable std::mutex _mutex;
        std::deque<PendingMutation> _items;
    };

} // namespace recache

#endif //RECACHE_PENDING_MUTATION_QUEUE_H
