#ifndef RECACHE_INVALIDATION_TOKEN_H
#define RECACHE_INVALIDATION_TOKEN_H

#include <recache/runtime/pending_mutation_queue.h>

namespace recache {

    /**
     * Marks one group dirty from outside a pass. Copyable and usable from any thread; the group is marked at
     * the start of the next pass, and the mark is dropped if the group was torn down in the meantime.
     */
    class RECACHE_EXPORT InvalidationToken {
    public:
        InvalidationToken() = default;

        // False when the cache that issued the token is gone
        bool invalidate() const;

        [[nodiscard]] GroupId group() const { return _group; }

        [[nodiscard]] bool valid() const { return _group != NO_GROUP && !_queue.expired(); }

        // True when the token was issued by the cache owning queue
        [[nodiscard]] bool issued_by(const pending_mutation_queue_s_ptr &queue) const;

        bool operator==(const InvalidationToken &other) const {
            return _group == other._group && !_queue.owner_before(other._queue) && !other._queue.owner_before(_queue);
        }

    private:
        InvalidationToken(pending_mutation_queue_w_ptr queue, GroupId group) : _queue{std::move(queue)}, _group{group} {}

        pending_mutation_queue_w_ptr _queue;
        GroupId _group{NO_GROUP};

        friend class CacheContext;
    };

} // namespace recache

#endif //RECACHE_INVALIDATION_TOKEN_H
