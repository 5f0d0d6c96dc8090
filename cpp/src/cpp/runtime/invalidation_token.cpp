#include <recache/runtime/invalidation_token.h>

namespace recache {

    bool InvalidationToken::invalidate() const {
        if (_group == NO_GROUP) { return false; }
        auto queue = _queue.lock();
        if (!queue) { return false; }
        queue->push(GroupInvalidation{_group});
        return true;
    }

    bool InvalidationToken::issued_by(const pending_mutation_queue_s_ptr &queue) const {
        return queue != nullptr && _queue.lock() == queue;
    }

} // namespace recache
