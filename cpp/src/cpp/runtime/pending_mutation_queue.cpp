#include <recache/runtime/pending_mutation_queue.h>

#include <iterator>

namespace recache {

    std::string describe(const PendingMutation &mutation) {
        return std::visit(
            []<typename M>(const M &m) -> std::string {
                if constexpr (std::is_same_v<M, StateWrite>) {
                    return fmt::format("write cell={} value={}", m.cell, m.value.to_string());
                } else if constexpr (std::is_same_v<M, StateUpdate>) {
                    return fmt::format("update cell={} type={}", m.cell,
                                       m.meta ? m.meta->type_name_str() : std::string{"<none>"});
                } else {
                    return fmt::format("invalidate group={}", m.group);
                }
            },
            mutation);
    }

    void PendingMutationQueue::push(PendingMutation mutation) {
        std::lock_guard<std::mutex> lock(_mutex);
        _items.push_back(std::move(mutation));
    }

    std::vector<PendingMutation> PendingMutationQueue::drain() {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<PendingMutation> result;
        result.reserve(_items.size());
        std::move(_items.begin(), _items.end(), std::back_inserter(result));
        _items.clear();
        return result;
    }

    void PendingMutationQueue::restore_front(std::vector<PendingMutation> mutations) {
        std::lock_guard<std::mutex> lock(_mutex);
        _items.insert(_items.begin(), std::make_move_iterator(mutations.begin()),
                      std::make_move_iterator(mutations.end()));
    }

    bool PendingMutationQueue::empty() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _items.empty();
    }

    std::size_t PendingMutationQueue::size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _items.size();
    }

} // namespace recache
