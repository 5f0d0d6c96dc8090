#ifndef RECACHE_PASS_STATISTICS_H
#define RECACHE_PASS_STATISTICS_H

#include <recache/recache_base.h>

#include <string>

namespace recache {

    /**
     * Counters of one pass. The root group is not counted.
     * evaluated: bodies run because the group was new, dirty, stale or had different arguments.
     * traversed: bodies run only to reach a dirty descendant.
     */
    struct PassStatistics {
        generation_t generation{NO_GENERATION};
        std::size_t evaluated{0};
        std::size_t traversed{0};
        std::size_t skipped{0};
        std::size_t created{0};
        std::size_t torn_down{0};
        std::size_t mutations_applied{0};
        std::size_t mutations_dropped{0};

        [[nodiscard]] std::string to_string() const {
            return fmt::format("generation={} evaluated={} traversed={} skipped={} created={} torn_down={} "
                               "mutations_applied={} mutations_dropped={}",
                               generation, evaluated, traversed, skipped, created, torn_down, mutations_applied,
                               mutations_dropped);
        }
    };

} // namespace recache

#endif //RECACHE_PASS_STATISTICS_H
