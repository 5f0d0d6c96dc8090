#pragma once

#include <recache/runtime/observers/pass_observer.h>

#include <cstdio>
#include <optional>
#include <string>

namespace recache {

    /**
     * @brief Logs out the steps of every pass as the cache runs it.
     *
     * This is voluminous but can be helpful tracing down unexpected re-evaluation (or the lack of it).
     */
    class RECACHE_EXPORT PassTrace : public PassLifeCycleObserver {
    public:
        /**
         * @brief Construct a new Pass Trace object
         *
         * @param filter Used to restrict which group events to report (substring match on the call key and tag)
         * @param pass Log pass begin, end and abandon events
         * @param groups Log evaluated and traversed groups
         * @param skipped Log skipped groups
         * @param teardown Log torn down groups and teardown failures
         * @param mutations Log dropped mutations
         */
        explicit PassTrace(const std::optional<std::string> &filter = std::nullopt, bool pass = true,
                           bool groups = true, bool skipped = false, bool teardown = true, bool mutations = true);

        void on_before_pass(const Cache &cache, generation_t generation) override;
        void on_after_pass(const Cache &cache, const PassStatistics &statistics) override;
        void on_pass_abandoned(const Cache &cache, generation_t generation, std::string_view reason) override;
        void on_group_evaluated(const GroupEvent &event) override;
        void on_group_traversed(const GroupEvent &event) override;
        void on_group_skipped(const GroupEvent &event) override;
        void on_group_torn_down(const GroupEvent &event) override;
        void on_mutation_dropped(std::string_view description) override;
        void on_teardown_failure(GroupId group, std::string_view what) override;

        // Where the trace goes, stderr unless changed
        void set_output(std::FILE *out) { _out = out; }

    private:
        std::optional<std::string> _filter;
        bool _pass;
        bool _groups;
        bool _skipped;
        bool _teardown;
        bool _mutations;
        std::FILE *_out{stderr};
        generation_t _generation{NO_GENERATION};

        void _print(const std::string &msg) const;
        std::string _group_name(const GroupEvent &event) const;
        void _print_group(const GroupEvent &event, std::string_view msg) const;
        bool _should_log(const GroupEvent &event) const;
    };

} // namespace recache
