#include <recache/runtime/cache.h>
#include <recache/runtime/observers/pass_trace.h>

namespace recache {

    PassTrace::PassTrace(const std::optional<std::string> &filter, bool pass, bool groups, bool skipped,
                         bool teardown, bool mutations)
        : _filter(filter), _pass(pass), _groups(groups), _skipped(skipped), _teardown(teardown),
          _mutations(mutations) {
    }

    void PassTrace::_print(const std::string &msg) const { fmt::print(_out, "[{}] {}\n", _generation, msg); }

    std::string PassTrace::_group_name(const GroupEvent &event) const {
        return fmt::format("{}{} {} #{}", std::string(event.depth * 2, ' '), event.key, event.tag, event.group);
    }

    void PassTrace::_print_group(const GroupEvent &event, std::string_view msg) const {
        _print(fmt::format("{} {}", _group_name(event), msg));
    }

    bool PassTrace::_should_log(const GroupEvent &event) const {
        if (!_filter.has_value()) { return true; }
        return _group_name(event).find(_filter.value()) != std::string::npos;
    }

    void PassTrace::on_before_pass(const Cache &cache, generation_t generation) {
        _generation = generation;
        if (_pass) {
            _print(fmt::format("{} Pass Start {} {}", std::string(20, '>'), cache.label(), std::string(20, '>')));
        }
    }

    void PassTrace::on_after_pass(const Cache &cache, const PassStatistics &statistics) {
        if (_pass) {
            _print(fmt::format("{} Pass Done {} {}", std::string(20, '<'), cache.label(), std::string(20, '<')));
            _print(statistics.to_string());
        }
    }

    void PassTrace::on_pass_abandoned(const Cache &cache, generation_t generation, std::string_view reason) {
        if (_pass) { _print(fmt::format("!! Pass {} of {} abandoned: {}", generation, cache.label(), reason)); }
    }

    void PassTrace::on_group_evaluated(const GroupEvent &event) {
        if (_groups && _should_log(event)) { _print_group(event, "[EVAL]"); }
    }

    void PassTrace::on_group_traversed(const GroupEvent &event) {
        if (_groups && _should_log(event)) { _print_group(event, "[TRAVERSE]"); }
    }

    void PassTrace::on_group_skipped(const GroupEvent &event) {
        if (_skipped && _should_log(event)) { _print_group(event, "[SKIP]"); }
    }

    void PassTrace::on_group_torn_down(const GroupEvent &event) {
        if (_teardown && _should_log(event)) { _print_group(event, "[TEARDOWN]"); }
    }

    void PassTrace::on_mutation_dropped(std::string_view description) {
        if (_mutations) { _print(fmt::format("Dropped mutation: {}", description)); }
    }

    void PassTrace::on_teardown_failure(GroupId group, std::string_view what) {
        if (_teardown) { _print(fmt::format("Teardown hook of group {} failed: {}", group, what)); }
    }

} // namespace recache
