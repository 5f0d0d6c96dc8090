#ifndef RECACHE_UTIL_CACHE_CELL_H
#define RECACHE_UTIL_CACHE_CELL_H

#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <utility>

namespace recache {

    /**
     * A single-entry memo that lives outside of any cache: holds the value computed for the last arguments and
     * recomputes only when called with different arguments.
     *
     * Usage:
     *   CacheCell<std::string, Layout> layout;
     *   const Layout &l = layout.get(text, [&] { return compute_layout(text); });
     */
    template<typename Args, typename T>
        requires std::copyable<Args> && std::equality_comparable<Args>
    class CacheCell {
    public:
        CacheCell() = default;

        template<typename Fn>
            requires std::invocable<Fn &> && std::convertible_to<std::invoke_result_t<Fn &>, T>
        const T &get(const Args &args, Fn &&compute) {
            if (!_entry || !(_entry->first == args)) {
                _entry.reset();
                _entry.emplace(args, std::invoke(compute));
                ++_computations;
            }
            return _entry->second;
        }

        [[nodiscard]] bool has_value() const { return _entry.has_value(); }

        // Arguments the cached value was computed with
        [[nodiscard]] const Args *arguments() const { return _entry ? &_entry->first : nullptr; }

        [[nodiscard]] std::size_t computations() const { return _computations; }

        void reset() { _entry.reset(); }

    private:
        std::optional<std::pair<Args, T>> _entry;
        std::size_t _computations{0};
    };

} // namespace recache

#endif // RECACHE_UTIL_CACHE_CELL_H
