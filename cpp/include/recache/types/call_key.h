//
// Call-site identity: how a call made during a pass is matched to its record from the previous pass.
//

#ifndef RECACHE_CALL_KEY_H
#define RECACHE_CALL_KEY_H

#include <recache/recache_base.h>

#include <ankerl/unordered_dense.h>

#include <compare>
#include <cstdint>
#include <source_location>
#include <string>
#include <string_view>

namespace recache {

    constexpr std::uint64_t fnv1a_64(std::string_view text, std::uint64_t seed = 0xcbf29ce484222325ULL) {
        std::uint64_t h = seed;
        for (char c : text) {
            h ^= static_cast<std::uint8_t>(c);
            h *= 0x100000001b3ULL;
        }
        return h;
    }

    /**
     * Lexical identity of a call site, supplied by the caller.
     *
     * The id is explicit: an integer chosen by the caller, a name hashed at compile time, or a
     * std::source_location the caller passes in through here(). Nothing is inferred from the call stack.
     */
    struct RECACHE_EXPORT CallSiteId {
        std::uint64_t value{0};

        constexpr CallSiteId() = default;

        constexpr explicit CallSiteId(std::uint64_t v) : value{v} {}

        constexpr explicit CallSiteId(std::string_view name) : value{fnv1a_64(name)} {}

        /**
         * Identity of the calling line. The default argument is evaluated at the call site, so every
         * textual occurrence of CallSiteId::here() yields a distinct id.
         */
        static CallSiteId here(std::source_location loc = std::source_location::current());

        // Ids reserved for the slots the cache itself places inside a group
        static constexpr CallSiteId root() { return CallSiteId{~std::uint64_t{0}}; }
        static constexpr CallSiteId memo_args() { return CallSiteId{~std::uint64_t{0} - 1}; }
        static constexpr CallSiteId memo_result() { return CallSiteId{~std::uint64_t{0} - 2}; }

        [[nodiscard]] constexpr bool is_reserved() const { return value >= memo_result().value; }

        constexpr auto operator<=>(const CallSiteId &) const = default;
    };

    enum class IdentityStrategy : std::uint8_t {
        Positional, // (site, nth occurrence in the enclosing group this pass)
        Keyed,      // (site, hash of a caller supplied key)
    };

    RECACHE_EXPORT std::string_view to_string(IdentityStrategy strategy);

    /**
     * The tag recorded on every GroupStart, Value and Tag entry. Two entries of the same group never share a
     * tag; matching a call to its previous record is an equality test on the tag.
     */
    struct RECACHE_EXPORT CallTag {
        CallSiteId site{};
        std::uint64_t discriminator{0};
        IdentityStrategy strategy{IdentityStrategy::Positional};

        static constexpr CallTag positional(CallSiteId site, std::uint64_t ordinal) {
            return CallTag{site, ordinal, IdentityStrategy::Positional};
        }

        static constexpr CallTag keyed(CallSiteId site, std::uint64_t key_hash) {
            return CallTag{site, key_hash, IdentityStrategy::Keyed};
        }

        [[nodiscard]] constexpr bool is_keyed() const { return strategy == IdentityStrategy::Keyed; }

        constexpr bool operator==(const CallTag &) const = default;

        [[nodiscard]] std::string to_string() const;
    };

    struct CallTagHash {
        using is_avalanching = void;

        [[nodiscard]] std::uint64_t operator()(const CallTag &tag) const noexcept {
            auto h = ankerl::unordered_dense::hash<std::uint64_t>{}(tag.site.value);
            h ^= ankerl::unordered_dense::hash<std::uint64_t>{}(tag.discriminator * 0x9E3779B97F4A7C15ULL +
                                                                 static_cast<std::uint64_t>(tag.strategy));
            return h;
        }
    };

    /**
     * Hash of a caller supplied key. Keys that hash equal inside one group are reported as duplicates.
     */
    template<typename K>
    [[nodiscard]] std::uint64_t key_hash(const K &key) {
        return ankerl::unordered_dense::hash<K>{}(key);
    }

    /**
     * Path identity: the chain of tags from the root to a group, folded into one value.
     * Used for diagnostics and trace filtering, never for matching.
     */
    struct RECACHE_EXPORT CallKey {
        std::uint64_t value{0};

        [[nodiscard]] static CallKey chain(CallKey parent, const CallTag &tag);

        constexpr auto operator<=>(const CallKey &) const = default;
    };

} // namespace recache

template<>
struct fmt::formatter<recache::CallTag> : fmt::formatter<std::string> {
    auto format(const recache::CallTag &tag, fmt::format_context &ctx) const {
        return fmt::formatter<std::string>::format(tag.to_string(), ctx);
    }
};

template<>
struct fmt::formatter<recache::CallKey> : fmt::formatter<std::string> {
    auto format(const recache::CallKey &key, fmt::format_context &ctx) const {
        return fmt::formatter<std::string>::format(fmt::format("CallKey({:016X})", key.value), ctx);
    }
};

#endif //RECACHE_CALL_KEY_H
