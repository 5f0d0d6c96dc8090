#include <recache/types/call_key.h>

namespace recache {

    CallSiteId CallSiteId::here(std::source_location loc) {
        auto h = fnv1a_64(loc.file_name());
        h = fnv1a_64(fmt::format(":{}:{}", loc.line(), loc.column()), h);
        // Never hand out one of the reserved ids
        if (h >= memo_result().value) { h -= 3; }
        return CallSiteId{h};
    }

    std::string_view to_string(IdentityStrategy strategy) {
        switch (strategy) {
            case IdentityStrategy::Positional: return "positional";
            case IdentityStrategy::Keyed: return "keyed";
        }
        return "unknown";
    }

    std::string CallTag::to_string() const {
        if (site == CallSiteId::root()) { return "<root>"; }
        if (site == CallSiteId::memo_args()) { return "<args>"; }
        if (site == CallSiteId::memo_result()) { return "<result>"; }
        if (is_keyed()) { return fmt::format("{:016X}[key={:016X}]", site.value, discriminator); }
        return fmt::format("{:016X}#{}", site.value, discriminator);
    }

    CallKey CallKey::chain(CallKey parent, const CallTag &tag) {
        auto h = ankerl::unordered_dense::hash<std::uint64_t>{}(parent.value ^ 0x9E3779B97F4A7C15ULL);
        h ^= CallTagHash{}(tag) + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2);
        return CallKey{h};
    }

} // namespace recache
