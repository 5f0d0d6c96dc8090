//
// Error taxonomy of the cache. All errors abort the pass that raised them.
//

#ifndef RECACHE_ERROR_TYPE_H
#define RECACHE_ERROR_TYPE_H

#include <recache/recache_base.h>

#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace recache {

    enum class CacheErrorKind : std::uint8_t {
        Usage,       // bug in the rebuild function: duplicate key, type mismatch, unbalanced groups
        Reentrancy,  // a pass was started while another pass is active on the same cache
        StaleHandle, // a handle was used outside of the scope it is valid for
    };

    RECACHE_EXPORT std::string_view to_string(CacheErrorKind kind);

    RECACHE_EXPORT std::ostream &operator<<(std::ostream &os, CacheErrorKind kind);

    struct RECACHE_EXPORT CacheError : std::runtime_error {
        CacheError(CacheErrorKind kind, const std::string &msg);

        [[nodiscard]] CacheErrorKind kind() const noexcept { return _kind; }

    private:
        CacheErrorKind _kind;
    };

    /**
     * Raised when the rebuild function misuses the cache. These are never recovered from inside the pass, the
     * pass is rolled back and the error is handed to the host.
     */
    struct RECACHE_EXPORT UsageError : CacheError {
        explicit UsageError(const std::string &msg);
    };

    struct RECACHE_EXPORT ReentrancyError : CacheError {
        explicit ReentrancyError(const std::string &msg);
    };

    struct RECACHE_EXPORT StaleHandleError : CacheError {
        explicit StaleHandleError(const std::string &msg);
    };

} // namespace recache

template<>
struct fmt::formatter<recache::CacheErrorKind> : fmt::formatter<std::string_view> {
    auto format(recache::CacheErrorKind kind, fmt::format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(recache::to_string(kind), ctx);
    }
};

#endif  // RECACHE_ERROR_TYPE_H
