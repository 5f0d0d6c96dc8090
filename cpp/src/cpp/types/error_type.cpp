#include <recache/types/error_type.h>

namespace recache {

    std::string_view to_string(CacheErrorKind kind) {
        switch (kind) {
            case CacheErrorKind::Usage: return "UsageError";
            case CacheErrorKind::Reentrancy: return "ReentrancyError";
            case CacheErrorKind::StaleHandle: return "StaleHandleError";
        }
        return "CacheError";
    }

    std::ostream &operator<<(std::ostream &os, CacheErrorKind kind) { return os << to_string(kind); }

    CacheError::CacheError(CacheErrorKind kind, const std::string &msg)
        : std::runtime_error{fmt::format("[{}] {}", kind, msg)}, _kind{kind} {
    }

    UsageError::UsageError(const std::string &msg) : CacheError{CacheErrorKind::Usage, msg} {}

    ReentrancyError::ReentrancyError(const std::string &msg) : CacheError{CacheErrorKind::Reentrancy, msg} {}

    StaleHandleError::StaleHandleError(const std::string &msg) : CacheError{CacheErrorKind::StaleHandle, msg} {}

} // namespace recache
