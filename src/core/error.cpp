#include "osync/core/error.hpp"

namespace osync {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Network: return "network";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::VersionIncompatible: return "version_incompatible";
        case ErrorKind::ConflictUnresolved: return "conflict_unresolved";
        case ErrorKind::Storage: return "storage";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::InvalidState: return "invalid_state";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Timeout: return "timeout";
    }
    return "unknown";
}

} // namespace osync
