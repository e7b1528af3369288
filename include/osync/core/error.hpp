#pragma once

#include <string>

namespace osync {

/**
 * @brief Error taxonomy shared by every sync component
 *
 * RETRY POLICY BY KIND:
 * - Network: retried by the engine with exponential backoff, then surfaced
 * - Auth: never retried; the session pauses until credentials are refreshed
 * - Validation: terminal for one ChangeRecord, other entities proceed
 * - VersionIncompatible: record skipped and reported, retried next session
 * - ConflictUnresolved: entity queue blocked until manual resolution
 * Remaining kinds are local failures surfaced as-is.
 */
enum class ErrorKind {
    Network,
    Auth,
    Validation,
    VersionIncompatible,
    ConflictUnresolved,
    Storage,
    Parse,
    NotFound,
    InvalidArgument,
    InvalidState,
    Cancelled,
    Timeout
};

struct Error {
    ErrorKind kind = ErrorKind::InvalidState;
    std::string message;

    [[nodiscard]] bool retryable() const noexcept {
        return kind == ErrorKind::Network || kind == ErrorKind::Timeout;
    }
};

inline Error make_error(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

const char* to_string(ErrorKind kind) noexcept;

} // namespace osync
