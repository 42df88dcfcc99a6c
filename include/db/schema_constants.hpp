#pragma once

#include <string_view>

namespace tempo::db {

// information_schema yes/no columns
inline constexpr std::string_view kYes    = "YES";
inline constexpr std::string_view kYesLow = "yes";

// boolean columns in text result format
inline constexpr std::string_view kPgTrue = "t";

inline constexpr std::string_view kDefaultSchema = "public";

// ============================================================================
// SQLSTATE codes
// ============================================================================

inline constexpr std::string_view kCannotConnect          = "08001";
inline constexpr std::string_view kConnectionDoesNotExist = "08003";
inline constexpr std::string_view kConnectionFailure      = "08006";
inline constexpr std::string_view kUniqueViolation        = "23505";
inline constexpr std::string_view kSerializationFailure   = "40001";
inline constexpr std::string_view kDeadlockDetected       = "40P01";
inline constexpr std::string_view kQueryCanceled          = "57014";

/**
 * @brief Whether the same statement can succeed when simply tried again
 *
 * Connection exceptions (08), serialization failures, deadlocks,
 * insufficient resources (53) and server shutdown/startup (57P).
 */
[[nodiscard]] constexpr bool is_transient_state(std::string_view state) {
    return state.starts_with("08")
        || state == kSerializationFailure
        || state == kDeadlockDetected
        || state.starts_with("53")
        || state.starts_with("57P");
}

} // namespace tempo::db
