#pragma once

/// @file token_rejection.hpp
/// @brief Uniform rejection of token redemption and validation attempts.
///
/// Every redemption failure (unknown, consumed, revoked, expired, binding
/// or PKCE mismatch, ciphertext mismatch) reaches the caller as the same
/// InvalidToken error. Only the log records which condition fired.

#include <string>
#include <string_view>

#include "cas/foundation/auth_error.hpp"
#include "cas/foundation/auth_logger.hpp"

namespace cas::service::detail {

inline constexpr std::string_view kInvalidTokenMessage = "invalid or expired token";

/// The single error returned for every rejected token.
[[nodiscard]] inline foundation::AuthError invalidTokenError() {
    return foundation::AuthError(foundation::ErrorCode::InvalidToken,
                                 std::string(kInvalidTokenMessage));
}

/// Log the concrete rejection reason and return the generic error.
[[nodiscard]] inline foundation::AuthError rejectToken(std::string_view kind,
                                                       std::string_view reason,
                                                       foundation::LogContext ctx = {}) {
    ctx.extra["reason"] = std::string(reason);
    CAS_LOG_CTX(foundation::LogLevel::Warning, foundation::LogCategory::Token,
                std::string(kind) + " rejected", ctx);
    return invalidTokenError();
}

}  // namespace cas::service::detail
