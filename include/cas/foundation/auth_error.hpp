#pragma once

/// @file auth_error.hpp
/// @brief Error type used with Result<T, AuthError>.

#include <string>
#include <string_view>
#include <utility>

#include "cas/foundation/error_code.hpp"

namespace cas::foundation {

/// Error carrying a categorized code and a human-readable message.
///
/// Messages returned from token redemption paths are deliberately generic;
/// the precise rejection reason only goes to the log.
class AuthError {
public:
    AuthError() = default;

    explicit AuthError(ErrorCode code)
        : code_(code) {}

    AuthError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Check if this represents a success (no error).
    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace cas::foundation
