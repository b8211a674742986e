#pragma once

/// @file auth_result.hpp
/// @brief AuthResult<T> type alias for authentication-core error handling.

#include "cas/core/result.hpp"
#include "cas/foundation/auth_error.hpp"

namespace cas::foundation {

/// Result type specialized with AuthError.
///
/// Every store, crypto primitive and token service method that can fail
/// returns AuthResult<T> instead of throwing exceptions.
///
/// Example:
/// @code
///   AuthResult<int> resolveDays(int configured) {
///       if (configured < 1) {
///           return AuthResult<int>::err(
///               AuthError(ErrorCode::InvalidArgument, "lifetime must be positive"));
///       }
///       return AuthResult<int>::ok(configured);
///   }
/// @endcode
template <typename T>
using AuthResult = cas::Result<T, AuthError>;

}  // namespace cas::foundation
