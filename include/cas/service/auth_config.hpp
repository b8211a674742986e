#pragma once

/// @file auth_config.hpp
/// @brief Mapping of the YAML configuration onto AuthConfig.

#include "cas/foundation/auth_result.hpp"
#include "cas/foundation/config_manager.hpp"
#include "cas/service/token_types.hpp"

namespace cas::service {

/// Build an AuthConfig from dotted configuration keys.
///
/// Recognised keys (all optional):
///   jwt.issuer, jwt.audience, jwt.expiration_minutes, jwt.algorithm,
///   jwt.key_id, jwt.signing_key, jwt.rsa_key_bits,
///   data_protection.master_key,
///   client_secrets.pbkdf2_iterations,
///   authorization_code.lifetime_minutes,
///   mfa.lifetime_minutes, mfa.max_lifetime_minutes,
///   refresh_token.default_expiration_days
///
/// @return ConfigTypeMismatch for values of the wrong type, out of range,
///         or an unknown jwt.algorithm.
[[nodiscard]] foundation::AuthResult<AuthConfig> loadAuthConfig(
    const foundation::ConfigManager& config);

}  // namespace cas::service
