/// @file auth_config.cpp
/// @brief loadAuthConfig implementation.

#include "cas/service/auth_config.hpp"

#include <string>

#include "cas/foundation/auth_logger.hpp"

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::AuthResult;
using cas::foundation::ConfigManager;
using cas::foundation::ErrorCode;
using cas::foundation::LogCategory;

namespace {

AuthError outOfRange(std::string_view key, long long min, long long max) {
    return AuthError(ErrorCode::ConfigTypeMismatch,
                     std::string(key) + " must be between " + std::to_string(min) + " and " +
                         std::to_string(max));
}

/// Read an integer key, keep @p fallback when absent, reject values
/// outside [min, max].
AuthResult<long long> readBounded(const ConfigManager& config,
                                  std::string_view key,
                                  long long fallback,
                                  long long min,
                                  long long max) {
    auto value = config.getOr<long long>(key, fallback);
    if (!value) {
        return value;
    }
    if (value.value() < min || value.value() > max) {
        return AuthResult<long long>::err(outOfRange(key, min, max));
    }
    return value;
}

}  // anonymous namespace

AuthResult<AuthConfig> loadAuthConfig(const ConfigManager& config) {
    AuthConfig cfg;

    // -- jwt ------------------------------------------------------------------

    auto issuer = config.getOr<std::string>("jwt.issuer", cfg.jwt.issuer);
    if (!issuer) {
        return AuthResult<AuthConfig>::err(issuer.error());
    }
    cfg.jwt.issuer = std::move(issuer).value();

    auto audience = config.getOr<std::string>("jwt.audience", cfg.jwt.audience);
    if (!audience) {
        return AuthResult<AuthConfig>::err(audience.error());
    }
    cfg.jwt.audience = std::move(audience).value();

    auto expiration = readBounded(config, "jwt.expiration_minutes", 15, 1, 24 * 60);
    if (!expiration) {
        return AuthResult<AuthConfig>::err(expiration.error());
    }
    cfg.jwt.expiration = std::chrono::minutes(expiration.value());

    auto algorithm = config.getOr<std::string>(
        "jwt.algorithm", std::string(signatureAlgorithmName(cfg.jwt.algorithm)));
    if (!algorithm) {
        return AuthResult<AuthConfig>::err(algorithm.error());
    }
    auto parsed = parseSignatureAlgorithm(algorithm.value());
    if (!parsed) {
        return AuthResult<AuthConfig>::err(
            AuthError(ErrorCode::ConfigTypeMismatch,
                      "jwt.algorithm must be RS256, EdDSA or ML-DSA-65, got '" +
                          algorithm.value() + "'"));
    }
    cfg.jwt.algorithm = *parsed;

    auto keyId = config.getOr<std::string>("jwt.key_id", cfg.jwt.keyId);
    if (!keyId) {
        return AuthResult<AuthConfig>::err(keyId.error());
    }
    if (keyId.value().empty()) {
        return AuthResult<AuthConfig>::err(
            AuthError(ErrorCode::ConfigTypeMismatch, "jwt.key_id must not be empty"));
    }
    cfg.jwt.keyId = std::move(keyId).value();

    auto signingKey = config.getOr<std::string>("jwt.signing_key", "");
    if (!signingKey) {
        return AuthResult<AuthConfig>::err(signingKey.error());
    }
    cfg.jwt.signingKey = std::move(signingKey).value();

    auto rsaBits = readBounded(config, "jwt.rsa_key_bits", cfg.jwt.rsaKeyBits, 2048, 8192);
    if (!rsaBits) {
        return AuthResult<AuthConfig>::err(rsaBits.error());
    }
    cfg.jwt.rsaKeyBits = static_cast<uint32_t>(rsaBits.value());

    // -- data protection --------------------------------------------------------

    auto masterKey = config.getOr<std::string>("data_protection.master_key", "");
    if (!masterKey) {
        return AuthResult<AuthConfig>::err(masterKey.error());
    }
    cfg.dataProtection.masterKey = std::move(masterKey).value();

    // -- lifetimes and work factors ---------------------------------------------

    auto iterations = readBounded(config, "client_secrets.pbkdf2_iterations",
                                  cfg.secretHashIterations, 1000, 10'000'000);
    if (!iterations) {
        return AuthResult<AuthConfig>::err(iterations.error());
    }
    cfg.secretHashIterations = static_cast<uint32_t>(iterations.value());

    auto codeLifetime = readBounded(config, "authorization_code.lifetime_minutes", 10, 1, 60);
    if (!codeLifetime) {
        return AuthResult<AuthConfig>::err(codeLifetime.error());
    }
    cfg.authorizationCodeLifetime = std::chrono::minutes(codeLifetime.value());

    auto mfaMax = readBounded(config, "mfa.max_lifetime_minutes", 60, 1, 24 * 60);
    if (!mfaMax) {
        return AuthResult<AuthConfig>::err(mfaMax.error());
    }
    cfg.mfaChallengeMaxLifetime = std::chrono::minutes(mfaMax.value());

    auto mfaLifetime = readBounded(config, "mfa.lifetime_minutes", 10, 1, mfaMax.value());
    if (!mfaLifetime) {
        return AuthResult<AuthConfig>::err(mfaLifetime.error());
    }
    cfg.mfaChallengeLifetime = std::chrono::minutes(mfaLifetime.value());

    auto refreshDays = readBounded(config, "refresh_token.default_expiration_days",
                                   cfg.refreshTokenDefaultDays, 1, 365);
    if (!refreshDays) {
        return AuthResult<AuthConfig>::err(refreshDays.error());
    }
    cfg.refreshTokenDefaultDays = static_cast<int>(refreshDays.value());

    CAS_LOG_DEBUG(LogCategory::Config,
                  "Auth configuration loaded (algorithm " +
                      std::string(signatureAlgorithmName(cfg.jwt.algorithm)) + ", key id '" +
                      cfg.jwt.keyId + "')");
    return AuthResult<AuthConfig>::ok(std::move(cfg));
}

}  // namespace cas::service
