#pragma once

/// @file access_token_service.hpp
/// @brief Signed bearer access tokens (JWS compact serialization).
///
/// Token format (RFC 7515 / RFC 7519):
///   base64url(header) . base64url(payload) . base64url(signature)
///
/// Header:  {"alg":"<RS256|EdDSA|ML-DSA-65>","kid":"<key id>","typ":"JWT"}
/// Payload: {"sub","jti","email","unique_name","tenant_id",
///           "http://schemas.microsoft.com/identity/claims/tenantid",
///           "user_id","role","roles","given_name","family_name","scope",
///           "exp","iat","iss","aud"}
///
/// `role` and `scope` are a string for one value and an array for several;
/// `roles` is always an array of every role name.

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cas/foundation/auth_result.hpp"
#include "cas/service/token_signer.hpp"
#include "cas/service/token_types.hpp"

namespace cas::service {

/// Mints, validates and introspects access tokens.
///
/// Constructed once at startup and shared read-only; the signer is never
/// replaced after construction.
///
/// Example:
/// @code
///   auto tokens = AccessTokenService::create(config.jwt);
///   auto jwt = tokens.value()->generateToken(identity, {"Admin", "User"});
///   auto decoded = tokens.value()->validateAndDecode(jwt.value(), true);
/// @endcode
class AccessTokenService {
public:
    AccessTokenService(JwtSettings settings, std::unique_ptr<ITokenSigner> signer);

    /// Load or generate the signer described by @p settings.
    [[nodiscard]] static foundation::AuthResult<std::unique_ptr<AccessTokenService>> create(
        JwtSettings settings);

    /// Mint a token for the configured issuer and audience.
    [[nodiscard]] foundation::AuthResult<std::string> generateToken(
        const UserIdentity& user,
        const std::vector<std::string>& roles,
        const std::vector<std::string>& scopes = {}) const;

    /// Mint a token for a downstream consumer with its own issuer/audience,
    /// signed with the same key.
    [[nodiscard]] foundation::AuthResult<std::string> generateTokenFor(
        const UserIdentity& user,
        const std::vector<std::string>& roles,
        std::string_view issuer,
        std::string_view audience,
        const std::vector<std::string>& scopes = {}) const;

    /// Decode a token.
    ///
    /// With @p validateSignature the header alg/kid, signature, issuer and
    /// audience are checked; expiry is deliberately not. Without it the
    /// claims are returned unverified (introspection of a bearer already
    /// authenticated elsewhere). Never throws.
    /// @return nullopt on any structural or validation failure.
    [[nodiscard]] std::optional<DecodedAccessToken> validateAndDecode(
        std::string_view token, bool validateSignature = true) const;

    /// Public JWK of the signing key.
    [[nodiscard]] std::string exportPublicJwk() const;

    /// Full JWK including private members (operational backup only).
    [[nodiscard]] std::string exportFullJwk() const;

    /// JWK set `{"keys":[<public jwk>]}` for a verification-key endpoint.
    [[nodiscard]] std::string publicJwks() const;

    [[nodiscard]] const ITokenSigner& signer() const noexcept { return *signer_; }
    [[nodiscard]] const JwtSettings& settings() const noexcept { return settings_; }

private:
    [[nodiscard]] std::optional<DecodedAccessToken> decode(std::string_view token,
                                                           bool validateSignature) const;

    JwtSettings settings_;
    std::unique_ptr<ITokenSigner> signer_;
};

}  // namespace cas::service
