#pragma once

/// @file token_types.hpp
/// @brief Core type definitions for the token-issuance and credential
///        verification core.
///
/// Defines persisted token rows, OAuth client records, identities,
/// decoded access token claims and configuration types used throughout
/// the service layer.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cas::service {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// -- Sealed token rows --------------------------------------------------------

/// OAuth2 authorization code (RFC 6749 section 4.1) with optional PKCE.
///
/// The persisted row only carries `codeHash` and `encryptedCode`. The
/// plaintext `code` is filled in on the record returned by issuance and is
/// empty on every record read back from a store.
struct AuthorizationCode {
    std::string id;
    std::string code;
    std::string codeHash;
    std::string encryptedCode;
    std::string userId;
    std::string tenantId;
    std::string clientId;
    std::string redirectUri;
    std::optional<std::string> scope;
    std::optional<std::string> state;
    std::optional<std::string> codeChallenge;
    std::optional<std::string> codeChallengeMethod;
    TimePoint expiresAt{};
    bool isUsed = false;
    std::optional<TimePoint> usedAt;
    TimePoint createdAt{};
    std::optional<std::string> issuedFromIpAddress;
    std::optional<std::string> issuedFromUserAgent;
};

/// Long-lived refresh token, reusable until revoked or expired.
struct RefreshToken {
    std::string id;
    std::string userId;
    std::string tenantId;
    std::string encryptedToken;
    std::string tokenHash;
    TimePoint expiresAt{};
    bool isRevoked = false;
    std::optional<TimePoint> revokedAt;
    std::optional<TimePoint> usedAt;  ///< Last successful validation (audit only).
    TimePoint createdAt{};
    std::optional<std::string> issuedFromIpAddress;
    std::optional<std::string> issuedFromUserAgent;
};

/// Short-lived, strictly single-use step-up authentication ticket.
struct MfaChallengeToken {
    std::string id;
    std::string userId;
    std::string tenantId;
    std::string encryptedToken;
    std::string tokenHash;
    TimePoint expiresAt{};
    bool isUsed = false;
    std::optional<TimePoint> usedAt;
    TimePoint createdAt{};
    std::optional<std::string> issuedFromIpAddress;
    std::optional<std::string> issuedFromUserAgent;
};

/// Optional issuance metadata recorded alongside a token row.
struct IssuanceMetadata {
    std::optional<std::string> ipAddress;
    std::optional<std::string> userAgent;
};

// -- OAuth clients ------------------------------------------------------------

/// Registered OAuth client.
///
/// Confidential clients always carry a `clientSecretHash`; public clients
/// never do.
struct OAuthClient {
    std::string id;
    std::string clientId;
    std::optional<std::string> clientSecretHash;
    std::string name;
    std::optional<std::string> description;
    std::vector<std::string> redirectUris;
    bool isConfidential = false;
    bool isActive = true;
    std::optional<std::string> tenantId;  ///< nullopt means global.
    TimePoint createdAt{};
    std::optional<TimePoint> updatedAt;
};

// -- Identities and claims ----------------------------------------------------

/// Identity fields copied into access tokens.
struct UserIdentity {
    std::string id;
    std::string tenantId;
    std::optional<std::string> email;
    std::string userName;
    std::optional<std::string> firstName;
    std::optional<std::string> lastName;
};

/// A user as returned by the user/role directory collaborator.
struct DirectoryUser {
    UserIdentity identity;
    std::vector<std::string> roles;
    bool isActive = true;
};

/// A single decoded claim. Multi-valued claims appear once per value.
struct Claim {
    std::string type;
    std::string value;
};

/// Decoded access token payload.
struct TokenClaims {
    std::string subject;                                ///< "sub"
    std::string jti;                                    ///< "jti"
    std::string email;                                  ///< "email"
    std::string userName;                               ///< "unique_name"
    std::string tenantId;                               ///< "tenant_id"
    std::string userId;                                 ///< "user_id"
    std::vector<std::string> roles;                     ///< "role" values
    std::optional<std::string> givenName;               ///< "given_name"
    std::optional<std::string> surname;                 ///< "family_name"
    std::vector<std::string> scopes;                    ///< "scope" values
    std::string issuer;                                 ///< "iss"
    std::string audience;                               ///< "aud"
    std::optional<TimePoint> expiresAt;                 ///< "exp"
    std::optional<TimePoint> issuedAt;                  ///< "iat"
};

/// Result of decoding an access token.
struct DecodedAccessToken {
    std::string algorithm;       ///< Header "alg".
    std::string keyId;           ///< Header "kid".
    TokenClaims claims;
    std::vector<Claim> rawClaims;
    bool signatureVerified = false;

    /// First claim of the given type, if any.
    [[nodiscard]] std::optional<std::string> find(std::string_view type) const;

    /// All claims of the given type, in payload order.
    [[nodiscard]] std::vector<std::string> findAll(std::string_view type) const;
};

/// Response of a successful token grant.
struct TokenResponse {
    std::string accessToken;
    std::string tokenType = "Bearer";
    std::chrono::seconds expiresIn{};
    std::string refreshToken;
    std::optional<std::string> scope;
};

// -- Well-known names ---------------------------------------------------------

namespace claim_names {
inline constexpr const char* kSubject = "sub";
inline constexpr const char* kJwtId = "jti";
inline constexpr const char* kEmail = "email";
inline constexpr const char* kUniqueName = "unique_name";
inline constexpr const char* kTenantId = "tenant_id";
inline constexpr const char* kTenantIdCompat = "http://schemas.microsoft.com/identity/claims/tenantid";
inline constexpr const char* kUserId = "user_id";
inline constexpr const char* kRole = "role";
inline constexpr const char* kRoles = "roles";
inline constexpr const char* kGivenName = "given_name";
inline constexpr const char* kSurname = "family_name";
inline constexpr const char* kScope = "scope";
inline constexpr const char* kExpires = "exp";
inline constexpr const char* kIssuedAt = "iat";
inline constexpr const char* kIssuer = "iss";
inline constexpr const char* kAudience = "aud";
}  // namespace claim_names

namespace pkce_methods {
inline constexpr const char* kPlain = "plain";
inline constexpr const char* kS256 = "S256";
}  // namespace pkce_methods

namespace protection_purposes {
inline constexpr const char* kAuthorizationCode = "AuthorizationCode";
inline constexpr const char* kRefreshToken = "RefreshToken";
inline constexpr const char* kMfaChallengeToken = "MfaChallengeToken";
}  // namespace protection_purposes

// -- Configuration ------------------------------------------------------------

/// Signature scheme used for access tokens.
enum class SignatureAlgorithm : uint8_t {
    RS256,    ///< RSASSA-PKCS1-v1_5 with SHA-256.
    EdDSA,    ///< Ed25519.
    MlDsa65   ///< ML-DSA-65 (FIPS 204), post-quantum.
};

/// JWS "alg" value for an algorithm ("RS256", "EdDSA", "ML-DSA-65").
[[nodiscard]] std::string_view signatureAlgorithmName(SignatureAlgorithm alg);

/// Parse a JWS "alg" value. Unknown names yield nullopt.
[[nodiscard]] std::optional<SignatureAlgorithm> parseSignatureAlgorithm(std::string_view name);

/// Access token signing settings.
struct JwtSettings {
    std::string issuer;
    std::string audience;

    /// Access token lifetime.
    std::chrono::minutes expiration{15};

    SignatureAlgorithm algorithm = SignatureAlgorithm::RS256;

    /// Fixed key id published in the token header and the JWK.
    std::string keyId = "auth-key-1";

    /// JWK JSON, base64-encoded JWK JSON, or PEM. Empty means an ephemeral
    /// key pair is generated for the process lifetime.
    std::string signingKey;

    /// RSA modulus size for generated keys.
    uint32_t rsaKeyBits = 2048;
};

/// Settings of the authenticated encryption provider.
struct DataProtectionConfig {
    /// Base64 or base64url 256-bit master key. Empty means ephemeral.
    std::string masterKey;
};

/// Complete configuration of the authentication core.
struct AuthConfig {
    JwtSettings jwt;
    DataProtectionConfig dataProtection;

    /// PBKDF2 iteration count for client secrets.
    uint32_t secretHashIterations = 100000;

    /// Authorization code lifetime.
    std::chrono::minutes authorizationCodeLifetime{10};

    /// Default and maximum MFA challenge lifetime.
    std::chrono::minutes mfaChallengeLifetime{10};
    std::chrono::minutes mfaChallengeMaxLifetime{60};

    /// Refresh token lifetime when the tenant has no valid setting.
    int refreshTokenDefaultDays = 30;
};

}  // namespace cas::service
