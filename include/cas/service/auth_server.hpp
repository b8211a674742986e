#pragma once

/// @file auth_server.hpp
/// @brief Authentication core orchestrating client validation, code
///        exchange, MFA step-up and token issuance.
///
/// Control flow:
///   client registry -> authorization code (or direct credential check by
///   the caller) -> optional MFA challenge -> access token + refresh token.

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cas/foundation/auth_result.hpp"
#include "cas/service/authorization_code_service.hpp"
#include "cas/service/token_types.hpp"

namespace cas::service {

class IAuthorizationCodeStore;
class IRefreshTokenStore;
class IMfaChallengeStore;
class IOAuthClientStore;
class ITenantSettingsProvider;
class IUserDirectory;
class IDataProtector;
class AccessTokenService;
class RefreshTokenService;
class MfaChallengeService;
class OAuthClientService;

/// Persistence collaborators of the server.
struct AuthServerStores {
    std::shared_ptr<IAuthorizationCodeStore> authorizationCodes;
    std::shared_ptr<IRefreshTokenStore> refreshTokens;
    std::shared_ptr<IMfaChallengeStore> mfaChallenges;
    std::shared_ptr<IOAuthClientStore> clients;
    std::shared_ptr<ITenantSettingsProvider> tenantSettings;
    std::shared_ptr<IUserDirectory> users;

    /// Thread-safe in-memory stores for every collaborator.
    [[nodiscard]] static AuthServerStores inMemory();
};

/// Token endpoint request for the authorization_code grant.
struct CodeExchangeRequest {
    std::string clientId;
    std::optional<std::string> clientSecret;
    std::string code;
    std::string redirectUri;
    std::optional<std::string> codeVerifier;
    IssuanceMetadata metadata;
};

/// A freshly issued MFA challenge; the plaintext is only available here.
struct MfaChallengeGrant {
    std::string challengeToken;
    TimePoint expiresAt{};
};

/// Authentication server.
///
/// Example:
/// @code
///   auto stores = AuthServerStores::inMemory();
///   auto server = AuthServer::create(config, stores);
///   auto code = server.value()->authorize(request);
///   auto tokens = server.value()->exchangeAuthorizationCode(
///       {.clientId = "spa", .code = code.value().code,
///        .redirectUri = "https://spa/cb", .codeVerifier = verifier});
/// @endcode
class AuthServer {
public:
    /// Build the server: data protector, signing key and services.
    /// Fails with KeyMaterialInvalid on malformed configured keys.
    [[nodiscard]] static foundation::AuthResult<std::unique_ptr<AuthServer>> create(
        AuthConfig config, AuthServerStores stores);

    /// Construct from prebuilt crypto providers.
    AuthServer(AuthConfig config,
               AuthServerStores stores,
               std::shared_ptr<IDataProtector> protector,
               std::unique_ptr<AccessTokenService> accessTokens);

    ~AuthServer();

    AuthServer(const AuthServer&) = delete;
    AuthServer& operator=(const AuthServer&) = delete;
    AuthServer(AuthServer&&) noexcept;
    AuthServer& operator=(AuthServer&&) noexcept;

    /// Validate an authorization request and issue a code.
    ///
    /// The client must exist, be active, belong to the tenant (or be
    /// global) and list the redirect URI; the PKCE method must be empty,
    /// "plain" or "S256".
    [[nodiscard]] foundation::AuthResult<AuthorizationCode> authorize(
        const AuthorizationCodeRequest& request);

    /// Redeem an authorization code for access and refresh tokens.
    [[nodiscard]] foundation::AuthResult<TokenResponse> exchangeAuthorizationCode(
        const CodeExchangeRequest& request);

    /// Issue an MFA challenge after primary authentication.
    [[nodiscard]] foundation::AuthResult<MfaChallengeGrant> beginMfaChallenge(
        std::string_view userId,
        std::string_view tenantId,
        const IssuanceMetadata& metadata = {});

    /// Redeem a challenge once the caller has verified the second factor.
    [[nodiscard]] foundation::AuthResult<TokenResponse> completeMfaChallenge(
        std::string_view challengeToken,
        const IssuanceMetadata& metadata = {},
        const std::vector<std::string>& scopes = {});

    /// Mint a new access token from a refresh token. The refresh token is
    /// returned unchanged (no rotation).
    [[nodiscard]] foundation::AuthResult<TokenResponse> refresh(std::string_view refreshToken);

    /// Revoke one refresh token of the user.
    [[nodiscard]] foundation::AuthResult<void> logout(std::string_view refreshToken,
                                                      std::string_view userId);

    /// Revoke all refresh tokens of the user within the tenant.
    foundation::AuthResult<std::size_t> logoutEverywhere(std::string_view userId,
                                                         std::string_view tenantId);

    /// Run every store's expiry sweep. Returns the total rows removed.
    foundation::AuthResult<std::size_t> cleanupExpired();

    [[nodiscard]] OAuthClientService& clients() noexcept { return *clients_; }
    [[nodiscard]] const AccessTokenService& accessTokens() const noexcept {
        return *accessTokens_;
    }
    [[nodiscard]] AuthorizationCodeService& authorizationCodes() noexcept {
        return *authorizationCodes_;
    }
    [[nodiscard]] RefreshTokenService& refreshTokens() noexcept { return *refreshTokens_; }
    [[nodiscard]] MfaChallengeService& mfaChallenges() noexcept { return *mfaChallenges_; }

private:
    /// Load an active directory user or fail with AuthenticationFailed.
    [[nodiscard]] foundation::AuthResult<DirectoryUser> loadActiveUser(
        std::string_view tenantId, std::string_view userId) const;

    /// Mint an access token and a new refresh token.
    [[nodiscard]] foundation::AuthResult<TokenResponse> issueTokens(
        const DirectoryUser& user,
        const std::vector<std::string>& scopes,
        const IssuanceMetadata& metadata);

    AuthConfig config_;
    AuthServerStores stores_;
    std::unique_ptr<AccessTokenService> accessTokens_;
    std::unique_ptr<AuthorizationCodeService> authorizationCodes_;
    std::unique_ptr<RefreshTokenService> refreshTokens_;
    std::unique_ptr<MfaChallengeService> mfaChallenges_;
    std::unique_ptr<OAuthClientService> clients_;
};

}  // namespace cas::service
