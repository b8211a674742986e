/// @file auth_server.cpp
/// @brief AuthServer implementation orchestrating the token flows.

#include "cas/service/auth_server.hpp"

#include "cas/foundation/auth_logger.hpp"
#include "cas/service/access_token_service.hpp"
#include "cas/service/client_store.hpp"
#include "cas/service/data_protector.hpp"
#include "cas/service/mfa_challenge_service.hpp"
#include "cas/service/oauth_client_service.hpp"
#include "cas/service/refresh_token_service.hpp"
#include "cas/service/secret_hasher.hpp"
#include "cas/service/tenant_settings.hpp"
#include "cas/service/token_store.hpp"
#include "cas/service/user_directory.hpp"

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::AuthResult;
using cas::foundation::ErrorCode;
using cas::foundation::LogCategory;
using cas::foundation::LogContext;
using cas::foundation::LogLevel;

namespace {

/// Split a space-delimited OAuth scope string.
std::vector<std::string> splitScopes(const std::optional<std::string>& scope) {
    std::vector<std::string> scopes;
    if (!scope) {
        return scopes;
    }
    std::string current;
    for (char c : *scope) {
        if (c == ' ') {
            if (!current.empty()) {
                scopes.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        scopes.push_back(std::move(current));
    }
    return scopes;
}

std::optional<std::string> joinScopes(const std::vector<std::string>& scopes) {
    if (scopes.empty()) {
        return std::nullopt;
    }
    std::string joined;
    for (const auto& s : scopes) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined += s;
    }
    return joined;
}

}  // anonymous namespace

// -- Stores -------------------------------------------------------------------

AuthServerStores AuthServerStores::inMemory() {
    AuthServerStores stores;
    stores.authorizationCodes = std::make_shared<InMemoryAuthorizationCodeStore>();
    stores.refreshTokens = std::make_shared<InMemoryRefreshTokenStore>();
    stores.mfaChallenges = std::make_shared<InMemoryMfaChallengeStore>();
    stores.clients = std::make_shared<InMemoryOAuthClientStore>();
    stores.tenantSettings = std::make_shared<InMemoryTenantSettingsProvider>();
    stores.users = std::make_shared<InMemoryUserDirectory>();
    return stores;
}

// -- Construction / destruction -----------------------------------------------

AuthResult<std::unique_ptr<AuthServer>> AuthServer::create(AuthConfig config,
                                                           AuthServerStores stores) {
    using ResultT = AuthResult<std::unique_ptr<AuthServer>>;

    auto protector = AesGcmDataProtector::fromConfig(config.dataProtection);
    if (!protector) {
        return ResultT::err(protector.error());
    }
    auto accessTokens = AccessTokenService::create(config.jwt);
    if (!accessTokens) {
        return ResultT::err(accessTokens.error());
    }
    std::shared_ptr<IDataProtector> sharedProtector = std::move(protector).value();
    return ResultT::ok(std::make_unique<AuthServer>(std::move(config),
                                                    std::move(stores),
                                                    std::move(sharedProtector),
                                                    std::move(accessTokens).value()));
}

AuthServer::AuthServer(AuthConfig config,
                       AuthServerStores stores,
                       std::shared_ptr<IDataProtector> protector,
                       std::unique_ptr<AccessTokenService> accessTokens)
    : config_(std::move(config)),
      stores_(std::move(stores)),
      accessTokens_(std::move(accessTokens)),
      authorizationCodes_(std::make_unique<AuthorizationCodeService>(
          stores_.authorizationCodes, protector, config_.authorizationCodeLifetime)),
      refreshTokens_(std::make_unique<RefreshTokenService>(stores_.refreshTokens,
                                                           protector,
                                                           stores_.tenantSettings,
                                                           config_.refreshTokenDefaultDays)),
      mfaChallenges_(std::make_unique<MfaChallengeService>(stores_.mfaChallenges,
                                                           protector,
                                                           config_.mfaChallengeLifetime,
                                                           config_.mfaChallengeMaxLifetime)),
      clients_(std::make_unique<OAuthClientService>(
          stores_.clients, std::make_shared<Pbkdf2SecretHasher>(config_.secretHashIterations))) {
    // Signing key material is owned by the access token service only.
    config_.jwt.signingKey.clear();
    config_.dataProtection.masterKey.clear();
}

AuthServer::~AuthServer() = default;
AuthServer::AuthServer(AuthServer&&) noexcept = default;
AuthServer& AuthServer::operator=(AuthServer&&) noexcept = default;

// -- Authorization code grant -------------------------------------------------

AuthResult<AuthorizationCode> AuthServer::authorize(const AuthorizationCodeRequest& request) {
    LogContext ctx;
    ctx.userId = request.userId;
    ctx.tenantId = request.tenantId;
    ctx.clientId = request.clientId;

    auto found = clients_->getClient(request.clientId);
    if (!found) {
        return AuthResult<AuthorizationCode>::err(found.error());
    }
    if (!found.value() || !found.value()->isActive) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Client,
                    "Authorization rejected: unknown or inactive client", ctx);
        return AuthResult<AuthorizationCode>::err(
            AuthError(ErrorCode::InvalidClient, "unknown or inactive client"));
    }
    const auto& client = *found.value();
    if (client.tenantId && *client.tenantId != request.tenantId) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Client,
                    "Authorization rejected: client belongs to another tenant", ctx);
        return AuthResult<AuthorizationCode>::err(
            AuthError(ErrorCode::InvalidClient, "unknown or inactive client"));
    }
    if (!OAuthClientService::isRedirectUriAllowed(client, request.redirectUri)) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Client,
                    "Authorization rejected: redirect URI not registered", ctx);
        return AuthResult<AuthorizationCode>::err(
            AuthError(ErrorCode::InvalidRequest, "redirect URI is not registered"));
    }

    std::optional<std::string_view> method;
    if (request.codeChallengeMethod) {
        method = *request.codeChallengeMethod;
    }
    if (!AuthorizationCodeService::isSupportedChallengeMethod(method)) {
        return AuthResult<AuthorizationCode>::err(
            AuthError(ErrorCode::InvalidRequest, "unsupported code_challenge_method"));
    }
    bool hasChallenge = request.codeChallenge && !request.codeChallenge->empty();
    if (method && !method->empty() && !hasChallenge) {
        return AuthResult<AuthorizationCode>::err(
            AuthError(ErrorCode::InvalidRequest, "code_challenge_method without code_challenge"));
    }

    return authorizationCodes_->issue(request);
}

AuthResult<TokenResponse> AuthServer::exchangeAuthorizationCode(const CodeExchangeRequest& request) {
    std::optional<std::string_view> secret;
    if (request.clientSecret) {
        secret = *request.clientSecret;
    }
    auto client = clients_->authenticateClient(request.clientId, secret);
    if (!client) {
        return AuthResult<TokenResponse>::err(client.error());
    }

    std::optional<std::string_view> verifier;
    if (request.codeVerifier) {
        verifier = *request.codeVerifier;
    }
    auto code = authorizationCodes_->validateAndConsume(
        request.code, request.clientId, request.redirectUri, verifier);
    if (!code) {
        return AuthResult<TokenResponse>::err(code.error());
    }

    auto user = loadActiveUser(code.value().tenantId, code.value().userId);
    if (!user) {
        return AuthResult<TokenResponse>::err(user.error());
    }
    return issueTokens(user.value(), splitScopes(code.value().scope), request.metadata);
}

// -- MFA step-up --------------------------------------------------------------

AuthResult<MfaChallengeGrant> AuthServer::beginMfaChallenge(std::string_view userId,
                                                            std::string_view tenantId,
                                                            const IssuanceMetadata& metadata) {
    auto user = loadActiveUser(tenantId, userId);
    if (!user) {
        return AuthResult<MfaChallengeGrant>::err(user.error());
    }

    auto plaintext = MfaChallengeService::generateChallengeToken();
    auto issued = mfaChallenges_->issue(userId, tenantId, plaintext, std::nullopt, metadata);
    if (!issued) {
        return AuthResult<MfaChallengeGrant>::err(issued.error());
    }
    return AuthResult<MfaChallengeGrant>::ok(
        MfaChallengeGrant{std::move(plaintext), issued.value().expiresAt});
}

AuthResult<TokenResponse> AuthServer::completeMfaChallenge(std::string_view challengeToken,
                                                           const IssuanceMetadata& metadata,
                                                           const std::vector<std::string>& scopes) {
    auto challenge = mfaChallenges_->validateAndConsume(challengeToken);
    if (!challenge) {
        return AuthResult<TokenResponse>::err(challenge.error());
    }
    auto user = loadActiveUser(challenge.value().tenantId, challenge.value().userId);
    if (!user) {
        return AuthResult<TokenResponse>::err(user.error());
    }
    return issueTokens(user.value(), scopes, metadata);
}

// -- Refresh / logout ---------------------------------------------------------

AuthResult<TokenResponse> AuthServer::refresh(std::string_view refreshToken) {
    auto token = refreshTokens_->validate(refreshToken);
    if (!token) {
        return AuthResult<TokenResponse>::err(token.error());
    }
    auto user = loadActiveUser(token.value().tenantId, token.value().userId);
    if (!user) {
        return AuthResult<TokenResponse>::err(user.error());
    }

    auto access = accessTokens_->generateToken(user.value().identity, user.value().roles);
    if (!access) {
        return AuthResult<TokenResponse>::err(access.error());
    }

    TokenResponse response;
    response.accessToken = std::move(access).value();
    response.expiresIn = std::chrono::duration_cast<std::chrono::seconds>(config_.jwt.expiration);
    response.refreshToken = std::string(refreshToken);
    return AuthResult<TokenResponse>::ok(std::move(response));
}

AuthResult<void> AuthServer::logout(std::string_view refreshToken, std::string_view userId) {
    auto revoked = refreshTokens_->revoke(refreshToken, userId);
    if (!revoked) {
        return AuthResult<void>::err(revoked.error());
    }
    if (!revoked.value()) {
        LogContext ctx;
        ctx.userId = std::string(userId);
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Token,
                    "Logout with a refresh token unknown for the user", ctx);
        return AuthResult<void>::err(AuthError(ErrorCode::InvalidToken, "invalid or expired token"));
    }
    return AuthResult<void>::ok();
}

AuthResult<std::size_t> AuthServer::logoutEverywhere(std::string_view userId,
                                                     std::string_view tenantId) {
    return refreshTokens_->revokeAll(userId, tenantId);
}

AuthResult<std::size_t> AuthServer::cleanupExpired() {
    std::size_t total = 0;
    auto codes = authorizationCodes_->cleanupExpired();
    if (!codes) {
        return codes;
    }
    total += codes.value();
    auto refresh = refreshTokens_->cleanupExpired();
    if (!refresh) {
        return refresh;
    }
    total += refresh.value();
    auto challenges = mfaChallenges_->cleanupExpired();
    if (!challenges) {
        return challenges;
    }
    total += challenges.value();
    return AuthResult<std::size_t>::ok(total);
}

// -- Private helpers ----------------------------------------------------------

AuthResult<DirectoryUser> AuthServer::loadActiveUser(std::string_view tenantId,
                                                     std::string_view userId) const {
    auto found = stores_.users->findUser(tenantId, userId);
    if (!found) {
        return AuthResult<DirectoryUser>::err(found.error());
    }
    if (!found.value() || !found.value()->isActive) {
        LogContext ctx;
        ctx.userId = std::string(userId);
        ctx.tenantId = std::string(tenantId);
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Core, "Unknown or inactive user", ctx);
        return AuthResult<DirectoryUser>::err(
            AuthError(ErrorCode::AuthenticationFailed, "user is unknown or inactive"));
    }
    return AuthResult<DirectoryUser>::ok(std::move(*found.value()));
}

AuthResult<TokenResponse> AuthServer::issueTokens(const DirectoryUser& user,
                                                  const std::vector<std::string>& scopes,
                                                  const IssuanceMetadata& metadata) {
    auto access = accessTokens_->generateToken(user.identity, user.roles, scopes);
    if (!access) {
        return AuthResult<TokenResponse>::err(access.error());
    }

    auto refreshPlaintext = RefreshTokenService::generateRefreshToken();
    auto refresh =
        refreshTokens_->issue(user.identity.id, user.identity.tenantId, refreshPlaintext, metadata);
    if (!refresh) {
        return AuthResult<TokenResponse>::err(refresh.error());
    }

    TokenResponse response;
    response.accessToken = std::move(access).value();
    response.expiresIn = std::chrono::duration_cast<std::chrono::seconds>(config_.jwt.expiration);
    response.refreshToken = std::move(refreshPlaintext);
    response.scope = joinScopes(scopes);

    LogContext ctx;
    ctx.userId = user.identity.id;
    ctx.tenantId = user.identity.tenantId;
    ctx.recordId = refresh.value().id;
    CAS_LOG_CTX(LogLevel::Info, LogCategory::Core, "Tokens issued", ctx);
    return AuthResult<TokenResponse>::ok(std::move(response));
}

}  // namespace cas::service
