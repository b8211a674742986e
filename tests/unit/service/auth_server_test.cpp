#include <gtest/gtest.h>

#include "cas/service/access_token_service.hpp"
#include "cas/service/auth_server.hpp"
#include "cas/service/mfa_challenge_service.hpp"
#include "cas/service/oauth_client_service.hpp"
#include "cas/service/refresh_token_service.hpp"
#include "cas/service/tenant_settings.hpp"
#include "cas/service/token_store.hpp"
#include "cas/service/user_directory.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "../../support/mock_logger.hpp"

using namespace cas::service;
using cas::foundation::ErrorCode;

namespace {

constexpr const char* kTenant = "tenant-1";
constexpr const char* kRedirect = "https://spa.example/cb";
constexpr const char* kVerifier = "dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk";

AuthConfig testConfig() {
    AuthConfig config;
    config.jwt.issuer = "auth.example";
    config.jwt.audience = "api.example";
    config.jwt.algorithm = SignatureAlgorithm::EdDSA;
    config.jwt.expiration = std::chrono::minutes(15);
    config.dataProtection.masterKey = AesGcmDataProtector::generateMasterKey();
    config.secretHashIterations = 1000;
    return config;
}

}  // namespace

class AuthServerTest : public cas::test::MockLoggerTest {
protected:
    void SetUp() override {
        MockLoggerTest::SetUp();
        stores = AuthServerStores::inMemory();
        users = std::static_pointer_cast<InMemoryUserDirectory>(stores.users);

        DirectoryUser alice;
        alice.identity.id = "u1";
        alice.identity.tenantId = kTenant;
        alice.identity.email = "alice@example.com";
        alice.identity.userName = "alice";
        alice.roles = {"Admin", "User"};
        users->upsert(alice);

        auto created = AuthServer::create(testConfig(), stores);
        ASSERT_TRUE(created);
        server = std::move(created).value();

        CreateClientRequest spa;
        spa.clientId = "spa";
        spa.name = "SPA";
        spa.redirectUris = {kRedirect};
        ASSERT_TRUE(server->clients().createClient(spa));

        CreateClientRequest backend;
        backend.clientId = "backend";
        backend.clientSecret = "s3cret";
        backend.name = "Backend";
        backend.redirectUris = {"https://backend.example/cb"};
        backend.isConfidential = true;
        backend.tenantId = kTenant;
        ASSERT_TRUE(server->clients().createClient(backend));
    }

    AuthorizationCodeRequest spaRequest() const {
        AuthorizationCodeRequest request;
        request.userId = "u1";
        request.tenantId = kTenant;
        request.clientId = "spa";
        request.redirectUri = kRedirect;
        request.scope = "openid profile";
        request.codeChallenge = AuthorizationCodeService::computeS256Challenge(kVerifier);
        request.codeChallengeMethod = "S256";
        return request;
    }

    CodeExchangeRequest spaExchange(const std::string& code) const {
        CodeExchangeRequest request;
        request.clientId = "spa";
        request.code = code;
        request.redirectUri = kRedirect;
        request.codeVerifier = kVerifier;
        return request;
    }

    AuthServerStores stores;
    std::shared_ptr<InMemoryUserDirectory> users;
    std::unique_ptr<AuthServer> server;
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(AuthServerTest, CreateRejectsMalformedKeys) {
    auto badMaster = testConfig();
    badMaster.dataProtection.masterKey = "not-a-key";
    auto a = AuthServer::create(badMaster, AuthServerStores::inMemory());
    ASSERT_FALSE(a);
    EXPECT_EQ(a.error().code(), ErrorCode::KeyMaterialInvalid);

    auto badSigning = testConfig();
    badSigning.jwt.signingKey = "{\"kty\":\"OKP\"}";
    auto b = AuthServer::create(badSigning, AuthServerStores::inMemory());
    ASSERT_FALSE(b);
    EXPECT_EQ(b.error().code(), ErrorCode::KeyMaterialInvalid);
}

// =============================================================================
// authorize
// =============================================================================

TEST_F(AuthServerTest, AuthorizeIssuesCode) {
    auto code = server->authorize(spaRequest());
    ASSERT_TRUE(code);
    EXPECT_EQ(code.value().code.size(), 43u);
    EXPECT_EQ(code.value().clientId, "spa");
    EXPECT_EQ(code.value().codeChallengeMethod, std::optional<std::string>("S256"));
}

TEST_F(AuthServerTest, AuthorizeRejectsUnknownOrInactiveClient) {
    auto request = spaRequest();
    request.clientId = "ghost";
    auto unknown = server->authorize(request);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code(), ErrorCode::InvalidClient);

    UpdateClientRequest deactivate;
    deactivate.isActive = false;
    ASSERT_TRUE(server->clients().updateClient("spa", deactivate));
    auto inactive = server->authorize(spaRequest());
    ASSERT_FALSE(inactive);
    EXPECT_EQ(inactive.error().code(), ErrorCode::InvalidClient);
}

TEST_F(AuthServerTest, AuthorizeEnforcesClientTenant) {
    auto request = spaRequest();
    request.clientId = "backend";
    request.redirectUri = "https://backend.example/cb";
    request.tenantId = "tenant-2";
    auto foreign = server->authorize(request);
    ASSERT_FALSE(foreign);
    EXPECT_EQ(foreign.error().code(), ErrorCode::InvalidClient);

    request.tenantId = kTenant;
    EXPECT_TRUE(server->authorize(request));
}

TEST_F(AuthServerTest, AuthorizeRejectsUnregisteredRedirectUri) {
    auto request = spaRequest();
    request.redirectUri = "https://evil.example/cb";
    auto result = server->authorize(request);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidRequest);
}

TEST_F(AuthServerTest, AuthorizeValidatesPkceMethod) {
    auto request = spaRequest();
    request.codeChallengeMethod = "S512";
    auto unknown = server->authorize(request);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code(), ErrorCode::InvalidRequest);

    request = spaRequest();
    request.codeChallenge.reset();
    auto noChallenge = server->authorize(request);
    ASSERT_FALSE(noChallenge);
    EXPECT_EQ(noChallenge.error().code(), ErrorCode::InvalidRequest);

    request.codeChallengeMethod.reset();
    EXPECT_TRUE(server->authorize(request));
}

// =============================================================================
// Code exchange
// =============================================================================

TEST_F(AuthServerTest, ExchangeIssuesTokensWithScopes) {
    auto code = server->authorize(spaRequest());
    ASSERT_TRUE(code);

    auto tokens = server->exchangeAuthorizationCode(spaExchange(code.value().code));
    ASSERT_TRUE(tokens);
    EXPECT_EQ(tokens.value().tokenType, "Bearer");
    EXPECT_EQ(tokens.value().expiresIn, std::chrono::seconds(15 * 60));
    EXPECT_EQ(tokens.value().scope, std::optional<std::string>("openid profile"));
    EXPECT_EQ(tokens.value().refreshToken.size(), 88u);

    auto decoded = server->accessTokens().validateAndDecode(tokens.value().accessToken);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->claims.subject, "u1");
    EXPECT_EQ(decoded->claims.roles, (std::vector<std::string>{"Admin", "User"}));
    EXPECT_EQ(decoded->claims.scopes, (std::vector<std::string>{"openid", "profile"}));
    EXPECT_EQ(mockLogger_->countContaining("Tokens issued"), 1u);
}

TEST_F(AuthServerTest, ExchangeRequiresConfidentialClientSecret) {
    auto request = spaRequest();
    request.clientId = "backend";
    request.redirectUri = "https://backend.example/cb";
    request.codeChallenge.reset();
    request.codeChallengeMethod.reset();
    auto code = server->authorize(request);
    ASSERT_TRUE(code);

    CodeExchangeRequest exchange;
    exchange.clientId = "backend";
    exchange.code = code.value().code;
    exchange.redirectUri = "https://backend.example/cb";
    exchange.clientSecret = "wrong";
    auto denied = server->exchangeAuthorizationCode(exchange);
    ASSERT_FALSE(denied);
    EXPECT_EQ(denied.error().code(), ErrorCode::InvalidClient);

    // Client authentication failed before the code was touched.
    exchange.clientSecret = "s3cret";
    EXPECT_TRUE(server->exchangeAuthorizationCode(exchange));
}

TEST_F(AuthServerTest, ExchangeFailsForInactiveUser) {
    auto code = server->authorize(spaRequest());
    ASSERT_TRUE(code);

    auto alice = users->findUser(kTenant, "u1");
    ASSERT_TRUE(alice);
    auto disabled = *alice.value();
    disabled.isActive = false;
    users->upsert(disabled);

    auto tokens = server->exchangeAuthorizationCode(spaExchange(code.value().code));
    ASSERT_FALSE(tokens);
    EXPECT_EQ(tokens.error().code(), ErrorCode::AuthenticationFailed);
}

TEST_F(AuthServerTest, ExchangeWithWrongVerifierIsInvalidToken) {
    auto code = server->authorize(spaRequest());
    ASSERT_TRUE(code);

    auto request = spaExchange(code.value().code);
    request.codeVerifier = "not-the-verifier";
    auto tokens = server->exchangeAuthorizationCode(request);
    ASSERT_FALSE(tokens);
    EXPECT_EQ(tokens.error().code(), ErrorCode::InvalidToken);
}

// =============================================================================
// Refresh and logout
// =============================================================================

TEST_F(AuthServerTest, RefreshReturnsSameRefreshToken) {
    auto code = server->authorize(spaRequest());
    ASSERT_TRUE(code);
    auto tokens = server->exchangeAuthorizationCode(spaExchange(code.value().code));
    ASSERT_TRUE(tokens);

    auto refreshed = server->refresh(tokens.value().refreshToken);
    ASSERT_TRUE(refreshed);
    EXPECT_EQ(refreshed.value().refreshToken, tokens.value().refreshToken);
    EXPECT_NE(refreshed.value().accessToken, tokens.value().accessToken);
    EXPECT_TRUE(server->accessTokens().validateAndDecode(refreshed.value().accessToken));

    // Not rotated: still usable.
    EXPECT_TRUE(server->refresh(tokens.value().refreshToken));
}

TEST_F(AuthServerTest, LogoutRevokesOnlyOwnToken) {
    auto code = server->authorize(spaRequest());
    ASSERT_TRUE(code);
    auto tokens = server->exchangeAuthorizationCode(spaExchange(code.value().code));
    ASSERT_TRUE(tokens);

    auto foreign = server->logout(tokens.value().refreshToken, "someone-else");
    ASSERT_FALSE(foreign);
    EXPECT_EQ(foreign.error().code(), ErrorCode::InvalidToken);
    EXPECT_TRUE(server->refresh(tokens.value().refreshToken));

    ASSERT_TRUE(server->logout(tokens.value().refreshToken, "u1"));
    auto afterLogout = server->refresh(tokens.value().refreshToken);
    ASSERT_FALSE(afterLogout);
    EXPECT_EQ(afterLogout.error().code(), ErrorCode::InvalidToken);
}

// =============================================================================
// MFA
// =============================================================================

TEST_F(AuthServerTest, MfaChallengeIsSingleUse) {
    auto grant = server->beginMfaChallenge("u1", kTenant);
    ASSERT_TRUE(grant);
    EXPECT_EQ(grant.value().challengeToken.size(), 88u);
    EXPECT_GT(grant.value().expiresAt, Clock::now());

    auto tokens = server->completeMfaChallenge(grant.value().challengeToken, {}, {"openid"});
    ASSERT_TRUE(tokens);
    EXPECT_EQ(tokens.value().scope, std::optional<std::string>("openid"));

    auto replay = server->completeMfaChallenge(grant.value().challengeToken);
    ASSERT_FALSE(replay);
    EXPECT_EQ(replay.error().code(), ErrorCode::InvalidToken);
}

TEST_F(AuthServerTest, MfaChallengeRequiresKnownUser) {
    auto grant = server->beginMfaChallenge("ghost", kTenant);
    ASSERT_FALSE(grant);
    EXPECT_EQ(grant.error().code(), ErrorCode::AuthenticationFailed);
}

// =============================================================================
// Cleanup
// =============================================================================

TEST_F(AuthServerTest, CleanupSumsEverySweep) {
    auto code = server->authorize(spaRequest());
    ASSERT_TRUE(code);
    ASSERT_TRUE(server->exchangeAuthorizationCode(spaExchange(code.value().code)));

    auto grant = server->beginMfaChallenge("u1", kTenant);
    ASSERT_TRUE(grant);
    ASSERT_TRUE(server->completeMfaChallenge(grant.value().challengeToken));

    // The used code and the used challenge; live refresh tokens stay.
    auto removed = server->cleanupExpired();
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed.value(), 2u);
}
