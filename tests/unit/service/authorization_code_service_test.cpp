#include <gtest/gtest.h>

#include "cas/service/authorization_code_service.hpp"
#include "cas/service/data_protector.hpp"
#include "cas/service/token_store.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "../../support/mock_logger.hpp"

using namespace cas::service;
using cas::foundation::ErrorCode;

namespace {

constexpr const char* kVerifier = "dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk";
constexpr const char* kS256Challenge = "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM";

}  // namespace

class AuthorizationCodeServiceTest : public cas::test::MockLoggerTest {
protected:
    void SetUp() override {
        MockLoggerTest::SetUp();
        AesGcmDataProtector::MasterKey key{};
        key.fill(0x17);
        protector = std::make_shared<AesGcmDataProtector>(key);
        store = std::make_shared<InMemoryAuthorizationCodeStore>();
        service = std::make_unique<AuthorizationCodeService>(store, protector);
    }

    AuthorizationCodeRequest baseRequest() const {
        AuthorizationCodeRequest request;
        request.userId = "user-1";
        request.tenantId = "tenant-1";
        request.clientId = "spa";
        request.redirectUri = "https://spa.example.com/callback";
        request.scope = "openid profile";
        request.state = "xyz";
        return request;
    }

    AuthorizationCodeRequest s256Request() const {
        auto request = baseRequest();
        request.codeChallenge = kS256Challenge;
        request.codeChallengeMethod = "S256";
        return request;
    }

    std::shared_ptr<AesGcmDataProtector> protector;
    std::shared_ptr<InMemoryAuthorizationCodeStore> store;
    std::unique_ptr<AuthorizationCodeService> service;
};

// =============================================================================
// PKCE helpers
// =============================================================================

TEST(PkceTest, S256MatchesRfc7636Vector) {
    EXPECT_EQ(AuthorizationCodeService::computeS256Challenge(kVerifier), kS256Challenge);
    EXPECT_TRUE(AuthorizationCodeService::verifyPkce(kVerifier, kS256Challenge, "S256"));
    EXPECT_FALSE(AuthorizationCodeService::verifyPkce("wrong-verifier", kS256Challenge, "S256"));
}

TEST(PkceTest, AbsentOrEmptyMethodMeansPlain) {
    EXPECT_TRUE(AuthorizationCodeService::verifyPkce("abc", "abc", std::nullopt));
    EXPECT_TRUE(AuthorizationCodeService::verifyPkce("abc", "abc", ""));
    EXPECT_TRUE(AuthorizationCodeService::verifyPkce("abc", "abc", "plain"));
    EXPECT_FALSE(AuthorizationCodeService::verifyPkce("abc", "abd", "plain"));
}

TEST(PkceTest, UnknownMethodNeverVerifies) {
    EXPECT_FALSE(AuthorizationCodeService::verifyPkce("abc", "abc", "S512"));
    EXPECT_FALSE(AuthorizationCodeService::verifyPkce("abc", "abc", "s256"));
    EXPECT_FALSE(AuthorizationCodeService::isSupportedChallengeMethod("S512"));
    EXPECT_TRUE(AuthorizationCodeService::isSupportedChallengeMethod(std::nullopt));
    EXPECT_TRUE(AuthorizationCodeService::isSupportedChallengeMethod("plain"));
    EXPECT_TRUE(AuthorizationCodeService::isSupportedChallengeMethod("S256"));
}

// =============================================================================
// Issue
// =============================================================================

TEST_F(AuthorizationCodeServiceTest, IssueReturnsPlaintextAndStoresSealedRow) {
    auto issued = service->issue(baseRequest());
    ASSERT_TRUE(issued);
    const auto& code = issued.value();

    // 32 random bytes, base64url without padding.
    EXPECT_EQ(code.code.size(), 43u);
    EXPECT_EQ(code.code.find_first_of("+/="), std::string::npos);
    EXPECT_EQ(code.codeHash, SealedTokenCodec::computeHash(code.code));
    EXPECT_EQ(code.expiresAt - code.createdAt, std::chrono::minutes(10));
    EXPECT_FALSE(code.isUsed);

    auto stored = store->findByHash(code.codeHash);
    ASSERT_TRUE(stored);
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_TRUE(stored.value()->code.empty());
    EXPECT_EQ(stored.value()->encryptedCode.find(code.code), std::string::npos);
    EXPECT_EQ(stored.value()->state, std::optional<std::string>("xyz"));
}

TEST_F(AuthorizationCodeServiceTest, IssuedCodesAreUnique) {
    std::set<std::string> codes;
    for (int i = 0; i < 50; ++i) {
        auto issued = service->issue(baseRequest());
        ASSERT_TRUE(issued);
        codes.insert(issued.value().code);
    }
    EXPECT_EQ(codes.size(), 50u);
}

TEST_F(AuthorizationCodeServiceTest, IssueRecordsMetadata) {
    auto request = baseRequest();
    request.metadata.ipAddress = "203.0.113.7";
    request.metadata.userAgent = "test-agent";
    auto issued = service->issue(request);
    ASSERT_TRUE(issued);
    EXPECT_EQ(issued.value().issuedFromIpAddress, std::optional<std::string>("203.0.113.7"));
    EXPECT_EQ(issued.value().issuedFromUserAgent, std::optional<std::string>("test-agent"));
}

TEST_F(AuthorizationCodeServiceTest, IssueRequiresBindingFields) {
    auto request = baseRequest();
    request.redirectUri.clear();
    auto issued = service->issue(request);
    ASSERT_FALSE(issued);
    EXPECT_EQ(issued.error().code(), ErrorCode::InvalidArgument);
}

// =============================================================================
// Validate and consume
// =============================================================================

TEST_F(AuthorizationCodeServiceTest, ConsumeWithS256Verifier) {
    auto issued = service->issue(s256Request());
    ASSERT_TRUE(issued);

    auto consumed = service->validateAndConsume(issued.value().code, "spa",
                                                "https://spa.example.com/callback", kVerifier);
    ASSERT_TRUE(consumed);
    EXPECT_EQ(consumed.value().userId, "user-1");
    EXPECT_EQ(consumed.value().scope, std::optional<std::string>("openid profile"));
    EXPECT_TRUE(consumed.value().isUsed);
    EXPECT_TRUE(consumed.value().usedAt.has_value());
}

TEST_F(AuthorizationCodeServiceTest, CodeIsSingleUse) {
    auto issued = service->issue(baseRequest());
    ASSERT_TRUE(issued);
    const auto& code = issued.value().code;

    ASSERT_TRUE(service->validateAndConsume(code, "spa", "https://spa.example.com/callback"));
    auto second = service->validateAndConsume(code, "spa", "https://spa.example.com/callback");
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code(), ErrorCode::InvalidToken);
    EXPECT_EQ(mockLogger_->countContaining("reason=already used"), 1u);
}

TEST_F(AuthorizationCodeServiceTest, WrongVerifierFailsAndLeavesCodeUsable) {
    auto issued = service->issue(s256Request());
    ASSERT_TRUE(issued);
    const auto& code = issued.value().code;

    auto wrong = service->validateAndConsume(code, "spa", "https://spa.example.com/callback",
                                             "not-the-verifier");
    ASSERT_FALSE(wrong);
    EXPECT_EQ(wrong.error().code(), ErrorCode::InvalidToken);

    auto missing = service->validateAndConsume(code, "spa", "https://spa.example.com/callback");
    ASSERT_FALSE(missing);

    EXPECT_TRUE(service->validateAndConsume(code, "spa", "https://spa.example.com/callback",
                                            kVerifier));
}

TEST_F(AuthorizationCodeServiceTest, PlainChallenge) {
    auto request = baseRequest();
    request.codeChallenge = "plain-verifier-value";
    request.codeChallengeMethod = "plain";
    auto issued = service->issue(request);
    ASSERT_TRUE(issued);

    EXPECT_TRUE(service->validateAndConsume(issued.value().code, "spa",
                                            "https://spa.example.com/callback",
                                            "plain-verifier-value"));
}

TEST_F(AuthorizationCodeServiceTest, UnknownStoredMethodNeverVerifies) {
    auto request = baseRequest();
    request.codeChallenge = "abc";
    request.codeChallengeMethod = "S512";
    auto issued = service->issue(request);
    ASSERT_TRUE(issued);

    EXPECT_FALSE(service->validateAndConsume(issued.value().code, "spa",
                                             "https://spa.example.com/callback", "abc"));
}

TEST_F(AuthorizationCodeServiceTest, ClientAndRedirectBindingIsEnforced) {
    auto issued = service->issue(baseRequest());
    ASSERT_TRUE(issued);
    const auto& code = issued.value().code;

    auto otherClient = service->validateAndConsume(code, "other", "https://spa.example.com/callback");
    ASSERT_FALSE(otherClient);
    EXPECT_EQ(otherClient.error().code(), ErrorCode::InvalidToken);

    auto otherRedirect = service->validateAndConsume(code, "spa", "https://evil.example.com/cb");
    ASSERT_FALSE(otherRedirect);

    EXPECT_EQ(mockLogger_->countContaining("reason=client id mismatch"), 1u);
    EXPECT_EQ(mockLogger_->countContaining("reason=redirect URI mismatch"), 1u);
}

TEST_F(AuthorizationCodeServiceTest, EveryRejectionLooksTheSame) {
    AuthorizationCodeService shortLived(store, protector, std::chrono::minutes(0));
    auto expired = shortLived.issue(baseRequest());
    ASSERT_TRUE(expired);

    auto unknown = service->validateAndConsume("no-such-code", "spa", "https://spa.example.com/callback");
    auto blank = service->validateAndConsume("", "spa", "https://spa.example.com/callback");
    auto late = service->validateAndConsume(expired.value().code, "spa",
                                            "https://spa.example.com/callback");
    ASSERT_FALSE(unknown);
    ASSERT_FALSE(blank);
    ASSERT_FALSE(late);
    EXPECT_EQ(unknown.error().code(), ErrorCode::InvalidToken);
    EXPECT_EQ(unknown.error().message(), blank.error().message());
    EXPECT_EQ(unknown.error().message(), late.error().message());
    EXPECT_EQ(mockLogger_->countContaining("reason=expired"), 1u);
}

TEST_F(AuthorizationCodeServiceTest, SubstitutedCiphertextIsRejected) {
    auto first = service->issue(baseRequest());
    auto second = service->issue(baseRequest());
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);

    // A row whose hash index matches but whose ciphertext belongs to another code.
    AuthorizationCode forged = store->findByHash(first.value().codeHash).value().value();
    forged.id = "forged";
    forged.codeHash = SealedTokenCodec::computeHash("attacker-chosen");
    forged.encryptedCode = store->findByHash(second.value().codeHash).value()->encryptedCode;
    ASSERT_TRUE(store->insert(forged));

    auto result = service->validateAndConsume("attacker-chosen", "spa",
                                              "https://spa.example.com/callback");
    ASSERT_FALSE(result);
    EXPECT_EQ(mockLogger_->countContaining("does not match presented value"), 1u);
}

TEST_F(AuthorizationCodeServiceTest, ConcurrentRedemptionHasExactlyOneWinner) {
    auto issued = service->issue(s256Request());
    ASSERT_TRUE(issued);
    const std::string code = issued.value().code;

    constexpr int kAttempts = 16;
    std::vector<std::future<bool>> futures;
    futures.reserve(kAttempts);
    for (int i = 0; i < kAttempts; ++i) {
        futures.push_back(std::async(std::launch::async, [this, code]() {
            return static_cast<bool>(service->validateAndConsume(
                code, "spa", "https://spa.example.com/callback", kVerifier));
        }));
    }

    int successes = 0;
    for (auto& f : futures) {
        successes += f.get() ? 1 : 0;
    }
    EXPECT_EQ(successes, 1);
}

// =============================================================================
// Cleanup
// =============================================================================

TEST_F(AuthorizationCodeServiceTest, CleanupRemovesExpiredAndUsedCodes) {
    AuthorizationCodeService shortLived(store, protector, std::chrono::minutes(0));
    ASSERT_TRUE(shortLived.issue(baseRequest()));

    auto used = service->issue(baseRequest());
    ASSERT_TRUE(used);
    ASSERT_TRUE(service->validateAndConsume(used.value().code, "spa",
                                            "https://spa.example.com/callback"));
    ASSERT_TRUE(service->issue(baseRequest()));

    auto removed = service->cleanupExpired();
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed.value(), 2u);
    EXPECT_EQ(store->size(), 1u);
}
