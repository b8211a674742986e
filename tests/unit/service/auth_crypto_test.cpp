#include <gtest/gtest.h>

#include "cas/service/data_protector.hpp"
#include "cas/service/sealed_token.hpp"
#include "cas/service/secret_hasher.hpp"
#include "cas/service/token_types.hpp"

#include <future>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "../../support/mock_logger.hpp"

using namespace cas::service;
using cas::foundation::ErrorCode;

namespace {

std::shared_ptr<AesGcmDataProtector> makeProtector(uint8_t fill = 0x42) {
    AesGcmDataProtector::MasterKey key{};
    key.fill(fill);
    return std::make_shared<AesGcmDataProtector>(key);
}

}  // namespace

// =============================================================================
// AesGcmDataProtector tests
// =============================================================================

TEST(DataProtectorTest, ProtectUnprotectRoundTrip) {
    auto protector = makeProtector();
    auto sealed = protector->protect("RefreshToken", "opaque-token-value");
    ASSERT_TRUE(sealed);
    EXPECT_EQ(sealed.value().find("opaque-token-value"), std::string::npos);

    auto opened = protector->unprotect("RefreshToken", sealed.value());
    ASSERT_TRUE(opened);
    EXPECT_EQ(opened.value(), "opaque-token-value");
}

TEST(DataProtectorTest, CiphertextIsRandomized) {
    auto protector = makeProtector();
    auto a = protector->protect("AuthorizationCode", "same");
    auto b = protector->protect("AuthorizationCode", "same");
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_NE(a.value(), b.value());
}

TEST(DataProtectorTest, PurposesAreIsolated) {
    auto protector = makeProtector();
    auto sealed = protector->protect("RefreshToken", "value");
    ASSERT_TRUE(sealed);

    auto opened = protector->unprotect("MfaChallengeToken", sealed.value());
    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.error().code(), ErrorCode::DecryptionFailed);
}

TEST(DataProtectorTest, DifferentMasterKeysDoNotInteroperate) {
    auto sealed = makeProtector(0x01)->protect("RefreshToken", "value");
    ASSERT_TRUE(sealed);
    EXPECT_FALSE(makeProtector(0x02)->unprotect("RefreshToken", sealed.value()));
}

TEST(DataProtectorTest, TamperedCiphertextIsRejected) {
    auto protector = makeProtector();
    auto sealed = protector->protect("RefreshToken", "value");
    ASSERT_TRUE(sealed);

    std::string tampered = sealed.value();
    auto pos = tampered.size() / 2;
    tampered[pos] = tampered[pos] == 'A' ? 'B' : 'A';
    auto opened = protector->unprotect("RefreshToken", tampered);
    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.error().code(), ErrorCode::DecryptionFailed);
}

TEST(DataProtectorTest, GarbageInputIsRejected) {
    auto protector = makeProtector();
    EXPECT_FALSE(protector->unprotect("RefreshToken", ""));
    EXPECT_FALSE(protector->unprotect("RefreshToken", "not*base64"));
    EXPECT_FALSE(protector->unprotect("RefreshToken", "AQID"));
}

TEST(DataProtectorTest, FromConfigAcceptsGeneratedMasterKey) {
    DataProtectionConfig config;
    config.masterKey = AesGcmDataProtector::generateMasterKey();
    ASSERT_FALSE(config.masterKey.empty());

    auto first = AesGcmDataProtector::fromConfig(config);
    auto second = AesGcmDataProtector::fromConfig(config);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);

    // Same configured key: ciphertexts survive a "restart".
    auto sealed = first.value()->protect("RefreshToken", "persisted");
    ASSERT_TRUE(sealed);
    auto opened = second.value()->unprotect("RefreshToken", sealed.value());
    ASSERT_TRUE(opened);
    EXPECT_EQ(opened.value(), "persisted");
}

TEST(DataProtectorTest, FromConfigRejectsMalformedKey) {
    DataProtectionConfig config;
    config.masterKey = "c2hvcnQ=";  // "short"
    auto result = AesGcmDataProtector::fromConfig(config);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::KeyMaterialInvalid);
}

class EphemeralProtectorTest : public cas::test::MockLoggerTest {};

TEST_F(EphemeralProtectorTest, EmptyKeyIsEphemeralAndWarns) {
    auto result = AesGcmDataProtector::fromConfig(DataProtectionConfig{});
    ASSERT_TRUE(result);
    EXPECT_EQ(mockLogger_->countContaining("ephemeral key"), 1u);
}

TEST(DataProtectorTest, ConcurrentUseAcrossPurposes) {
    auto protector = makeProtector();
    std::vector<std::future<bool>> futures;
    for (int i = 0; i < 16; ++i) {
        futures.push_back(std::async(std::launch::async, [protector, i]() {
            std::string purpose = (i % 2 == 0) ? "RefreshToken" : "MfaChallengeToken";
            std::string value = "value-" + std::to_string(i);
            auto sealed = protector->protect(purpose, value);
            if (!sealed) {
                return false;
            }
            auto opened = protector->unprotect(purpose, sealed.value());
            return opened && opened.value() == value;
        }));
    }
    for (auto& f : futures) {
        EXPECT_TRUE(f.get());
    }
}

// =============================================================================
// Pbkdf2SecretHasher tests
// =============================================================================

class SecretHasherTest : public ::testing::Test {
protected:
    Pbkdf2SecretHasher hasher{1000};
};

TEST_F(SecretHasherTest, HashUsesSelfDescribingEncoding) {
    auto hashed = hasher.hash("client-secret");
    ASSERT_TRUE(hashed);
    EXPECT_EQ(hashed.value().rfind("pbkdf2_sha256$1000$", 0), 0u);
    EXPECT_EQ(hashed.value().find("client-secret"), std::string::npos);
}

TEST_F(SecretHasherTest, SameSecretHashesDifferentlyAndBothVerify) {
    auto a = hasher.hash("client-secret");
    auto b = hasher.hash("client-secret");
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_NE(a.value(), b.value());
    EXPECT_EQ(hasher.verify(a.value(), "client-secret"), SecretVerification::Success);
    EXPECT_EQ(hasher.verify(b.value(), "client-secret"), SecretVerification::Success);
}

TEST_F(SecretHasherTest, WrongSecretFails) {
    auto hashed = hasher.hash("client-secret");
    ASSERT_TRUE(hashed);
    EXPECT_EQ(hasher.verify(hashed.value(), "client-secreT"), SecretVerification::Failed);
    EXPECT_EQ(hasher.verify(hashed.value(), ""), SecretVerification::Failed);
}

TEST_F(SecretHasherTest, BlankSecretCannotBeHashed) {
    auto empty = hasher.hash("");
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code(), ErrorCode::InvalidArgument);
    EXPECT_FALSE(hasher.hash("   \t"));
}

TEST_F(SecretHasherTest, MalformedHashNeverVerifies) {
    EXPECT_EQ(hasher.verify("", "x"), SecretVerification::Failed);
    EXPECT_EQ(hasher.verify("plaintext", "plaintext"), SecretVerification::Failed);
    EXPECT_EQ(hasher.verify("pbkdf2_sha256$abc$AAAA$AAAA", "x"), SecretVerification::Failed);
    EXPECT_EQ(hasher.verify("bcrypt$1000$AAAA$AAAA", "x"), SecretVerification::Failed);
}

TEST_F(SecretHasherTest, WeakerHashRequestsRehash) {
    auto weak = hasher.hash("client-secret");
    ASSERT_TRUE(weak);

    Pbkdf2SecretHasher stronger(2000);
    EXPECT_EQ(stronger.verify(weak.value(), "client-secret"),
              SecretVerification::SuccessRehashNeeded);
    EXPECT_EQ(stronger.verify(weak.value(), "wrong"), SecretVerification::Failed);
}

TEST(SecretHasherConfigTest, IterationFloorIsEnforced) {
    Pbkdf2SecretHasher hasher(10);
    EXPECT_EQ(hasher.iterations(), 1000u);
}

// =============================================================================
// SealedTokenCodec tests
// =============================================================================

class SealedTokenCodecTest : public cas::test::MockLoggerTest {
protected:
    std::shared_ptr<AesGcmDataProtector> protector = makeProtector();
    SealedTokenCodec codec{protector, protection_purposes::kRefreshToken};
};

TEST_F(SealedTokenCodecTest, ComputeHashIsLowercaseHexSha256) {
    EXPECT_EQ(SealedTokenCodec::computeHash("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(SealedTokenCodec::computeHash("abc"), SealedTokenCodec::computeHash("abc"));
    EXPECT_NE(SealedTokenCodec::computeHash("abc"), SealedTokenCodec::computeHash("abd"));
}

TEST_F(SealedTokenCodecTest, SealProducesHashAndCiphertext) {
    auto sealed = codec.seal("token-1");
    ASSERT_TRUE(sealed);
    EXPECT_EQ(sealed.value().hash, SealedTokenCodec::computeHash("token-1"));
    EXPECT_TRUE(codec.matches(sealed.value().ciphertext, "token-1", "row-1"));
    EXPECT_EQ(codec.purpose(), "RefreshToken");
}

TEST_F(SealedTokenCodecTest, SealRejectsBlankInput) {
    auto sealed = codec.seal(" ");
    ASSERT_FALSE(sealed);
    EXPECT_EQ(sealed.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(SealedTokenCodecTest, MismatchIsLoggedAsIntegritySignal) {
    auto sealed = codec.seal("token-1");
    ASSERT_TRUE(sealed);

    EXPECT_FALSE(codec.matches(sealed.value().ciphertext, "token-2", "row-1"));
    EXPECT_EQ(mockLogger_->countContaining("does not match presented value"), 1u);
    EXPECT_EQ(mockLogger_->countContaining("record_id=row-1"), 1u);
}

TEST_F(SealedTokenCodecTest, CiphertextFromOtherPurposeFailsAuthentication) {
    SealedTokenCodec other(protector, protection_purposes::kMfaChallengeToken);
    auto sealed = other.seal("token-1");
    ASSERT_TRUE(sealed);

    EXPECT_FALSE(codec.matches(sealed.value().ciphertext, "token-1", "row-7"));
    EXPECT_EQ(mockLogger_->countContaining("possible tampering"), 1u);
}
