#include <gtest/gtest.h>

#include "cas/foundation/config_manager.hpp"
#include "cas/service/auth_config.hpp"

#include <chrono>
#include <string>

using namespace cas::service;
using cas::foundation::ConfigManager;
using cas::foundation::ErrorCode;

TEST(AuthConfigTest, DefaultsWhenNothingIsConfigured) {
    ConfigManager config;
    auto loaded = loadAuthConfig(config);
    ASSERT_TRUE(loaded);

    const auto& cfg = loaded.value();
    EXPECT_EQ(cfg.jwt.expiration, std::chrono::minutes(15));
    EXPECT_EQ(cfg.jwt.algorithm, SignatureAlgorithm::RS256);
    EXPECT_EQ(cfg.jwt.keyId, "auth-key-1");
    EXPECT_TRUE(cfg.jwt.signingKey.empty());
    EXPECT_EQ(cfg.jwt.rsaKeyBits, 2048u);
    EXPECT_TRUE(cfg.dataProtection.masterKey.empty());
    EXPECT_EQ(cfg.secretHashIterations, 100000u);
    EXPECT_EQ(cfg.authorizationCodeLifetime, std::chrono::minutes(10));
    EXPECT_EQ(cfg.mfaChallengeLifetime, std::chrono::minutes(10));
    EXPECT_EQ(cfg.mfaChallengeMaxLifetime, std::chrono::minutes(60));
    EXPECT_EQ(cfg.refreshTokenDefaultDays, 30);
}

TEST(AuthConfigTest, ReadsEveryKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(R"(
jwt:
  issuer: https://auth.example.com
  audience: api
  expiration_minutes: 30
  algorithm: EdDSA
  key_id: key-2026
  signing_key: "{\"kty\":\"OKP\"}"
  rsa_key_bits: 4096
data_protection:
  master_key: AAAA
client_secrets:
  pbkdf2_iterations: 200000
authorization_code:
  lifetime_minutes: 5
mfa:
  lifetime_minutes: 3
  max_lifetime_minutes: 20
refresh_token:
  default_expiration_days: 14
)"));

    auto loaded = loadAuthConfig(config);
    ASSERT_TRUE(loaded);
    const auto& cfg = loaded.value();
    EXPECT_EQ(cfg.jwt.issuer, "https://auth.example.com");
    EXPECT_EQ(cfg.jwt.audience, "api");
    EXPECT_EQ(cfg.jwt.expiration, std::chrono::minutes(30));
    EXPECT_EQ(cfg.jwt.algorithm, SignatureAlgorithm::EdDSA);
    EXPECT_EQ(cfg.jwt.keyId, "key-2026");
    EXPECT_EQ(cfg.jwt.signingKey, "{\"kty\":\"OKP\"}");
    EXPECT_EQ(cfg.jwt.rsaKeyBits, 4096u);
    EXPECT_EQ(cfg.dataProtection.masterKey, "AAAA");
    EXPECT_EQ(cfg.secretHashIterations, 200000u);
    EXPECT_EQ(cfg.authorizationCodeLifetime, std::chrono::minutes(5));
    EXPECT_EQ(cfg.mfaChallengeLifetime, std::chrono::minutes(3));
    EXPECT_EQ(cfg.mfaChallengeMaxLifetime, std::chrono::minutes(20));
    EXPECT_EQ(cfg.refreshTokenDefaultDays, 14);
}

TEST(AuthConfigTest, StringValuesFromEnvironmentAreAccepted) {
    ConfigManager config;
    config.set<std::string>("jwt.expiration_minutes", "45");
    config.set<std::string>("jwt.algorithm", "ML-DSA-65");

    auto loaded = loadAuthConfig(config);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value().jwt.expiration, std::chrono::minutes(45));
    EXPECT_EQ(loaded.value().jwt.algorithm, SignatureAlgorithm::MlDsa65);
}

TEST(AuthConfigTest, OutOfRangeValuesAreRejected) {
    const std::pair<const char*, long long> cases[] = {
        {"jwt.expiration_minutes", 0},
        {"jwt.expiration_minutes", 24 * 60 + 1},
        {"jwt.rsa_key_bits", 1024},
        {"client_secrets.pbkdf2_iterations", 999},
        {"authorization_code.lifetime_minutes", 61},
        {"mfa.max_lifetime_minutes", 0},
        {"mfa.lifetime_minutes", 61},
        {"refresh_token.default_expiration_days", 366},
        {"refresh_token.default_expiration_days", -1},
    };
    for (const auto& [key, value] : cases) {
        ConfigManager config;
        config.set(key, value);
        auto loaded = loadAuthConfig(config);
        ASSERT_FALSE(loaded) << key << "=" << value;
        EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigTypeMismatch) << key;
    }
}

TEST(AuthConfigTest, MfaLifetimeIsBoundedByConfiguredMaximum) {
    ConfigManager config;
    config.set<long long>("mfa.max_lifetime_minutes", 5);
    config.set<long long>("mfa.lifetime_minutes", 6);
    auto loaded = loadAuthConfig(config);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigTypeMismatch);

    config.set<long long>("mfa.lifetime_minutes", 5);
    ASSERT_TRUE(loadAuthConfig(config));
}

TEST(AuthConfigTest, InvalidTypesAndNamesAreRejected) {
    ConfigManager config;
    config.set<std::string>("jwt.expiration_minutes", "fifteen");
    auto badNumber = loadAuthConfig(config);
    ASSERT_FALSE(badNumber);
    EXPECT_EQ(badNumber.error().code(), ErrorCode::ConfigTypeMismatch);

    ConfigManager algorithm;
    algorithm.set<std::string>("jwt.algorithm", "HS256");
    auto badAlgorithm = loadAuthConfig(algorithm);
    ASSERT_FALSE(badAlgorithm);
    EXPECT_EQ(badAlgorithm.error().code(), ErrorCode::ConfigTypeMismatch);

    ConfigManager keyId;
    keyId.set<std::string>("jwt.key_id", "");
    auto emptyKeyId = loadAuthConfig(keyId);
    ASSERT_FALSE(emptyKeyId);
    EXPECT_EQ(emptyKeyId.error().code(), ErrorCode::ConfigTypeMismatch);
}
