/// @file mfa_challenge_service.cpp
/// @brief MfaChallengeService implementation.

#include "cas/service/mfa_challenge_service.hpp"

#include "cas/foundation/auth_logger.hpp"

#include "crypto_utils.hpp"
#include "token_rejection.hpp"

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::AuthResult;
using cas::foundation::ErrorCode;
using cas::foundation::LogCategory;
using cas::foundation::LogContext;
using cas::foundation::LogLevel;

namespace {

constexpr std::string_view kKind = "MFA challenge";

}  // anonymous namespace

MfaChallengeService::MfaChallengeService(std::shared_ptr<IMfaChallengeStore> store,
                                         std::shared_ptr<IDataProtector> protector,
                                         std::chrono::minutes defaultLifetime,
                                         std::chrono::minutes maxLifetime)
    : store_(std::move(store)),
      codec_(std::move(protector), protection_purposes::kMfaChallengeToken),
      defaultLifetime_(defaultLifetime),
      maxLifetime_(maxLifetime < defaultLifetime ? defaultLifetime : maxLifetime) {}

AuthResult<MfaChallengeToken> MfaChallengeService::issue(
    std::string_view userId,
    std::string_view tenantId,
    std::string_view plaintext,
    std::optional<std::chrono::minutes> lifetime,
    const IssuanceMetadata& metadata) {
    if (userId.empty() || tenantId.empty()) {
        return AuthResult<MfaChallengeToken>::err(
            AuthError(ErrorCode::InvalidArgument, "user and tenant are required"));
    }

    auto effective = lifetime.value_or(defaultLifetime_);
    if (effective < std::chrono::minutes(1) || effective > maxLifetime_) {
        return AuthResult<MfaChallengeToken>::err(
            AuthError(ErrorCode::InvalidArgument,
                      "challenge lifetime must be between 1 and " +
                          std::to_string(maxLifetime_.count()) + " minutes"));
    }

    auto sealed = codec_.seal(plaintext);
    if (!sealed) {
        return AuthResult<MfaChallengeToken>::err(sealed.error());
    }

    auto now = Clock::now();
    MfaChallengeToken row;
    row.id = detail::newUuid();
    row.userId = std::string(userId);
    row.tenantId = std::string(tenantId);
    row.encryptedToken = std::move(sealed.value().ciphertext);
    row.tokenHash = std::move(sealed.value().hash);
    row.expiresAt = now + effective;
    row.createdAt = now;
    row.issuedFromIpAddress = metadata.ipAddress;
    row.issuedFromUserAgent = metadata.userAgent;

    auto stored = store_->insert(row);
    if (!stored) {
        return AuthResult<MfaChallengeToken>::err(stored.error());
    }

    LogContext ctx;
    ctx.userId = row.userId;
    ctx.tenantId = row.tenantId;
    ctx.recordId = row.id;
    CAS_LOG_CTX(LogLevel::Debug, LogCategory::Token, "MFA challenge issued", ctx);
    return AuthResult<MfaChallengeToken>::ok(std::move(row));
}

AuthResult<MfaChallengeToken> MfaChallengeService::validateAndConsume(std::string_view plaintext) {
    if (detail::isBlank(plaintext)) {
        return AuthResult<MfaChallengeToken>::err(detail::rejectToken(kKind, "blank token"));
    }

    auto found = store_->findByHash(SealedTokenCodec::computeHash(plaintext));
    if (!found) {
        return AuthResult<MfaChallengeToken>::err(found.error());
    }
    if (!found.value().has_value()) {
        return AuthResult<MfaChallengeToken>::err(detail::rejectToken(kKind, "not found"));
    }

    MfaChallengeToken row = std::move(*found.value());
    LogContext ctx;
    ctx.userId = row.userId;
    ctx.tenantId = row.tenantId;
    ctx.recordId = row.id;

    auto now = Clock::now();
    if (row.isUsed) {
        return AuthResult<MfaChallengeToken>::err(detail::rejectToken(kKind, "already used", ctx));
    }
    if (row.expiresAt <= now) {
        return AuthResult<MfaChallengeToken>::err(detail::rejectToken(kKind, "expired", ctx));
    }
    if (!codec_.matches(row.encryptedToken, plaintext, row.id)) {
        return AuthResult<MfaChallengeToken>::err(
            detail::rejectToken(kKind, "ciphertext mismatch", ctx));
    }

    auto flipped = store_->markUsed(row.id, now);
    if (!flipped) {
        return AuthResult<MfaChallengeToken>::err(flipped.error());
    }
    if (!flipped.value()) {
        return AuthResult<MfaChallengeToken>::err(
            detail::rejectToken(kKind, "consumed concurrently", ctx));
    }

    row.isUsed = true;
    row.usedAt = now;
    CAS_LOG_CTX(LogLevel::Debug, LogCategory::Token, "MFA challenge consumed", ctx);
    return AuthResult<MfaChallengeToken>::ok(std::move(row));
}

AuthResult<std::size_t> MfaChallengeService::cleanupExpired() {
    auto removed = store_->removeExpired(Clock::now());
    if (removed && removed.value() > 0) {
        CAS_LOG_INFO(LogCategory::Token,
                     "Removed " + std::to_string(removed.value()) + " stale MFA challenges");
    }
    return removed;
}

std::string MfaChallengeService::generateChallengeToken() {
    auto bytes = detail::secureRandomBytes(kTokenBytes);
    return detail::base64Encode(bytes.data(), bytes.size());
}

}  // namespace cas::service
