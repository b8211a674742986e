/// @file refresh_token_service.cpp
/// @brief RefreshTokenService implementation.

#include "cas/service/refresh_token_service.hpp"

#include "cas/foundation/auth_logger.hpp"

#include "crypto_utils.hpp"
#include "token_rejection.hpp"

#include <charconv>

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::AuthResult;
using cas::foundation::ErrorCode;
using cas::foundation::LogCategory;
using cas::foundation::LogContext;
using cas::foundation::LogLevel;

namespace {

constexpr std::string_view kKind = "Refresh token";

/// Trim ASCII whitespace from both ends.
std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

}  // anonymous namespace

RefreshTokenService::RefreshTokenService(std::shared_ptr<IRefreshTokenStore> store,
                                         std::shared_ptr<IDataProtector> protector,
                                         std::shared_ptr<ITenantSettingsProvider> settings,
                                         int defaultExpirationDays)
    : store_(std::move(store)),
      settings_(std::move(settings)),
      codec_(std::move(protector), protection_purposes::kRefreshToken),
      defaultExpirationDays_(defaultExpirationDays >= kMinExpirationDays &&
                                     defaultExpirationDays <= kMaxExpirationDays
                                 ? defaultExpirationDays
                                 : kDefaultExpirationDays) {}

AuthResult<RefreshToken> RefreshTokenService::issue(std::string_view userId,
                                                    std::string_view tenantId,
                                                    std::string_view plaintext,
                                                    const IssuanceMetadata& metadata) {
    if (userId.empty() || tenantId.empty()) {
        return AuthResult<RefreshToken>::err(
            AuthError(ErrorCode::InvalidArgument, "user and tenant are required"));
    }

    auto sealed = codec_.seal(plaintext);
    if (!sealed) {
        return AuthResult<RefreshToken>::err(sealed.error());
    }

    auto days = resolveExpirationDays(tenantId);
    auto now = Clock::now();

    RefreshToken row;
    row.id = detail::newUuid();
    row.userId = std::string(userId);
    row.tenantId = std::string(tenantId);
    row.encryptedToken = std::move(sealed.value().ciphertext);
    row.tokenHash = std::move(sealed.value().hash);
    row.expiresAt = now + std::chrono::hours(24 * days);
    row.createdAt = now;
    row.issuedFromIpAddress = metadata.ipAddress;
    row.issuedFromUserAgent = metadata.userAgent;

    auto stored = store_->insert(row);
    if (!stored) {
        return AuthResult<RefreshToken>::err(stored.error());
    }

    LogContext ctx;
    ctx.userId = row.userId;
    ctx.tenantId = row.tenantId;
    ctx.recordId = row.id;
    ctx.extra["expiration_days"] = std::to_string(days);
    CAS_LOG_CTX(LogLevel::Debug, LogCategory::Token, "Refresh token issued", ctx);
    return AuthResult<RefreshToken>::ok(std::move(row));
}

AuthResult<RefreshToken> RefreshTokenService::validate(std::string_view plaintext) {
    if (detail::isBlank(plaintext)) {
        return AuthResult<RefreshToken>::err(detail::rejectToken(kKind, "blank token"));
    }

    auto found = store_->findByHash(SealedTokenCodec::computeHash(plaintext));
    if (!found) {
        return AuthResult<RefreshToken>::err(found.error());
    }
    if (!found.value().has_value()) {
        return AuthResult<RefreshToken>::err(detail::rejectToken(kKind, "not found"));
    }

    RefreshToken row = std::move(*found.value());
    LogContext ctx;
    ctx.userId = row.userId;
    ctx.tenantId = row.tenantId;
    ctx.recordId = row.id;

    auto now = Clock::now();
    if (row.isRevoked) {
        return AuthResult<RefreshToken>::err(detail::rejectToken(kKind, "revoked", ctx));
    }
    if (row.expiresAt <= now) {
        return AuthResult<RefreshToken>::err(detail::rejectToken(kKind, "expired", ctx));
    }
    if (!codec_.matches(row.encryptedToken, plaintext, row.id)) {
        return AuthResult<RefreshToken>::err(
            detail::rejectToken(kKind, "ciphertext mismatch", ctx));
    }

    auto touched = store_->touchUsedAt(row.id, now);
    if (!touched) {
        if (touched.error().code() == ErrorCode::NotFound) {
            return AuthResult<RefreshToken>::err(
                detail::rejectToken(kKind, "removed concurrently", ctx));
        }
        return AuthResult<RefreshToken>::err(touched.error());
    }
    row.usedAt = now;

    CAS_LOG_CTX(LogLevel::Debug, LogCategory::Token, "Refresh token validated", ctx);
    return AuthResult<RefreshToken>::ok(std::move(row));
}

AuthResult<bool> RefreshTokenService::revoke(std::string_view plaintext, std::string_view userId) {
    if (detail::isBlank(plaintext)) {
        return AuthResult<bool>::ok(false);
    }

    auto found = store_->findByHash(SealedTokenCodec::computeHash(plaintext));
    if (!found) {
        return AuthResult<bool>::err(found.error());
    }
    if (!found.value().has_value() || found.value()->userId != userId) {
        return AuthResult<bool>::ok(false);
    }

    const auto& row = *found.value();
    auto revoked = store_->revoke(row.id, Clock::now());
    if (!revoked) {
        // Removed by a concurrent sweep between lookup and update.
        if (revoked.error().code() == ErrorCode::NotFound) {
            return AuthResult<bool>::ok(false);
        }
        return AuthResult<bool>::err(revoked.error());
    }

    if (revoked.value()) {
        LogContext ctx;
        ctx.userId = row.userId;
        ctx.tenantId = row.tenantId;
        ctx.recordId = row.id;
        CAS_LOG_CTX(LogLevel::Debug, LogCategory::Token, "Refresh token revoked", ctx);
    }
    return AuthResult<bool>::ok(true);
}

AuthResult<std::size_t> RefreshTokenService::revokeAll(std::string_view userId,
                                                       std::string_view tenantId) {
    auto count = store_->revokeAllForUser(userId, tenantId, Clock::now());
    if (count) {
        LogContext ctx;
        ctx.userId = std::string(userId);
        ctx.tenantId = std::string(tenantId);
        ctx.extra["count"] = std::to_string(count.value());
        CAS_LOG_CTX(LogLevel::Info, LogCategory::Token, "Revoked all refresh tokens of user", ctx);
    }
    return count;
}

int RefreshTokenService::resolveExpirationDays(std::string_view tenantId) const {
    if (!settings_) {
        return defaultExpirationDays_;
    }

    auto setting = settings_->getSetting(tenantId, tenant_setting_keys::kRefreshTokenExpirationDays);
    if (!setting) {
        LogContext ctx;
        ctx.tenantId = std::string(tenantId);
        ctx.extra["error"] = std::string(setting.error().message());
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Config,
                    "Tenant settings lookup failed; using default refresh token lifetime", ctx);
        return defaultExpirationDays_;
    }
    if (!setting.value().has_value()) {
        return defaultExpirationDays_;
    }

    auto text = trim(*setting.value());
    int days = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), days);
    if (ec == std::errc{} && ptr == text.data() + text.size() && days >= kMinExpirationDays &&
        days <= kMaxExpirationDays) {
        return days;
    }

    LogContext ctx;
    ctx.tenantId = std::string(tenantId);
    ctx.extra["value"] = *setting.value();
    CAS_LOG_CTX(LogLevel::Warning, LogCategory::Config,
                "Invalid RefreshToken.ExpirationDays; using default", ctx);
    return defaultExpirationDays_;
}

AuthResult<std::size_t> RefreshTokenService::cleanupExpired() {
    auto removed = store_->removeExpired(Clock::now());
    if (removed && removed.value() > 0) {
        CAS_LOG_INFO(LogCategory::Token,
                     "Removed " + std::to_string(removed.value()) + " expired refresh tokens");
    }
    return removed;
}

std::string RefreshTokenService::generateRefreshToken() {
    auto bytes = detail::secureRandomBytes(kTokenBytes);
    return detail::base64Encode(bytes.data(), bytes.size());
}

}  // namespace cas::service
