/// @file authorization_code_service.cpp
/// @brief AuthorizationCodeService implementation.
///
/// Redemption order: lookup by hash, terminal state, expiry, client and
/// redirect binding, PKCE, ciphertext double-check, then the conditional
/// used-flag flip. Only the flip winner gets the record back.

#include "cas/service/authorization_code_service.hpp"

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

constexpr std::string_view kKind = "Authorization code";

}  // anonymous namespace

AuthorizationCodeService::AuthorizationCodeService(std::shared_ptr<IAuthorizationCodeStore> store,
                                                   std::shared_ptr<IDataProtector> protector,
                                                   std::chrono::minutes lifetime)
    : store_(std::move(store)),
      codec_(std::move(protector), protection_purposes::kAuthorizationCode),
      lifetime_(lifetime) {}

AuthResult<AuthorizationCode> AuthorizationCodeService::issue(
    const AuthorizationCodeRequest& request) {
    if (request.userId.empty() || request.tenantId.empty() || request.clientId.empty() ||
        request.redirectUri.empty()) {
        return AuthResult<AuthorizationCode>::err(
            AuthError(ErrorCode::InvalidArgument,
                      "user, tenant, client and redirect URI are required"));
    }

    auto randomBytes = detail::secureRandomBytes(kCodeBytes);
    if (randomBytes.empty()) {
        return AuthResult<AuthorizationCode>::err(
            AuthError(ErrorCode::CryptoError, "random generator unavailable"));
    }
    auto code = detail::base64urlEncode(randomBytes.data(), randomBytes.size());

    auto sealed = codec_.seal(code);
    if (!sealed) {
        return AuthResult<AuthorizationCode>::err(sealed.error());
    }

    auto now = Clock::now();
    AuthorizationCode row;
    row.id = detail::newUuid();
    row.codeHash = sealed.value().hash;
    row.encryptedCode = std::move(sealed.value().ciphertext);
    row.userId = request.userId;
    row.tenantId = request.tenantId;
    row.clientId = request.clientId;
    row.redirectUri = request.redirectUri;
    row.scope = request.scope;
    row.state = request.state;
    row.codeChallenge = request.codeChallenge;
    row.codeChallengeMethod = request.codeChallengeMethod;
    row.expiresAt = now + lifetime_;
    row.createdAt = now;
    row.issuedFromIpAddress = request.metadata.ipAddress;
    row.issuedFromUserAgent = request.metadata.userAgent;

    auto stored = store_->insert(row);
    if (!stored) {
        return AuthResult<AuthorizationCode>::err(stored.error());
    }

    LogContext ctx;
    ctx.userId = row.userId;
    ctx.tenantId = row.tenantId;
    ctx.clientId = row.clientId;
    ctx.recordId = row.id;
    CAS_LOG_CTX(LogLevel::Debug, LogCategory::Token, "Authorization code issued", ctx);

    row.code = std::move(code);
    return AuthResult<AuthorizationCode>::ok(std::move(row));
}

AuthResult<AuthorizationCode> AuthorizationCodeService::validateAndConsume(
    std::string_view code,
    std::string_view clientId,
    std::string_view redirectUri,
    std::optional<std::string_view> codeVerifier) {
    if (detail::isBlank(code)) {
        return AuthResult<AuthorizationCode>::err(detail::rejectToken(kKind, "blank code"));
    }

    auto found = store_->findByHash(SealedTokenCodec::computeHash(code));
    if (!found) {
        return AuthResult<AuthorizationCode>::err(found.error());
    }
    if (!found.value().has_value()) {
        return AuthResult<AuthorizationCode>::err(detail::rejectToken(kKind, "not found"));
    }

    AuthorizationCode row = std::move(*found.value());
    LogContext ctx;
    ctx.userId = row.userId;
    ctx.tenantId = row.tenantId;
    ctx.clientId = std::string(clientId);
    ctx.recordId = row.id;

    auto now = Clock::now();
    if (row.isUsed) {
        return AuthResult<AuthorizationCode>::err(detail::rejectToken(kKind, "already used", ctx));
    }
    if (row.expiresAt <= now) {
        return AuthResult<AuthorizationCode>::err(detail::rejectToken(kKind, "expired", ctx));
    }
    if (row.clientId != clientId) {
        return AuthResult<AuthorizationCode>::err(
            detail::rejectToken(kKind, "client id mismatch", ctx));
    }
    if (row.redirectUri != redirectUri) {
        return AuthResult<AuthorizationCode>::err(
            detail::rejectToken(kKind, "redirect URI mismatch", ctx));
    }

    if (row.codeChallenge && !detail::isBlank(*row.codeChallenge)) {
        if (!codeVerifier || detail::isBlank(*codeVerifier)) {
            return AuthResult<AuthorizationCode>::err(
                detail::rejectToken(kKind, "code verifier missing", ctx));
        }
        std::optional<std::string_view> method;
        if (row.codeChallengeMethod) {
            method = *row.codeChallengeMethod;
        }
        if (!verifyPkce(*codeVerifier, *row.codeChallenge, method)) {
            return AuthResult<AuthorizationCode>::err(
                detail::rejectToken(kKind, "code verifier mismatch", ctx));
        }
    }

    if (!codec_.matches(row.encryptedCode, code, row.id)) {
        return AuthResult<AuthorizationCode>::err(
            detail::rejectToken(kKind, "ciphertext mismatch", ctx));
    }

    auto flipped = store_->markUsed(row.id, now);
    if (!flipped) {
        return AuthResult<AuthorizationCode>::err(flipped.error());
    }
    if (!flipped.value()) {
        return AuthResult<AuthorizationCode>::err(
            detail::rejectToken(kKind, "consumed concurrently", ctx));
    }

    row.isUsed = true;
    row.usedAt = now;
    CAS_LOG_CTX(LogLevel::Debug, LogCategory::Token, "Authorization code consumed", ctx);
    return AuthResult<AuthorizationCode>::ok(std::move(row));
}

AuthResult<std::size_t> AuthorizationCodeService::cleanupExpired() {
    auto removed = store_->removeExpired(Clock::now());
    if (removed && removed.value() > 0) {
        CAS_LOG_INFO(LogCategory::Token,
                     "Removed " + std::to_string(removed.value()) + " stale authorization codes");
    }
    return removed;
}

bool AuthorizationCodeService::verifyPkce(std::string_view codeVerifier,
                                          std::string_view codeChallenge,
                                          std::optional<std::string_view> method) {
    if (!method || method->empty() || *method == pkce_methods::kPlain) {
        return detail::constantTimeEqual(codeVerifier, codeChallenge);
    }
    if (*method == pkce_methods::kS256) {
        return detail::constantTimeEqual(computeS256Challenge(codeVerifier), codeChallenge);
    }
    return false;
}

std::string AuthorizationCodeService::computeS256Challenge(std::string_view codeVerifier) {
    auto digest = detail::sha256(codeVerifier);
    return detail::base64urlEncode(digest.data(), digest.size());
}

bool AuthorizationCodeService::isSupportedChallengeMethod(std::optional<std::string_view> method) {
    return !method || method->empty() || *method == pkce_methods::kPlain ||
           *method == pkce_methods::kS256;
}

}  // namespace cas::service
