/// @file sealed_token.cpp
/// @brief SealedTokenCodec implementation.

#include "cas/service/sealed_token.hpp"

#include "cas/foundation/auth_logger.hpp"

#include "crypto_utils.hpp"

#include <openssl/crypto.h>

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::AuthResult;
using cas::foundation::ErrorCode;
using cas::foundation::LogCategory;
using cas::foundation::LogContext;
using cas::foundation::LogLevel;

SealedTokenCodec::SealedTokenCodec(std::shared_ptr<IDataProtector> protector, std::string purpose)
    : protector_(std::move(protector)), purpose_(std::move(purpose)) {}

std::string SealedTokenCodec::computeHash(std::string_view plaintext) {
    return detail::toHex(detail::sha256(plaintext));
}

AuthResult<SealedValue> SealedTokenCodec::seal(std::string_view plaintext) const {
    if (detail::isBlank(plaintext)) {
        return AuthResult<SealedValue>::err(
            AuthError(ErrorCode::InvalidArgument, "token value must not be blank"));
    }
    auto ciphertext = protector_->protect(purpose_, plaintext);
    if (!ciphertext) {
        return AuthResult<SealedValue>::err(ciphertext.error());
    }
    return AuthResult<SealedValue>::ok(
        SealedValue{std::move(ciphertext).value(), computeHash(plaintext)});
}

bool SealedTokenCodec::matches(std::string_view ciphertext,
                               std::string_view plaintext,
                               std::string_view recordId) const {
    auto opened = protector_->unprotect(purpose_, ciphertext);
    if (!opened) {
        LogContext ctx;
        ctx.recordId = std::string(recordId);
        ctx.extra["purpose"] = purpose_;
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Crypto,
                    "Stored token ciphertext failed authentication (possible tampering)", ctx);
        return false;
    }

    bool equal = detail::constantTimeEqual(opened.value(), plaintext);
    OPENSSL_cleanse(opened.value().data(), opened.value().size());
    if (!equal) {
        LogContext ctx;
        ctx.recordId = std::string(recordId);
        ctx.extra["purpose"] = purpose_;
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Crypto,
                    "Decrypted token does not match presented value (hash collision or "
                    "substituted row)", ctx);
    }
    return equal;
}

}  // namespace cas::service
