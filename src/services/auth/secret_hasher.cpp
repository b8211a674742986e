/// @file secret_hasher.cpp
/// @brief Pbkdf2SecretHasher implementation on OpenSSL PKCS5_PBKDF2_HMAC.

#include "cas/service/secret_hasher.hpp"

#include "cas/foundation/auth_logger.hpp"

#include "crypto_utils.hpp"

#include <charconv>
#include <vector>

#include <openssl/evp.h>

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::AuthResult;
using cas::foundation::ErrorCode;
using cas::foundation::LogCategory;

namespace {

/// Lower bound accepted when decoding a stored hash.
constexpr uint32_t kMinIterations = 1000;

bool deriveKey(std::string_view plain,
               const std::vector<uint8_t>& salt,
               uint32_t iterations,
               std::vector<uint8_t>& out) {
    return PKCS5_PBKDF2_HMAC(plain.data(),
                             static_cast<int>(plain.size()),
                             salt.data(),
                             static_cast<int>(salt.size()),
                             static_cast<int>(iterations),
                             EVP_sha256(),
                             static_cast<int>(out.size()),
                             out.data()) == 1;
}

}  // anonymous namespace

Pbkdf2SecretHasher::Pbkdf2SecretHasher(uint32_t iterations)
    : iterations_(iterations < kMinIterations ? kMinIterations : iterations) {}

AuthResult<std::string> Pbkdf2SecretHasher::hash(std::string_view plain) const {
    if (detail::isBlank(plain)) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::InvalidArgument, "secret must not be blank"));
    }

    auto salt = detail::secureRandomBytes(kSaltBytes);
    if (salt.empty()) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::CryptoError, "random generator unavailable"));
    }

    std::vector<uint8_t> key(kKeyBytes);
    if (!deriveKey(plain, salt, iterations_, key)) {
        CAS_LOG_ERROR(LogCategory::Crypto, "PBKDF2 derivation failed");
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::CryptoError, "secret hashing failed"));
    }

    std::string encoded(kScheme);
    encoded += '$';
    encoded += std::to_string(iterations_);
    encoded += '$';
    encoded += detail::base64Encode(salt.data(), salt.size());
    encoded += '$';
    encoded += detail::base64Encode(key.data(), key.size());
    return AuthResult<std::string>::ok(std::move(encoded));
}

SecretVerification Pbkdf2SecretHasher::verify(std::string_view encodedHash,
                                              std::string_view plain) const {
    if (detail::isBlank(plain) || encodedHash.empty()) {
        return SecretVerification::Failed;
    }

    // scheme$iterations$salt$key
    std::string_view parts[4];
    std::size_t start = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        auto pos = (i < 3) ? encodedHash.find('$', start) : std::string_view::npos;
        if (i < 3 && pos == std::string_view::npos) {
            return SecretVerification::Failed;
        }
        parts[i] = encodedHash.substr(start, pos == std::string_view::npos ? pos : pos - start);
        start = pos + 1;
    }
    if (parts[0] != kScheme || parts[3].find('$') != std::string_view::npos) {
        return SecretVerification::Failed;
    }

    uint32_t storedIterations = 0;
    auto [ptr, ec] = std::from_chars(parts[1].data(), parts[1].data() + parts[1].size(),
                                     storedIterations);
    if (ec != std::errc{} || ptr != parts[1].data() + parts[1].size() ||
        storedIterations < kMinIterations) {
        return SecretVerification::Failed;
    }

    auto salt = detail::base64DecodeAny(parts[2]);
    auto expected = detail::base64DecodeAny(parts[3]);
    if (!salt || !expected || salt->empty() || expected->empty()) {
        return SecretVerification::Failed;
    }

    std::vector<uint8_t> computed(expected->size());
    if (!deriveKey(plain, *salt, storedIterations, computed)) {
        CAS_LOG_ERROR(LogCategory::Crypto, "PBKDF2 derivation failed during verify");
        return SecretVerification::Failed;
    }
    if (!detail::constantTimeEqual(computed, *expected)) {
        return SecretVerification::Failed;
    }
    return storedIterations < iterations_ ? SecretVerification::SuccessRehashNeeded
                                          : SecretVerification::Success;
}

}  // namespace cas::service
