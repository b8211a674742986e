/// @file data_protector.cpp
/// @brief AesGcmDataProtector implementation (OpenSSL EVP AES-256-GCM,
///        HKDF-SHA256 subkeys).

#include "cas/service/data_protector.hpp"

#include "cas/foundation/auth_logger.hpp"

#include "crypto_utils.hpp"
#include "evp_utils.hpp"

#include <cstring>

#include <openssl/kdf.h>

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::AuthResult;
using cas::foundation::ErrorCode;
using cas::foundation::LogCategory;

namespace {

constexpr std::string_view kHkdfSalt = "cas-data-protection-v1";

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* p) const noexcept { EVP_CIPHER_CTX_free(p); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

AuthError decryptionFailed() {
    return AuthError(ErrorCode::DecryptionFailed, "ciphertext could not be authenticated");
}

}  // anonymous namespace

AesGcmDataProtector::AesGcmDataProtector(const MasterKey& masterKey) : masterKey_(masterKey) {}

AesGcmDataProtector::~AesGcmDataProtector() {
    OPENSSL_cleanse(masterKey_.data(), masterKey_.size());
    for (auto& [purpose, key] : subkeys_) {
        OPENSSL_cleanse(key.data(), key.size());
    }
}

AuthResult<std::unique_ptr<AesGcmDataProtector>> AesGcmDataProtector::fromConfig(
    const DataProtectionConfig& config) {
    using ResultT = AuthResult<std::unique_ptr<AesGcmDataProtector>>;

    MasterKey key{};
    if (config.masterKey.empty()) {
        if (!detail::secureRandomFill(key.data(), key.size())) {
            return ResultT::err(
                AuthError(ErrorCode::KeyGenerationFailed, "random generator unavailable"));
        }
        CAS_LOG_WARN(LogCategory::Crypto,
                     "No data protection master key configured; using an ephemeral key. "
                     "Sealed tokens will not survive a restart (not production-safe)");
        return ResultT::ok(std::make_unique<AesGcmDataProtector>(key));
    }

    auto decoded = detail::base64DecodeAny(config.masterKey);
    if (!decoded || decoded->size() != kKeyBytes) {
        return ResultT::err(AuthError(ErrorCode::KeyMaterialInvalid,
                                      "data protection master key must be 32 bytes of base64"));
    }
    std::memcpy(key.data(), decoded->data(), kKeyBytes);
    OPENSSL_cleanse(decoded->data(), decoded->size());
    return ResultT::ok(std::make_unique<AesGcmDataProtector>(key));
}

std::string AesGcmDataProtector::generateMasterKey() {
    MasterKey key{};
    if (!detail::secureRandomFill(key.data(), key.size())) {
        return {};
    }
    auto encoded = detail::base64urlEncode(key.data(), key.size());
    OPENSSL_cleanse(key.data(), key.size());
    return encoded;
}

AuthResult<AesGcmDataProtector::MasterKey> AesGcmDataProtector::subkey(
    std::string_view purpose) const {
    std::lock_guard lock(mutex_);
    auto it = subkeys_.find(std::string(purpose));
    if (it != subkeys_.end()) {
        return AuthResult<MasterKey>::ok(it->second);
    }

    detail::PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    MasterKey derived{};
    std::size_t outLen = derived.size();
    if (!ctx || EVP_PKEY_derive_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) != 1 ||
        EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(),
                                    reinterpret_cast<const unsigned char*>(kHkdfSalt.data()),
                                    static_cast<int>(kHkdfSalt.size())) != 1 ||
        EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), masterKey_.data(),
                                   static_cast<int>(masterKey_.size())) != 1 ||
        EVP_PKEY_CTX_add1_hkdf_info(ctx.get(),
                                    reinterpret_cast<const unsigned char*>(purpose.data()),
                                    static_cast<int>(purpose.size())) != 1 ||
        EVP_PKEY_derive(ctx.get(), derived.data(), &outLen) != 1 || outLen != derived.size()) {
        CAS_LOG_ERROR(LogCategory::Crypto,
                      "HKDF subkey derivation failed: " + detail::lastOpenSslError());
        return AuthResult<MasterKey>::err(
            AuthError(ErrorCode::CryptoError, "key derivation failed"));
    }

    subkeys_.emplace(std::string(purpose), derived);
    return AuthResult<MasterKey>::ok(derived);
}

AuthResult<std::string> AesGcmDataProtector::protect(std::string_view purpose,
                                                     std::string_view plaintext) const {
    auto key = subkey(purpose);
    if (!key) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::EncryptionFailed, std::string(key.error().message())));
    }

    // version || nonce || ciphertext || tag
    std::vector<uint8_t> envelope(1 + kNonceBytes + plaintext.size() + kTagBytes);
    envelope[0] = kEnvelopeVersion;
    uint8_t* nonce = envelope.data() + 1;
    uint8_t* body = nonce + kNonceBytes;
    uint8_t* tag = body + plaintext.size();

    if (!detail::secureRandomFill(nonce, kNonceBytes)) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::EncryptionFailed, "random generator unavailable"));
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    int len = 0;
    int finalLen = 0;
    bool ok = ctx &&
              EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                  static_cast<int>(kNonceBytes), nullptr) == 1 &&
              EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.value().data(), nonce) == 1 &&
              EVP_EncryptUpdate(ctx.get(), nullptr, &len,
                                reinterpret_cast<const unsigned char*>(purpose.data()),
                                static_cast<int>(purpose.size())) == 1 &&
              EVP_EncryptUpdate(ctx.get(), body, &len,
                                reinterpret_cast<const unsigned char*>(plaintext.data()),
                                static_cast<int>(plaintext.size())) == 1 &&
              EVP_EncryptFinal_ex(ctx.get(), body + len, &finalLen) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                                  static_cast<int>(kTagBytes), tag) == 1;
    if (!ok) {
        CAS_LOG_ERROR(LogCategory::Crypto,
                      "AES-GCM encryption failed: " + detail::lastOpenSslError());
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::EncryptionFailed, "encryption failed"));
    }

    return AuthResult<std::string>::ok(detail::base64urlEncode(envelope.data(), envelope.size()));
}

AuthResult<std::string> AesGcmDataProtector::unprotect(std::string_view purpose,
                                                       std::string_view ciphertext) const {
    auto envelope = detail::base64DecodeAny(ciphertext);
    if (!envelope || envelope->size() < 1 + kNonceBytes + kTagBytes ||
        (*envelope)[0] != kEnvelopeVersion) {
        return AuthResult<std::string>::err(decryptionFailed());
    }

    auto key = subkey(purpose);
    if (!key) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::DecryptionFailed, std::string(key.error().message())));
    }

    const uint8_t* nonce = envelope->data() + 1;
    const uint8_t* body = nonce + kNonceBytes;
    const std::size_t bodyLen = envelope->size() - 1 - kNonceBytes - kTagBytes;
    std::vector<uint8_t> tag(body + bodyLen, body + bodyLen + kTagBytes);

    std::string plaintext(bodyLen, '\0');
    auto* out = reinterpret_cast<unsigned char*>(plaintext.data());

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    int len = 0;
    int finalLen = 0;
    bool ok = ctx &&
              EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                  static_cast<int>(kNonceBytes), nullptr) == 1 &&
              EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.value().data(), nonce) == 1 &&
              EVP_DecryptUpdate(ctx.get(), nullptr, &len,
                                reinterpret_cast<const unsigned char*>(purpose.data()),
                                static_cast<int>(purpose.size())) == 1 &&
              EVP_DecryptUpdate(ctx.get(), out, &len, body, static_cast<int>(bodyLen)) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                                  static_cast<int>(kTagBytes), tag.data()) == 1 &&
              EVP_DecryptFinal_ex(ctx.get(), out + len, &finalLen) == 1;
    if (!ok) {
        ERR_clear_error();
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return AuthResult<std::string>::err(decryptionFailed());
    }
    return AuthResult<std::string>::ok(std::move(plaintext));
}

}  // namespace cas::service
