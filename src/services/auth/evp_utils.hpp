#pragma once

/// @file evp_utils.hpp
/// @brief Signing, verification and key-parameter helpers on the
///        OpenSSL 3.x EVP API.
///
/// Internal header for the token signer. Keys are loaded from strings via
/// BIO_new_mem_buf (no file I/O) to support testability.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <openssl/pem.h>

#include "crypto_utils.hpp"

namespace cas::service::detail {

// =============================================================================
// RAII owners
// =============================================================================

struct PkeyDeleter {
    void operator()(EVP_PKEY* p) const noexcept { EVP_PKEY_free(p); }
};
struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* p) const noexcept { EVP_PKEY_CTX_free(p); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* p) const noexcept { EVP_MD_CTX_free(p); }
};
struct BioDeleter {
    void operator()(BIO* p) const noexcept { BIO_free(p); }
};
struct BnDeleter {
    void operator()(BIGNUM* p) const noexcept { BN_clear_free(p); }
};
struct ParamBldDeleter {
    void operator()(OSSL_PARAM_BLD* p) const noexcept { OSSL_PARAM_BLD_free(p); }
};
struct ParamDeleter {
    void operator()(OSSL_PARAM* p) const noexcept { OSSL_PARAM_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using ParamBldPtr = std::unique_ptr<OSSL_PARAM_BLD, ParamBldDeleter>;
using ParamPtr = std::unique_ptr<OSSL_PARAM, ParamDeleter>;

/// Text of the most recent OpenSSL error on this thread (and clear the queue).
[[nodiscard]] inline std::string lastOpenSslError() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256] = {};
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

// =============================================================================
// PEM loading
// =============================================================================

/// Load a PEM-encoded private key (PKCS#8 or traditional).
/// @return nullptr on failure.
[[nodiscard]] inline PkeyPtr loadPrivateKeyPem(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }
    return PkeyPtr(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
}

/// Serialize a private key to PKCS#8 PEM. Empty string on failure.
[[nodiscard]] inline std::string privateKeyToPem(EVP_PKEY* pkey) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), pkey, nullptr, nullptr, 0, nullptr,
                                         nullptr) != 1) {
        return {};
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<std::size_t>(len));
}

// =============================================================================
// Sign / verify
// =============================================================================

/// Sign a message.
///
/// @param pkey    Private key.
/// @param md      Digest (EVP_sha256() for RS256), or nullptr for one-shot
///                schemes that hash internally (Ed25519, ML-DSA).
/// @param message The data to sign.
/// @return Raw signature bytes, or empty vector on failure.
[[nodiscard]] inline std::vector<uint8_t> evpSign(EVP_PKEY* pkey,
                                                  const EVP_MD* md,
                                                  std::string_view message) {
    MdCtxPtr mdCtx(EVP_MD_CTX_new());
    if (!mdCtx) {
        return {};
    }
    if (EVP_DigestSignInit(mdCtx.get(), nullptr, md, nullptr, pkey) != 1) {
        return {};
    }

    const auto* data = reinterpret_cast<const unsigned char*>(message.data());

    // Determine signature length.
    std::size_t sigLen = 0;
    if (EVP_DigestSign(mdCtx.get(), nullptr, &sigLen, data, message.size()) != 1) {
        return {};
    }

    std::vector<uint8_t> signature(sigLen);
    if (EVP_DigestSign(mdCtx.get(), signature.data(), &sigLen, data, message.size()) != 1) {
        return {};
    }
    signature.resize(sigLen);
    return signature;
}

/// Verify a signature produced by evpSign with the same digest choice.
[[nodiscard]] inline bool evpVerify(EVP_PKEY* pkey,
                                    const EVP_MD* md,
                                    std::string_view message,
                                    const std::vector<uint8_t>& signature) {
    MdCtxPtr mdCtx(EVP_MD_CTX_new());
    if (!mdCtx) {
        return false;
    }
    if (EVP_DigestVerifyInit(mdCtx.get(), nullptr, md, nullptr, pkey) != 1) {
        return false;
    }
    int rc = EVP_DigestVerify(mdCtx.get(),
                              signature.data(),
                              signature.size(),
                              reinterpret_cast<const unsigned char*>(message.data()),
                              message.size());
    ERR_clear_error();
    return rc == 1;
}

// =============================================================================
// Key parameters <-> base64url
// =============================================================================

/// Read a BIGNUM parameter (e.g. OSSL_PKEY_PARAM_RSA_N) as unpadded
/// big-endian base64url. Empty string when the key lacks the parameter.
[[nodiscard]] inline std::string bnParamToBase64url(const EVP_PKEY* pkey, const char* name) {
    BIGNUM* raw = nullptr;
    if (EVP_PKEY_get_bn_param(pkey, name, &raw) != 1 || raw == nullptr) {
        ERR_clear_error();
        return {};
    }
    BnPtr bn(raw);
    std::vector<uint8_t> bytes(static_cast<std::size_t>(BN_num_bytes(bn.get())));
    BN_bn2bin(bn.get(), bytes.data());
    return base64urlEncode(bytes.data(), bytes.size());
}

/// Read an octet-string parameter (e.g. OSSL_PKEY_PARAM_PUB_KEY) as base64url.
[[nodiscard]] inline std::string octetParamToBase64url(const EVP_PKEY* pkey, const char* name) {
    std::size_t len = 0;
    if (EVP_PKEY_get_octet_string_param(pkey, name, nullptr, 0, &len) != 1 || len == 0) {
        ERR_clear_error();
        return {};
    }
    std::vector<uint8_t> bytes(len);
    if (EVP_PKEY_get_octet_string_param(pkey, name, bytes.data(), bytes.size(), &len) != 1) {
        ERR_clear_error();
        return {};
    }
    return base64urlEncode(bytes.data(), len);
}

/// Decode a base64url big-endian integer into a BIGNUM. nullptr if empty.
[[nodiscard]] inline BnPtr base64urlToBn(std::string_view value) {
    auto bytes = base64urlDecode(value);
    if (bytes.empty()) {
        return nullptr;
    }
    return BnPtr(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
}

}  // namespace cas::service::detail
