/// @file token_signer.cpp
/// @brief OpenSSL 3 EVP token signers and JWK import/export.
///
/// RS256 signs with EVP_DigestSign over SHA-256; EdDSA and ML-DSA-65 are
/// one-shot schemes and pass a null digest. Loaded keys are checked with
/// a sign/verify round trip before use.

#include "cas/service/token_signer.hpp"

#include "cas/foundation/auth_logger.hpp"

#include "crypto_utils.hpp"
#include "evp_utils.hpp"
#include "json_utils.hpp"

#include <openssl/rsa.h>

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::AuthResult;
using cas::foundation::ErrorCode;
using cas::foundation::LogCategory;

namespace detail {

struct EvpKeyHolder {
    PkeyPtr pkey;
};

}  // namespace detail

namespace {

constexpr std::string_view kSelfTestMessage = "cas-signing-key-self-test";

/// OpenSSL key type name for a one-shot algorithm.
const char* keyTypeName(SignatureAlgorithm alg) {
    return alg == SignatureAlgorithm::MlDsa65 ? "ML-DSA-65" : "ED25519";
}

/// Whether any loaded provider implements key management for @p name.
bool providerSupports(const char* name) {
    EVP_KEYMGMT* mgmt = EVP_KEYMGMT_fetch(nullptr, name, nullptr);
    if (mgmt == nullptr) {
        ERR_clear_error();
        return false;
    }
    EVP_KEYMGMT_free(mgmt);
    return true;
}

AuthError invalidKey(std::string message) {
    return AuthError(ErrorCode::KeyMaterialInvalid, std::move(message));
}

AuthError unsupported(SignatureAlgorithm alg) {
    return AuthError(ErrorCode::UnsupportedAlgorithm,
                     std::string(signatureAlgorithmName(alg)) +
                         " is not available in the linked OpenSSL providers");
}

std::unique_ptr<detail::EvpKeyHolder> hold(EVP_PKEY* pkey) {
    auto holder = std::make_unique<detail::EvpKeyHolder>();
    holder->pkey.reset(pkey);
    return holder;
}

/// Raw public or private key bytes via the generic raw-key accessors.
std::vector<uint8_t> rawKey(EVP_PKEY* pkey, bool privateHalf) {
    std::size_t len = 0;
    int rc = privateHalf ? EVP_PKEY_get_raw_private_key(pkey, nullptr, &len)
                         : EVP_PKEY_get_raw_public_key(pkey, nullptr, &len);
    if (rc != 1 || len == 0) {
        ERR_clear_error();
        return {};
    }
    std::vector<uint8_t> out(len);
    rc = privateHalf ? EVP_PKEY_get_raw_private_key(pkey, out.data(), &len)
                     : EVP_PKEY_get_raw_public_key(pkey, out.data(), &len);
    if (rc != 1) {
        ERR_clear_error();
        return {};
    }
    out.resize(len);
    return out;
}

/// Common JWK header members: kty, use, alg, kid (and crv for OKP).
std::string jwkPrefix(std::string_view kty,
                      std::string_view alg,
                      std::string_view kid,
                      std::string_view crv = {}) {
    std::string out = "{\"kty\":" + detail::jsonEscape(kty);
    if (!crv.empty()) {
        out += ",\"crv\":" + detail::jsonEscape(crv);
    }
    out += ",\"use\":\"sig\",\"alg\":" + detail::jsonEscape(alg);
    out += ",\"kid\":" + detail::jsonEscape(kid);
    return out;
}

std::string trimmed(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\n' || s.front() == '\r' ||
                          s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() &&
           (s.back() == ' ' || s.back() == '\n' || s.back() == '\r' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return std::string(s);
}

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

}  // anonymous namespace

// ---------------------------------------------------------------------------
// EvpTokenSigner
// ---------------------------------------------------------------------------

EvpTokenSigner::EvpTokenSigner(std::unique_ptr<detail::EvpKeyHolder> key,
                               SignatureAlgorithm algorithm,
                               std::string keyId)
    : key_(std::move(key)), algorithm_(algorithm), keyId_(std::move(keyId)) {}

EvpTokenSigner::~EvpTokenSigner() = default;

AuthResult<std::vector<uint8_t>> EvpTokenSigner::sign(std::string_view data) const {
    const EVP_MD* md = algorithm_ == SignatureAlgorithm::RS256 ? EVP_sha256() : nullptr;
    auto signature = detail::evpSign(key_->pkey.get(), md, data);
    if (signature.empty()) {
        CAS_LOG_ERROR(LogCategory::Crypto, "Token signing failed: " + detail::lastOpenSslError());
        return AuthResult<std::vector<uint8_t>>::err(
            AuthError(ErrorCode::SigningFailed, "token signing failed"));
    }
    return AuthResult<std::vector<uint8_t>>::ok(std::move(signature));
}

bool EvpTokenSigner::verify(std::string_view data, const std::vector<uint8_t>& signature) const {
    if (signature.empty()) {
        return false;
    }
    const EVP_MD* md = algorithm_ == SignatureAlgorithm::RS256 ? EVP_sha256() : nullptr;
    return detail::evpVerify(key_->pkey.get(), md, data, signature);
}

std::string EvpTokenSigner::exportPrivatePem() const {
    return detail::privateKeyToPem(key_->pkey.get());
}

AuthResult<void> EvpTokenSigner::selfTest() const {
    auto signature = sign(kSelfTestMessage);
    if (!signature) {
        return AuthResult<void>::err(invalidKey("key cannot produce signatures"));
    }
    if (!verify(kSelfTestMessage, signature.value())) {
        return AuthResult<void>::err(invalidKey("public and private key halves do not match"));
    }
    return AuthResult<void>::ok();
}

// ---------------------------------------------------------------------------
// RsaTokenSigner
// ---------------------------------------------------------------------------

RsaTokenSigner::RsaTokenSigner(ConstructionKey,
                               std::unique_ptr<detail::EvpKeyHolder> key,
                               std::string keyId)
    : EvpTokenSigner(std::move(key), SignatureAlgorithm::RS256, std::move(keyId)) {}

AuthResult<std::unique_ptr<RsaTokenSigner>> RsaTokenSigner::adopt(
    std::unique_ptr<detail::EvpKeyHolder> key, std::string keyId) {
    using ResultT = AuthResult<std::unique_ptr<RsaTokenSigner>>;
    if (!key->pkey || EVP_PKEY_is_a(key->pkey.get(), "RSA") != 1) {
        return ResultT::err(invalidKey("not an RSA private key"));
    }
    if (EVP_PKEY_get_bits(key->pkey.get()) < static_cast<int>(kMinKeyBits)) {
        return ResultT::err(invalidKey("RSA key must be at least 2048 bits"));
    }
    auto signer =
        std::make_unique<RsaTokenSigner>(ConstructionKey{}, std::move(key), std::move(keyId));
    auto check = signer->selfTest();
    if (!check) {
        return ResultT::err(check.error());
    }
    return ResultT::ok(std::move(signer));
}

AuthResult<std::unique_ptr<RsaTokenSigner>> RsaTokenSigner::generate(std::string keyId,
                                                                    uint32_t bits) {
    using ResultT = AuthResult<std::unique_ptr<RsaTokenSigner>>;
    if (bits < kMinKeyBits) {
        return ResultT::err(
            AuthError(ErrorCode::InvalidArgument, "RSA key size must be at least 2048 bits"));
    }
    EVP_PKEY* pkey = EVP_RSA_gen(bits);
    if (pkey == nullptr) {
        return ResultT::err(AuthError(ErrorCode::KeyGenerationFailed,
                                      "RSA key generation failed: " + detail::lastOpenSslError()));
    }
    return adopt(hold(pkey), std::move(keyId));
}

AuthResult<std::unique_ptr<RsaTokenSigner>> RsaTokenSigner::fromJwk(std::string_view jwkJson,
                                                                   std::string keyId) {
    using ResultT = AuthResult<std::unique_ptr<RsaTokenSigner>>;
    auto members = detail::parseFlatJsonObject(jwkJson);
    if (!members) {
        return ResultT::err(invalidKey("JWK is not a valid JSON object"));
    }
    if (detail::memberString(*members, "kty") != std::optional<std::string>("RSA")) {
        return ResultT::err(invalidKey("JWK kty must be RSA"));
    }

    struct Field {
        const char* jwk;
        const char* param;
        bool required;
    };
    static constexpr Field kFields[] = {
        {"n", OSSL_PKEY_PARAM_RSA_N, true},
        {"e", OSSL_PKEY_PARAM_RSA_E, true},
        {"d", OSSL_PKEY_PARAM_RSA_D, true},
        {"p", OSSL_PKEY_PARAM_RSA_FACTOR1, false},
        {"q", OSSL_PKEY_PARAM_RSA_FACTOR2, false},
        {"dp", OSSL_PKEY_PARAM_RSA_EXPONENT1, false},
        {"dq", OSSL_PKEY_PARAM_RSA_EXPONENT2, false},
        {"qi", OSSL_PKEY_PARAM_RSA_COEFFICIENT1, false},
    };

    detail::ParamBldPtr bld(OSSL_PARAM_BLD_new());
    if (!bld) {
        return ResultT::err(AuthError(ErrorCode::CryptoError, "OpenSSL allocation failed"));
    }

    // BIGNUMs must outlive OSSL_PARAM_BLD_to_param.
    std::vector<detail::BnPtr> numbers;
    std::size_t crtCount = 0;
    for (const auto& field : kFields) {
        auto value = detail::memberString(*members, field.jwk);
        if (!value || value->empty()) {
            if (field.required) {
                return ResultT::err(
                    invalidKey(std::string("RSA JWK is missing \"") + field.jwk + "\""));
            }
            continue;
        }
        auto bn = detail::base64urlToBn(*value);
        if (!bn) {
            return ResultT::err(
                invalidKey(std::string("RSA JWK member \"") + field.jwk + "\" is not base64url"));
        }
        if (OSSL_PARAM_BLD_push_BN(bld.get(), field.param, bn.get()) != 1) {
            return ResultT::err(AuthError(ErrorCode::CryptoError, "OpenSSL parameter build failed"));
        }
        if (!field.required) {
            ++crtCount;
        }
        numbers.push_back(std::move(bn));
    }
    if (crtCount != 0 && crtCount != 5) {
        return ResultT::err(invalidKey("RSA JWK must carry all or none of p, q, dp, dq, qi"));
    }

    detail::ParamPtr params(OSSL_PARAM_BLD_to_param(bld.get()));
    detail::PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr));
    EVP_PKEY* pkey = nullptr;
    if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1 ||
        EVP_PKEY_fromdata(ctx.get(), &pkey, EVP_PKEY_KEYPAIR, params.get()) != 1) {
        return ResultT::err(invalidKey("RSA JWK rejected: " + detail::lastOpenSslError()));
    }
    return adopt(hold(pkey), std::move(keyId));
}

AuthResult<std::unique_ptr<RsaTokenSigner>> RsaTokenSigner::fromPem(std::string_view pem,
                                                                   std::string keyId) {
    auto pkey = detail::loadPrivateKeyPem(pem);
    if (!pkey) {
        return AuthResult<std::unique_ptr<RsaTokenSigner>>::err(
            invalidKey("PEM private key could not be parsed"));
    }
    return adopt(hold(pkey.release()), std::move(keyId));
}

std::string RsaTokenSigner::exportPublicJwk() const {
    auto* pkey = key_->pkey.get();
    std::string out = jwkPrefix("RSA", algorithmName(), keyId_);
    out += ",\"n\":" + detail::jsonEscape(detail::bnParamToBase64url(pkey, OSSL_PKEY_PARAM_RSA_N));
    out += ",\"e\":" + detail::jsonEscape(detail::bnParamToBase64url(pkey, OSSL_PKEY_PARAM_RSA_E));
    out += "}";
    return out;
}

std::string RsaTokenSigner::exportFullJwk() const {
    auto* pkey = key_->pkey.get();
    std::string out = exportPublicJwk();
    out.pop_back();
    const std::pair<const char*, const char*> privateMembers[] = {
        {"d", OSSL_PKEY_PARAM_RSA_D},
        {"p", OSSL_PKEY_PARAM_RSA_FACTOR1},
        {"q", OSSL_PKEY_PARAM_RSA_FACTOR2},
        {"dp", OSSL_PKEY_PARAM_RSA_EXPONENT1},
        {"dq", OSSL_PKEY_PARAM_RSA_EXPONENT2},
        {"qi", OSSL_PKEY_PARAM_RSA_COEFFICIENT1},
    };
    for (const auto& [name, param] : privateMembers) {
        auto value = detail::bnParamToBase64url(pkey, param);
        if (!value.empty()) {
            out += ",\"" + std::string(name) + "\":" + detail::jsonEscape(value);
        }
    }
    out += "}";
    return out;
}

// ---------------------------------------------------------------------------
// RawKeyTokenSigner
// ---------------------------------------------------------------------------

RawKeyTokenSigner::RawKeyTokenSigner(ConstructionKey,
                                     std::unique_ptr<detail::EvpKeyHolder> key,
                                     SignatureAlgorithm algorithm,
                                     std::string keyId)
    : EvpTokenSigner(std::move(key), algorithm, std::move(keyId)) {}

AuthResult<std::unique_ptr<RawKeyTokenSigner>> RawKeyTokenSigner::adopt(
    std::unique_ptr<detail::EvpKeyHolder> key, SignatureAlgorithm algorithm, std::string keyId) {
    using ResultT = AuthResult<std::unique_ptr<RawKeyTokenSigner>>;
    if (!key->pkey || EVP_PKEY_is_a(key->pkey.get(), keyTypeName(algorithm)) != 1) {
        return ResultT::err(invalidKey(std::string("not an ") + keyTypeName(algorithm) +
                                       " private key"));
    }
    auto signer = std::make_unique<RawKeyTokenSigner>(ConstructionKey{}, std::move(key),
                                                      algorithm, std::move(keyId));
    auto check = signer->selfTest();
    if (!check) {
        return ResultT::err(check.error());
    }
    return ResultT::ok(std::move(signer));
}

AuthResult<std::unique_ptr<RawKeyTokenSigner>> RawKeyTokenSigner::generate(
    SignatureAlgorithm algorithm, std::string keyId) {
    using ResultT = AuthResult<std::unique_ptr<RawKeyTokenSigner>>;
    if (algorithm == SignatureAlgorithm::RS256) {
        return ResultT::err(
            AuthError(ErrorCode::InvalidArgument, "RS256 keys are handled by RsaTokenSigner"));
    }
    const char* type = keyTypeName(algorithm);
    if (!providerSupports(type)) {
        return ResultT::err(unsupported(algorithm));
    }
    EVP_PKEY* pkey = EVP_PKEY_Q_keygen(nullptr, nullptr, type);
    if (pkey == nullptr) {
        return ResultT::err(AuthError(ErrorCode::KeyGenerationFailed,
                                      std::string(type) + " key generation failed: " +
                                          detail::lastOpenSslError()));
    }
    return adopt(hold(pkey), algorithm, std::move(keyId));
}

AuthResult<std::unique_ptr<RawKeyTokenSigner>> RawKeyTokenSigner::fromJwk(std::string_view jwkJson,
                                                                         std::string keyId) {
    using ResultT = AuthResult<std::unique_ptr<RawKeyTokenSigner>>;
    auto members = detail::parseFlatJsonObject(jwkJson);
    if (!members) {
        return ResultT::err(invalidKey("JWK is not a valid JSON object"));
    }

    auto kty = detail::memberString(*members, "kty").value_or("");
    SignatureAlgorithm algorithm = SignatureAlgorithm::EdDSA;
    if (kty == "OKP") {
        if (detail::memberString(*members, "crv").value_or("") != "Ed25519") {
            return ResultT::err(invalidKey("OKP JWK must use crv Ed25519"));
        }
        algorithm = SignatureAlgorithm::EdDSA;
    } else if (kty == "AKP") {
        if (detail::memberString(*members, "alg").value_or("") != "ML-DSA-65") {
            return ResultT::err(invalidKey("AKP JWK must use alg ML-DSA-65"));
        }
        algorithm = SignatureAlgorithm::MlDsa65;
    } else {
        return ResultT::err(invalidKey("JWK kty must be OKP or AKP"));
    }

    const char* type = keyTypeName(algorithm);
    if (!providerSupports(type)) {
        return ResultT::err(unsupported(algorithm));
    }

    auto d = detail::memberString(*members, "d");
    if (!d || d->empty()) {
        return ResultT::err(invalidKey("JWK has no private member \"d\""));
    }
    auto privateBytes = detail::base64DecodeAny(*d);
    if (!privateBytes || privateBytes->empty()) {
        return ResultT::err(invalidKey("JWK member \"d\" is not base64url"));
    }

    EVP_PKEY* pkey = nullptr;
    if (algorithm == SignatureAlgorithm::MlDsa65 && privateBytes->size() == 32) {
        // 32 bytes is the ML-DSA key generation seed rather than the expanded key.
        detail::ParamBldPtr bld(OSSL_PARAM_BLD_new());
        if (bld && OSSL_PARAM_BLD_push_octet_string(bld.get(), "seed", privateBytes->data(),
                                                    privateBytes->size()) == 1) {
            detail::ParamPtr params(OSSL_PARAM_BLD_to_param(bld.get()));
            detail::PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, type, nullptr));
            if (params && ctx && EVP_PKEY_fromdata_init(ctx.get()) == 1) {
                if (EVP_PKEY_fromdata(ctx.get(), &pkey, EVP_PKEY_KEYPAIR, params.get()) != 1) {
                    pkey = nullptr;
                }
            }
        }
    } else {
        pkey = EVP_PKEY_new_raw_private_key_ex(nullptr, type, nullptr, privateBytes->data(),
                                               privateBytes->size());
    }
    OPENSSL_cleanse(privateBytes->data(), privateBytes->size());
    if (pkey == nullptr) {
        return ResultT::err(invalidKey(std::string(type) + " private key rejected: " +
                                       detail::lastOpenSslError()));
    }
    auto holder = hold(pkey);

    // A published public half must belong to the private half.
    if (auto x = detail::memberString(*members, "x"); x && !x->empty()) {
        auto expected = rawKey(holder->pkey.get(), false);
        auto given = detail::base64DecodeAny(*x);
        if (!given || !detail::constantTimeEqual(expected, *given)) {
            return ResultT::err(invalidKey("JWK public member \"x\" does not match \"d\""));
        }
    }
    return adopt(std::move(holder), algorithm, std::move(keyId));
}

AuthResult<std::unique_ptr<RawKeyTokenSigner>> RawKeyTokenSigner::fromPem(std::string_view pem,
                                                                         std::string keyId) {
    using ResultT = AuthResult<std::unique_ptr<RawKeyTokenSigner>>;
    auto pkey = detail::loadPrivateKeyPem(pem);
    if (!pkey) {
        return ResultT::err(invalidKey("PEM private key could not be parsed"));
    }
    SignatureAlgorithm algorithm = SignatureAlgorithm::EdDSA;
    if (EVP_PKEY_is_a(pkey.get(), "ED25519") == 1) {
        algorithm = SignatureAlgorithm::EdDSA;
    } else if (EVP_PKEY_is_a(pkey.get(), "ML-DSA-65") == 1) {
        algorithm = SignatureAlgorithm::MlDsa65;
    } else {
        return ResultT::err(invalidKey("PEM key is neither Ed25519 nor ML-DSA-65"));
    }
    return adopt(hold(pkey.release()), algorithm, std::move(keyId));
}

std::string RawKeyTokenSigner::exportPublicJwk() const {
    auto pub = rawKey(key_->pkey.get(), false);
    std::string out = algorithm_ == SignatureAlgorithm::EdDSA
                          ? jwkPrefix("OKP", algorithmName(), keyId_, "Ed25519")
                          : jwkPrefix("AKP", algorithmName(), keyId_);
    out += ",\"x\":" + detail::jsonEscape(detail::base64urlEncode(pub.data(), pub.size()));
    out += "}";
    return out;
}

std::string RawKeyTokenSigner::exportFullJwk() const {
    auto priv = rawKey(key_->pkey.get(), true);
    std::string out = exportPublicJwk();
    out.pop_back();
    out += ",\"d\":" + detail::jsonEscape(detail::base64urlEncode(priv.data(), priv.size()));
    out += "}";
    OPENSSL_cleanse(priv.data(), priv.size());
    return out;
}

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------

AuthResult<std::unique_ptr<ITokenSigner>> generateSigner(SignatureAlgorithm algorithm,
                                                         std::string keyId,
                                                         uint32_t rsaKeyBits) {
    using ResultT = AuthResult<std::unique_ptr<ITokenSigner>>;
    if (algorithm == SignatureAlgorithm::RS256) {
        auto signer = RsaTokenSigner::generate(std::move(keyId), rsaKeyBits);
        if (!signer) {
            return ResultT::err(signer.error());
        }
        return ResultT::ok(std::move(signer).value());
    }
    auto signer = RawKeyTokenSigner::generate(algorithm, std::move(keyId));
    if (!signer) {
        return ResultT::err(signer.error());
    }
    return ResultT::ok(std::move(signer).value());
}

namespace {

AuthResult<std::unique_ptr<ITokenSigner>> signerFromJwk(std::string_view json, std::string keyId) {
    using ResultT = AuthResult<std::unique_ptr<ITokenSigner>>;
    auto members = detail::parseFlatJsonObject(json);
    if (!members) {
        return ResultT::err(invalidKey("signing key JWK is not a valid JSON object"));
    }
    if (detail::memberString(*members, "kty").value_or("") == "RSA") {
        auto signer = RsaTokenSigner::fromJwk(json, std::move(keyId));
        if (!signer) {
            return ResultT::err(signer.error());
        }
        return ResultT::ok(std::move(signer).value());
    }
    auto signer = RawKeyTokenSigner::fromJwk(json, std::move(keyId));
    if (!signer) {
        return ResultT::err(signer.error());
    }
    return ResultT::ok(std::move(signer).value());
}

AuthResult<std::unique_ptr<ITokenSigner>> signerFromPem(std::string_view pem, std::string keyId) {
    using ResultT = AuthResult<std::unique_ptr<ITokenSigner>>;
    auto parsed = detail::loadPrivateKeyPem(pem);
    if (!parsed) {
        return ResultT::err(invalidKey("PEM private key could not be parsed"));
    }
    if (EVP_PKEY_is_a(parsed.get(), "RSA") == 1) {
        auto signer = RsaTokenSigner::fromPem(pem, std::move(keyId));
        if (!signer) {
            return ResultT::err(signer.error());
        }
        return ResultT::ok(std::move(signer).value());
    }
    auto signer = RawKeyTokenSigner::fromPem(pem, std::move(keyId));
    if (!signer) {
        return ResultT::err(signer.error());
    }
    return ResultT::ok(std::move(signer).value());
}

}  // anonymous namespace

AuthResult<std::unique_ptr<ITokenSigner>> loadTokenSigner(const JwtSettings& settings) {
    using ResultT = AuthResult<std::unique_ptr<ITokenSigner>>;

    auto material = trimmed(settings.signingKey);
    if (material.empty()) {
        auto generated = generateSigner(settings.algorithm, settings.keyId, settings.rsaKeyBits);
        if (generated) {
            CAS_LOG_WARN(LogCategory::Crypto,
                         "No signing key configured; generated an ephemeral " +
                             std::string(signatureAlgorithmName(settings.algorithm)) +
                             " key pair. Tokens will not verify after a restart "
                             "(not production-safe)");
        }
        return generated;
    }

    ResultT loaded = ResultT::err(invalidKey("unrecognized signing key format"));
    if (startsWith(material, "-----BEGIN")) {
        loaded = signerFromPem(material, settings.keyId);
    } else if (startsWith(material, "{")) {
        loaded = signerFromJwk(material, settings.keyId);
    } else if (auto decoded = detail::base64DecodeAny(material); decoded && !decoded->empty()) {
        auto text = trimmed(std::string_view(reinterpret_cast<const char*>(decoded->data()),
                                             decoded->size()));
        OPENSSL_cleanse(decoded->data(), decoded->size());
        if (startsWith(text, "{")) {
            loaded = signerFromJwk(text, settings.keyId);
        } else if (startsWith(text, "-----BEGIN")) {
            loaded = signerFromPem(text, settings.keyId);
        }
        OPENSSL_cleanse(text.data(), text.size());
    }
    OPENSSL_cleanse(material.data(), material.size());

    if (!loaded) {
        CAS_LOG_ERROR(LogCategory::Crypto,
                      "Configured signing key is invalid: " +
                          std::string(loaded.error().message()));
        return loaded;
    }
    if (loaded.value()->algorithm() != settings.algorithm) {
        return ResultT::err(invalidKey(
            "configured algorithm " + std::string(signatureAlgorithmName(settings.algorithm)) +
            " does not match the " + std::string(loaded.value()->algorithmName()) +
            " signing key"));
    }

    CAS_LOG_INFO(LogCategory::Crypto,
                 "Loaded " + std::string(loaded.value()->algorithmName()) + " signing key '" +
                     loaded.value()->keyId() + "'");
    return loaded;
}

}  // namespace cas::service
