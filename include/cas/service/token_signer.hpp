#pragma once

/// @file token_signer.hpp
/// @brief Pluggable asymmetric signers for access tokens and their JSON
///        Web Key (RFC 7517) export.
///
/// The access token service builds claims independently of the signature
/// scheme; an ITokenSigner is chosen once at startup from configuration
/// and shared read-only for the lifetime of the process.
///
/// Supported schemes:
/// | alg       | Key              | JWK kty |
/// |-----------|------------------|---------|
/// | RS256     | RSA (>= 2048)    | RSA     |
/// | EdDSA     | Ed25519          | OKP     |
/// | ML-DSA-65 | ML-DSA (FIPS 204)| AKP     |
///
/// ML-DSA-65 requires an OpenSSL build whose providers implement it;
/// otherwise key generation and loading fail with UnsupportedAlgorithm.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "cas/foundation/auth_result.hpp"
#include "cas/service/token_types.hpp"

namespace cas::service {

namespace detail {
struct EvpKeyHolder;
}  // namespace detail

/// Signature strategy used by the access token service.
class ITokenSigner {
public:
    virtual ~ITokenSigner() = default;

    /// Signature scheme of this key.
    [[nodiscard]] virtual SignatureAlgorithm algorithm() const noexcept = 0;

    /// JWS "alg" header value.
    [[nodiscard]] std::string_view algorithmName() const noexcept {
        return signatureAlgorithmName(algorithm());
    }

    /// Fixed key id published as "kid".
    [[nodiscard]] virtual const std::string& keyId() const noexcept = 0;

    /// Sign the JWS signing input.
    [[nodiscard]] virtual foundation::AuthResult<std::vector<uint8_t>> sign(
        std::string_view data) const = 0;

    /// Verify a signature with the public half of the key.
    [[nodiscard]] virtual bool verify(std::string_view data,
                                      const std::vector<uint8_t>& signature) const = 0;

    /// Public JWK (safe to publish).
    [[nodiscard]] virtual std::string exportPublicJwk() const = 0;

    /// Full JWK including private members. Never expose unauthenticated.
    [[nodiscard]] virtual std::string exportFullJwk() const = 0;
};

/// Common OpenSSL EVP signer state.
class EvpTokenSigner : public ITokenSigner {
public:
    ~EvpTokenSigner() override;

    EvpTokenSigner(const EvpTokenSigner&) = delete;
    EvpTokenSigner& operator=(const EvpTokenSigner&) = delete;

    [[nodiscard]] SignatureAlgorithm algorithm() const noexcept override { return algorithm_; }
    [[nodiscard]] const std::string& keyId() const noexcept override { return keyId_; }

    [[nodiscard]] foundation::AuthResult<std::vector<uint8_t>> sign(
        std::string_view data) const override;

    [[nodiscard]] bool verify(std::string_view data,
                              const std::vector<uint8_t>& signature) const override;

    /// PKCS#8 PEM of the private key.
    [[nodiscard]] std::string exportPrivatePem() const;

protected:
    EvpTokenSigner(std::unique_ptr<detail::EvpKeyHolder> key,
                   SignatureAlgorithm algorithm,
                   std::string keyId);

    /// Sign-then-verify round trip; rejects mismatched key halves.
    [[nodiscard]] foundation::AuthResult<void> selfTest() const;

    std::unique_ptr<detail::EvpKeyHolder> key_;
    SignatureAlgorithm algorithm_;
    std::string keyId_;
};

/// RS256 signer.
class RsaTokenSigner final : public EvpTokenSigner {
public:
    static constexpr uint32_t kMinKeyBits = 2048;

    /// Generate a fresh RSA key pair.
    [[nodiscard]] static foundation::AuthResult<std::unique_ptr<RsaTokenSigner>> generate(
        std::string keyId, uint32_t bits = kMinKeyBits);

    /// Load from an RSA private JWK (`n`, `e`, `d`, optional CRT members).
    [[nodiscard]] static foundation::AuthResult<std::unique_ptr<RsaTokenSigner>> fromJwk(
        std::string_view jwkJson, std::string keyId);

    /// Load from a PEM RSA private key.
    [[nodiscard]] static foundation::AuthResult<std::unique_ptr<RsaTokenSigner>> fromPem(
        std::string_view pem, std::string keyId);

    [[nodiscard]] std::string exportPublicJwk() const override;
    [[nodiscard]] std::string exportFullJwk() const override;

private:
    /// Restricts construction to the factories.
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    RsaTokenSigner(ConstructionKey, std::unique_ptr<detail::EvpKeyHolder> key, std::string keyId);

private:

    static foundation::AuthResult<std::unique_ptr<RsaTokenSigner>> adopt(
        std::unique_ptr<detail::EvpKeyHolder> key, std::string keyId);
};

/// One-shot signer for schemes without a separate digest (EdDSA, ML-DSA-65).
class RawKeyTokenSigner final : public EvpTokenSigner {
public:
    /// Generate a fresh key pair.
    /// @param algorithm EdDSA or MlDsa65.
    [[nodiscard]] static foundation::AuthResult<std::unique_ptr<RawKeyTokenSigner>> generate(
        SignatureAlgorithm algorithm, std::string keyId);

    /// Load from an OKP (Ed25519) or AKP (ML-DSA-65) private JWK.
    [[nodiscard]] static foundation::AuthResult<std::unique_ptr<RawKeyTokenSigner>> fromJwk(
        std::string_view jwkJson, std::string keyId);

    /// Load from a PEM Ed25519 or ML-DSA-65 private key.
    [[nodiscard]] static foundation::AuthResult<std::unique_ptr<RawKeyTokenSigner>> fromPem(
        std::string_view pem, std::string keyId);

    [[nodiscard]] std::string exportPublicJwk() const override;
    [[nodiscard]] std::string exportFullJwk() const override;

private:
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    RawKeyTokenSigner(ConstructionKey,
                      std::unique_ptr<detail::EvpKeyHolder> key,
                      SignatureAlgorithm algorithm,
                      std::string keyId);

private:

    static foundation::AuthResult<std::unique_ptr<RawKeyTokenSigner>> adopt(
        std::unique_ptr<detail::EvpKeyHolder> key, SignatureAlgorithm algorithm, std::string keyId);
};

/// Generate an ephemeral signer for @p algorithm.
[[nodiscard]] foundation::AuthResult<std::unique_ptr<ITokenSigner>> generateSigner(
    SignatureAlgorithm algorithm, std::string keyId, uint32_t rsaKeyBits = 2048);

/// Build the process signer from settings.
///
/// `settings.signingKey` may hold JWK JSON, base64-encoded JWK JSON or a
/// PEM private key (auto-detected). An empty value generates an ephemeral
/// key pair and logs a not-production-safe warning. Malformed material, or
/// a key whose type differs from `settings.algorithm`, yields
/// KeyMaterialInvalid.
[[nodiscard]] foundation::AuthResult<std::unique_ptr<ITokenSigner>> loadTokenSigner(
    const JwtSettings& settings);

}  // namespace cas::service
