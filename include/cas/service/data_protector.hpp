#pragma once

/// @file data_protector.hpp
/// @brief Authenticated symmetric encryption of sealed-token plaintexts.
///
/// Every ciphertext is bound to a purpose string ("RefreshToken",
/// "MfaChallengeToken", ...): a value protected under one purpose never
/// opens under another, even with the same master key.

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "cas/foundation/auth_result.hpp"
#include "cas/service/token_types.hpp"

namespace cas::service {

/// Authenticated encryption provider.
class IDataProtector {
public:
    virtual ~IDataProtector() = default;

    /// Encrypt @p plaintext for @p purpose.
    /// @return Opaque ASCII envelope, or EncryptionFailed.
    [[nodiscard]] virtual foundation::AuthResult<std::string> protect(
        std::string_view purpose, std::string_view plaintext) const = 0;

    /// Decrypt an envelope produced by protect() for the same purpose.
    /// @return The plaintext, or DecryptionFailed on any tamper or mismatch.
    [[nodiscard]] virtual foundation::AuthResult<std::string> unprotect(
        std::string_view purpose, std::string_view ciphertext) const = 0;
};

/// AES-256-GCM protector with HKDF-SHA256 per-purpose subkeys.
///
/// Envelope: base64url(version 0x01 || nonce[12] || ciphertext || tag[16]),
/// with the purpose as additional authenticated data.
///
/// Example:
/// @code
///   auto protector = AesGcmDataProtector::fromConfig(config.dataProtection);
///   auto sealed = protector.value().protect("RefreshToken", token);
///   auto opened = protector.value().unprotect("RefreshToken", sealed.value());
/// @endcode
class AesGcmDataProtector : public IDataProtector {
public:
    static constexpr std::size_t kKeyBytes = 32;
    static constexpr std::size_t kNonceBytes = 12;
    static constexpr std::size_t kTagBytes = 16;
    static constexpr uint8_t kEnvelopeVersion = 0x01;

    using MasterKey = std::array<uint8_t, kKeyBytes>;

    explicit AesGcmDataProtector(const MasterKey& masterKey);
    ~AesGcmDataProtector() override;

    AesGcmDataProtector(const AesGcmDataProtector&) = delete;
    AesGcmDataProtector& operator=(const AesGcmDataProtector&) = delete;

    /// Build a protector from configuration.
    ///
    /// An empty master key produces an ephemeral key (logged as not
    /// production-safe); a malformed one yields KeyMaterialInvalid.
    [[nodiscard]] static foundation::AuthResult<std::unique_ptr<AesGcmDataProtector>> fromConfig(
        const DataProtectionConfig& config);

    /// Generate a random master key, base64url-encoded, for configuration.
    [[nodiscard]] static std::string generateMasterKey();

    [[nodiscard]] foundation::AuthResult<std::string> protect(
        std::string_view purpose, std::string_view plaintext) const override;

    [[nodiscard]] foundation::AuthResult<std::string> unprotect(
        std::string_view purpose, std::string_view ciphertext) const override;

private:
    /// Derive (or fetch cached) purpose subkey.
    [[nodiscard]] foundation::AuthResult<MasterKey> subkey(std::string_view purpose) const;

    MasterKey masterKey_;
    mutable std::mutex mutex_;
    mutable std::unordered_map<std::string, MasterKey> subkeys_;
};

}  // namespace cas::service
