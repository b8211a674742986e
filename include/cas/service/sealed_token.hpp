#pragma once

/// @file sealed_token.hpp
/// @brief Encrypt-at-rest plus hash-index helper shared by the
///        authorization code, refresh token and MFA challenge services.
///
/// A sealed token is persisted only as (a) ciphertext under a purpose key
/// and (b) the lowercase hex SHA-256 of its plaintext, which serves as the
/// non-secret lookup index.

#include <memory>
#include <string>
#include <string_view>

#include "cas/foundation/auth_result.hpp"
#include "cas/service/data_protector.hpp"

namespace cas::service {

/// Ciphertext and lookup hash of one plaintext.
struct SealedValue {
    std::string ciphertext;
    std::string hash;
};

/// Purpose-bound seal/match helper.
class SealedTokenCodec {
public:
    SealedTokenCodec(std::shared_ptr<IDataProtector> protector, std::string purpose);

    /// Lowercase hex SHA-256 of the plaintext.
    [[nodiscard]] static std::string computeHash(std::string_view plaintext);

    /// Encrypt and hash a plaintext.
    /// @return InvalidArgument for blank input, EncryptionFailed otherwise.
    [[nodiscard]] foundation::AuthResult<SealedValue> seal(std::string_view plaintext) const;

    /// Decrypt @p ciphertext and compare with @p plaintext in constant time.
    ///
    /// A decryption failure or mismatch is logged as an integrity signal
    /// for @p recordId and reported as false.
    [[nodiscard]] bool matches(std::string_view ciphertext,
                               std::string_view plaintext,
                               std::string_view recordId = {}) const;

    [[nodiscard]] const std::string& purpose() const noexcept { return purpose_; }

private:
    std::shared_ptr<IDataProtector> protector_;
    std::string purpose_;
};

}  // namespace cas::service
