#pragma once

/// @file secret_hasher.hpp
/// @brief One-way salted hashing of OAuth client secrets with
///        PBKDF2-HMAC-SHA256.
///
/// Hashing the same secret twice yields different encodings (fresh salt per
/// call) that both verify. The interface lets deployments swap in a
/// different KDF (argon2id, scrypt) without touching the client registry.

#include <cstdint>
#include <string>
#include <string_view>

#include "cas/foundation/auth_result.hpp"

namespace cas::service {

/// Outcome of verifying a secret against a stored hash.
enum class SecretVerification : uint8_t {
    Failed,
    Success,
    /// Matched, but the hash was produced with weaker parameters than the
    /// current configuration; callers should re-hash and persist.
    SuccessRehashNeeded
};

/// Swappable secret hasher.
class ISecretHasher {
public:
    virtual ~ISecretHasher() = default;

    /// Hash a plaintext secret with a fresh random salt.
    /// @return InvalidArgument for blank input, CryptoError on KDF failure.
    [[nodiscard]] virtual foundation::AuthResult<std::string> hash(std::string_view plain) const = 0;

    /// Verify a plaintext secret against an encoded hash.
    /// Never fails: malformed hashes and blank input simply do not match.
    [[nodiscard]] virtual SecretVerification verify(std::string_view encodedHash,
                                                    std::string_view plain) const = 0;
};

/// PBKDF2-HMAC-SHA256 hasher.
///
/// Encoding: `pbkdf2_sha256$<iterations>$<base64 salt>$<base64 key>` with a
/// 16-byte salt and a 32-byte derived key.
///
/// Example:
/// @code
///   Pbkdf2SecretHasher hasher;
///   auto hashed = hasher.hash("s3cret");
///   bool ok = hasher.verify(hashed.value(), "s3cret") != SecretVerification::Failed;
/// @endcode
class Pbkdf2SecretHasher : public ISecretHasher {
public:
    static constexpr uint32_t kDefaultIterations = 100000;
    static constexpr std::size_t kSaltBytes = 16;
    static constexpr std::size_t kKeyBytes = 32;
    static constexpr std::string_view kScheme = "pbkdf2_sha256";

    explicit Pbkdf2SecretHasher(uint32_t iterations = kDefaultIterations);

    [[nodiscard]] foundation::AuthResult<std::string> hash(std::string_view plain) const override;

    [[nodiscard]] SecretVerification verify(std::string_view encodedHash,
                                            std::string_view plain) const override;

    [[nodiscard]] uint32_t iterations() const noexcept { return iterations_; }

private:
    uint32_t iterations_;
};

}  // namespace cas::service
