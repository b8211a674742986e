#pragma once

/// @file mfa_challenge_service.hpp
/// @brief Short-lived, strictly single-use step-up authentication tickets.

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "cas/foundation/auth_result.hpp"
#include "cas/service/data_protector.hpp"
#include "cas/service/sealed_token.hpp"
#include "cas/service/token_store.hpp"
#include "cas/service/token_types.hpp"

namespace cas::service {

/// Issues and redeems MFA challenge tokens.
///
/// A challenge is handed to the client after primary authentication and
/// exchanged, exactly once, after the second factor has been verified.
class MfaChallengeService {
public:
    static constexpr std::chrono::minutes kDefaultLifetime{10};
    static constexpr std::chrono::minutes kDefaultMaxLifetime{60};
    static constexpr std::size_t kTokenBytes = 64;

    MfaChallengeService(std::shared_ptr<IMfaChallengeStore> store,
                        std::shared_ptr<IDataProtector> protector,
                        std::chrono::minutes defaultLifetime = kDefaultLifetime,
                        std::chrono::minutes maxLifetime = kDefaultMaxLifetime);

    /// Seal and persist a challenge.
    ///
    /// @param lifetime Override of the default lifetime; must lie in
    ///                 [1 minute, max lifetime], otherwise InvalidArgument.
    [[nodiscard]] foundation::AuthResult<MfaChallengeToken> issue(
        std::string_view userId,
        std::string_view tenantId,
        std::string_view plaintext,
        std::optional<std::chrono::minutes> lifetime = std::nullopt,
        const IssuanceMetadata& metadata = {});

    /// Validate a challenge and atomically mark it used.
    [[nodiscard]] foundation::AuthResult<MfaChallengeToken> validateAndConsume(
        std::string_view plaintext);

    /// Delete expired and used challenges. Returns the number deleted.
    foundation::AuthResult<std::size_t> cleanupExpired();

    /// New random challenge value: 64 random bytes, base64.
    [[nodiscard]] static std::string generateChallengeToken();

private:
    std::shared_ptr<IMfaChallengeStore> store_;
    SealedTokenCodec codec_;
    std::chrono::minutes defaultLifetime_;
    std::chrono::minutes maxLifetime_;
};

}  // namespace cas::service
