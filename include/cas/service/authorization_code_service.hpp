#pragma once

/// @file authorization_code_service.hpp
/// @brief OAuth2 authorization code issuance and single-use redemption
///        with PKCE (RFC 6749 section 4.1, RFC 7636).

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

/// Inputs of an authorization grant.
struct AuthorizationCodeRequest {
    std::string userId;
    std::string tenantId;
    std::string clientId;
    std::string redirectUri;
    std::optional<std::string> scope;
    std::optional<std::string> state;
    std::optional<std::string> codeChallenge;
    std::optional<std::string> codeChallengeMethod;
    IssuanceMetadata metadata;
};

/// Issues and redeems authorization codes.
///
/// Codes are 32 random bytes, base64url-encoded, stored sealed (hash index
/// plus ciphertext) and redeemable exactly once before they expire.
///
/// Example:
/// @code
///   AuthorizationCodeService codes(store, protector);
///   auto issued = codes.issue(request);
///   auto redeemed = codes.validateAndConsume(issued.value().code,
///                                            request.clientId,
///                                            request.redirectUri,
///                                            "test-verifier");
/// @endcode
class AuthorizationCodeService {
public:
    static constexpr std::chrono::minutes kDefaultLifetime{10};
    static constexpr std::size_t kCodeBytes = 32;

    AuthorizationCodeService(std::shared_ptr<IAuthorizationCodeStore> store,
                             std::shared_ptr<IDataProtector> protector,
                             std::chrono::minutes lifetime = kDefaultLifetime);

    /// Generate, seal and persist a new code.
    /// @return The stored record with the plaintext `code` filled in.
    [[nodiscard]] foundation::AuthResult<AuthorizationCode> issue(
        const AuthorizationCodeRequest& request);

    /// Validate a code against its client binding and PKCE challenge and
    /// atomically mark it used.
    ///
    /// Every failure is the same InvalidToken error; storage failures are
    /// propagated unchanged.
    [[nodiscard]] foundation::AuthResult<AuthorizationCode> validateAndConsume(
        std::string_view code,
        std::string_view clientId,
        std::string_view redirectUri,
        std::optional<std::string_view> codeVerifier = std::nullopt);

    /// Delete expired and used codes. Returns the number deleted.
    foundation::AuthResult<std::size_t> cleanupExpired();

    /// Check a PKCE verifier. An absent method means "plain"; unknown
    /// methods never verify.
    [[nodiscard]] static bool verifyPkce(std::string_view codeVerifier,
                                         std::string_view codeChallenge,
                                         std::optional<std::string_view> method);

    /// base64url-no-padding(SHA-256(verifier)).
    [[nodiscard]] static std::string computeS256Challenge(std::string_view codeVerifier);

    /// Whether @p method is empty, "plain" or "S256".
    [[nodiscard]] static bool isSupportedChallengeMethod(std::optional<std::string_view> method);

    [[nodiscard]] std::chrono::minutes lifetime() const noexcept { return lifetime_; }

private:
    std::shared_ptr<IAuthorizationCodeStore> store_;
    SealedTokenCodec codec_;
    std::chrono::minutes lifetime_;
};

}  // namespace cas::service
