#pragma once

/// @file refresh_token_service.hpp
/// @brief Refresh token issuance, validation and revocation.
///
/// Refresh tokens are long-lived bearer credentials: reusable until they
/// are revoked or expire, not rotated on use. Each successful validation
/// only records `usedAt` for auditing.

#include <memory>
#include <string>
#include <string_view>

#include "cas/foundation/auth_result.hpp"
#include "cas/service/data_protector.hpp"
#include "cas/service/sealed_token.hpp"
#include "cas/service/tenant_settings.hpp"
#include "cas/service/token_store.hpp"
#include "cas/service/token_types.hpp"

namespace cas::service {

/// Issues, validates and revokes refresh tokens.
///
/// Lifetime comes from the tenant setting "RefreshToken.ExpirationDays"
/// (integer in [1, 365]); missing or invalid values fall back to the
/// configured default.
class RefreshTokenService {
public:
    static constexpr int kDefaultExpirationDays = 30;
    static constexpr int kMinExpirationDays = 1;
    static constexpr int kMaxExpirationDays = 365;
    static constexpr std::size_t kTokenBytes = 64;

    RefreshTokenService(std::shared_ptr<IRefreshTokenStore> store,
                        std::shared_ptr<IDataProtector> protector,
                        std::shared_ptr<ITenantSettingsProvider> settings,
                        int defaultExpirationDays = kDefaultExpirationDays);

    /// Seal and persist a caller-supplied token.
    /// @return InvalidArgument for blank input; storage errors unchanged.
    [[nodiscard]] foundation::AuthResult<RefreshToken> issue(std::string_view userId,
                                                             std::string_view tenantId,
                                                             std::string_view plaintext,
                                                             const IssuanceMetadata& metadata = {});

    /// Validate a token. The token stays valid for further calls.
    [[nodiscard]] foundation::AuthResult<RefreshToken> validate(std::string_view plaintext);

    /// Revoke one of @p userId's tokens.
    /// @return true if the token is now revoked (including when it already
    ///         was), false if no such token belongs to the user.
    foundation::AuthResult<bool> revoke(std::string_view plaintext, std::string_view userId);

    /// Revoke every active token of a user in a tenant.
    /// @return Number of tokens this call revoked.
    foundation::AuthResult<std::size_t> revokeAll(std::string_view userId,
                                                  std::string_view tenantId);

    /// Lifetime in days for a tenant.
    [[nodiscard]] int resolveExpirationDays(std::string_view tenantId) const;

    /// Delete expired tokens. Returns the number deleted.
    foundation::AuthResult<std::size_t> cleanupExpired();

    /// New random token value: 64 random bytes, base64.
    [[nodiscard]] static std::string generateRefreshToken();

private:
    std::shared_ptr<IRefreshTokenStore> store_;
    std::shared_ptr<ITenantSettingsProvider> settings_;
    SealedTokenCodec codec_;
    int defaultExpirationDays_;
};

}  // namespace cas::service
