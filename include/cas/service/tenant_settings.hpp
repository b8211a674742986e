#pragma once

/// @file tenant_settings.hpp
/// @brief Per-tenant key/value settings lookup.
///
/// This core only reads settings (e.g. "RefreshToken.ExpirationDays");
/// their storage and administration belong to the tenant service.

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "cas/foundation/auth_result.hpp"

namespace cas::service {

namespace tenant_setting_keys {
inline constexpr const char* kRefreshTokenExpirationDays = "RefreshToken.ExpirationDays";
}  // namespace tenant_setting_keys

/// Read-only tenant settings collaborator.
class ITenantSettingsProvider {
public:
    virtual ~ITenantSettingsProvider() = default;

    /// Raw string value of a setting, nullopt when the tenant has none.
    [[nodiscard]] virtual foundation::AuthResult<std::optional<std::string>> getSetting(
        std::string_view tenantId, std::string_view key) const = 0;
};

/// Thread-safe in-memory settings provider for testing and development.
class InMemoryTenantSettingsProvider : public ITenantSettingsProvider {
public:
    [[nodiscard]] foundation::AuthResult<std::optional<std::string>> getSetting(
        std::string_view tenantId, std::string_view key) const override;

    /// Set (or overwrite) a setting.
    void setSetting(std::string_view tenantId, std::string_view key, std::string value);

    /// Remove a setting.
    void removeSetting(std::string_view tenantId, std::string_view key);

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, std::string> settings_;
};

}  // namespace cas::service
