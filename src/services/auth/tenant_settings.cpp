/// @file tenant_settings.cpp
/// @brief InMemoryTenantSettingsProvider implementation.

#include "cas/service/tenant_settings.hpp"

namespace cas::service {

using cas::foundation::AuthResult;

AuthResult<std::optional<std::string>> InMemoryTenantSettingsProvider::getSetting(
    std::string_view tenantId, std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = settings_.find({std::string(tenantId), std::string(key)});
    if (it == settings_.end()) {
        return AuthResult<std::optional<std::string>>::ok(std::nullopt);
    }
    return AuthResult<std::optional<std::string>>::ok(it->second);
}

void InMemoryTenantSettingsProvider::setSetting(std::string_view tenantId,
                                                std::string_view key,
                                                std::string value) {
    std::lock_guard lock(mutex_);
    settings_[{std::string(tenantId), std::string(key)}] = std::move(value);
}

void InMemoryTenantSettingsProvider::removeSetting(std::string_view tenantId,
                                                   std::string_view key) {
    std::lock_guard lock(mutex_);
    settings_.erase({std::string(tenantId), std::string(key)});
}

}  // namespace cas::service
