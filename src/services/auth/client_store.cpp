/// @file client_store.cpp
/// @brief InMemoryOAuthClientStore implementation.

#include "cas/service/client_store.hpp"

#include <algorithm>

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::AuthResult;
using cas::foundation::ErrorCode;

AuthResult<std::optional<OAuthClient>> InMemoryOAuthClientStore::findByClientId(
    std::string_view clientId) const {
    std::lock_guard lock(mutex_);
    auto it = clients_.find(std::string(clientId));
    if (it == clients_.end()) {
        return AuthResult<std::optional<OAuthClient>>::ok(std::nullopt);
    }
    return AuthResult<std::optional<OAuthClient>>::ok(it->second);
}

AuthResult<void> InMemoryOAuthClientStore::insert(OAuthClient client) {
    std::lock_guard lock(mutex_);
    auto key = client.clientId;
    if (!clients_.emplace(std::move(key), std::move(client)).second) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::StorageConflict, "client id already stored"));
    }
    return AuthResult<void>::ok();
}

AuthResult<void> InMemoryOAuthClientStore::update(const OAuthClient& client) {
    std::lock_guard lock(mutex_);
    auto it = clients_.find(client.clientId);
    if (it == clients_.end()) {
        return AuthResult<void>::err(AuthError(ErrorCode::NotFound, "client not stored"));
    }
    it->second = client;
    return AuthResult<void>::ok();
}

AuthResult<bool> InMemoryOAuthClientStore::remove(std::string_view clientId) {
    std::lock_guard lock(mutex_);
    return AuthResult<bool>::ok(clients_.erase(std::string(clientId)) > 0);
}

AuthResult<std::vector<OAuthClient>> InMemoryOAuthClientStore::list() const {
    std::lock_guard lock(mutex_);
    std::vector<OAuthClient> result;
    result.reserve(clients_.size());
    for (const auto& [id, client] : clients_) {
        result.push_back(client);
    }
    std::sort(result.begin(), result.end(), [](const OAuthClient& a, const OAuthClient& b) {
        return a.clientId < b.clientId;
    });
    return AuthResult<std::vector<OAuthClient>>::ok(std::move(result));
}

}  // namespace cas::service
