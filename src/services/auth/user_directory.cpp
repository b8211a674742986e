/// @file user_directory.cpp
/// @brief InMemoryUserDirectory implementation.

#include "cas/service/user_directory.hpp"

namespace cas::service {

using cas::foundation::AuthResult;

AuthResult<std::optional<DirectoryUser>> InMemoryUserDirectory::findUser(
    std::string_view tenantId, std::string_view userId) const {
    std::lock_guard lock(mutex_);
    auto it = users_.find({std::string(tenantId), std::string(userId)});
    if (it == users_.end()) {
        return AuthResult<std::optional<DirectoryUser>>::ok(std::nullopt);
    }
    return AuthResult<std::optional<DirectoryUser>>::ok(it->second);
}

void InMemoryUserDirectory::upsert(DirectoryUser user) {
    std::lock_guard lock(mutex_);
    auto key = std::make_pair(user.identity.tenantId, user.identity.id);
    users_[std::move(key)] = std::move(user);
}

}  // namespace cas::service
