#pragma once

/// @file user_directory.hpp
/// @brief User/role directory collaborator and in-memory implementation.
///
/// User and role administration live outside this core; token minting
/// only needs identity fields and role names.

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "cas/foundation/auth_result.hpp"
#include "cas/service/token_types.hpp"

namespace cas::service {

/// Abstract user/role directory.
///
/// Implementations must be thread-safe when shared across threads.
class IUserDirectory {
public:
    virtual ~IUserDirectory() = default;

    /// Find a user by id within a tenant.
    [[nodiscard]] virtual foundation::AuthResult<std::optional<DirectoryUser>> findUser(
        std::string_view tenantId, std::string_view userId) const = 0;
};

/// Thread-safe in-memory directory for testing and development.
class InMemoryUserDirectory : public IUserDirectory {
public:
    [[nodiscard]] foundation::AuthResult<std::optional<DirectoryUser>> findUser(
        std::string_view tenantId, std::string_view userId) const override;

    /// Add or replace a user, keyed by (tenantId, id).
    void upsert(DirectoryUser user);

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, DirectoryUser> users_;
};

}  // namespace cas::service
