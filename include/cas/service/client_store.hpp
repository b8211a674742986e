#pragma once

/// @file client_store.hpp
/// @brief OAuth client persistence interface and in-memory implementation.

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "cas/foundation/auth_result.hpp"
#include "cas/service/token_types.hpp"

namespace cas::service {

/// Abstract interface for OAuth client persistence.
///
/// Implementations must be thread-safe when shared across threads.
class IOAuthClientStore {
public:
    virtual ~IOAuthClientStore() = default;

    /// Find a client by its caller-chosen clientId (case-sensitive).
    [[nodiscard]] virtual foundation::AuthResult<std::optional<OAuthClient>> findByClientId(
        std::string_view clientId) const = 0;

    /// Insert a new client. StorageConflict when the clientId is taken.
    virtual foundation::AuthResult<void> insert(OAuthClient client) = 0;

    /// Replace an existing client. NotFound when it does not exist.
    virtual foundation::AuthResult<void> update(const OAuthClient& client) = 0;

    /// Remove a client. Returns false when it did not exist.
    virtual foundation::AuthResult<bool> remove(std::string_view clientId) = 0;

    /// All clients, ordered by clientId.
    [[nodiscard]] virtual foundation::AuthResult<std::vector<OAuthClient>> list() const = 0;
};

/// Thread-safe in-memory client store for testing and development.
class InMemoryOAuthClientStore : public IOAuthClientStore {
public:
    [[nodiscard]] foundation::AuthResult<std::optional<OAuthClient>> findByClientId(
        std::string_view clientId) const override;

    foundation::AuthResult<void> insert(OAuthClient client) override;

    foundation::AuthResult<void> update(const OAuthClient& client) override;

    foundation::AuthResult<bool> remove(std::string_view clientId) override;

    [[nodiscard]] foundation::AuthResult<std::vector<OAuthClient>> list() const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, OAuthClient> clients_;
};

}  // namespace cas::service
