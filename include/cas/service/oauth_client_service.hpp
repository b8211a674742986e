#pragma once

/// @file oauth_client_service.hpp
/// @brief OAuth client registry: confidential/public clients, secret
///        hashing and client authentication.
///
/// Invariant: a confidential client always stores a secret hash; a public
/// client never does. Plaintext secrets are never persisted or logged.

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cas/foundation/auth_result.hpp"
#include "cas/service/client_store.hpp"
#include "cas/service/secret_hasher.hpp"
#include "cas/service/token_types.hpp"

namespace cas::service {

/// Fields of a new client.
struct CreateClientRequest {
    std::string clientId;
    std::optional<std::string> clientSecret;
    std::string name;
    std::optional<std::string> description;
    std::vector<std::string> redirectUris;
    bool isConfidential = false;
    std::optional<std::string> tenantId;
};

/// Partial update: only engaged fields change.
struct UpdateClientRequest {
    std::optional<std::string> name;
    std::optional<std::string> description;  ///< An empty string clears it.
    std::optional<std::vector<std::string>> redirectUris;
    std::optional<bool> isActive;
    std::optional<std::string> newClientSecret;
};

/// Manages OAuth client records.
///
/// Example:
/// @code
///   OAuthClientService clients(store, std::make_shared<Pbkdf2SecretHasher>());
///   auto created = clients.createClient({.clientId = "console",
///                                        .clientSecret = "s3cret",
///                                        .name = "Console",
///                                        .redirectUris = {"https://console/cb"},
///                                        .isConfidential = true});
///   bool ok = clients.verifyClientSecret(created.value(), "s3cret");
/// @endcode
class OAuthClientService {
public:
    OAuthClientService(std::shared_ptr<IOAuthClientStore> store,
                       std::shared_ptr<ISecretHasher> hasher);

    /// Hash a client secret. InvalidArgument when blank.
    [[nodiscard]] foundation::AuthResult<std::string> hashClientSecret(
        std::string_view clientSecret) const;

    /// Check a secret against a client. Fails closed: blank input, public
    /// clients and mismatches all yield false.
    [[nodiscard]] bool verifyClientSecret(const OAuthClient& client,
                                          std::string_view clientSecret) const;

    /// Register a client.
    /// @return ClientAlreadyExists, ClientSecretRequired, InvalidArgument,
    ///         or storage errors.
    [[nodiscard]] foundation::AuthResult<OAuthClient> createClient(
        const CreateClientRequest& request);

    /// Apply a partial update.
    /// @return ClientNotFound, PublicClientSecretNotAllowed, or storage errors.
    [[nodiscard]] foundation::AuthResult<OAuthClient> updateClient(
        std::string_view clientId, const UpdateClientRequest& request);

    /// Remove a client. ClientNotFound when absent.
    foundation::AuthResult<void> deleteClient(std::string_view clientId);

    /// Look up a client.
    [[nodiscard]] foundation::AuthResult<std::optional<OAuthClient>> getClient(
        std::string_view clientId) const;

    /// List clients, optionally restricted to one tenant.
    [[nodiscard]] foundation::AuthResult<std::vector<OAuthClient>> listClients(
        const std::optional<std::string>& tenantId = std::nullopt,
        bool includeInactive = false) const;

    /// Authenticate a client for the token endpoint.
    ///
    /// The client must exist and be active; confidential clients must
    /// present a matching secret. A hash produced with weaker parameters
    /// is upgraded in place. Every failure is InvalidClient.
    [[nodiscard]] foundation::AuthResult<OAuthClient> authenticateClient(
        std::string_view clientId, std::optional<std::string_view> clientSecret);

    /// Exact-match check of a redirect URI against the registered list.
    [[nodiscard]] static bool isRedirectUriAllowed(const OAuthClient& client,
                                                   std::string_view redirectUri);

    /// Split a comma, whitespace or newline separated list of URIs.
    [[nodiscard]] static std::vector<std::string> parseRedirectUris(std::string_view text);

private:
    std::shared_ptr<IOAuthClientStore> store_;
    std::shared_ptr<ISecretHasher> hasher_;
};

}  // namespace cas::service
