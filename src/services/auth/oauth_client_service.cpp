/// @file oauth_client_service.cpp
/// @brief OAuthClientService implementation.

#include "cas/service/oauth_client_service.hpp"

#include "cas/foundation/auth_logger.hpp"

#include "crypto_utils.hpp"

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::AuthResult;
using cas::foundation::ErrorCode;
using cas::foundation::LogCategory;
using cas::foundation::LogContext;
using cas::foundation::LogLevel;

namespace {

AuthError invalidClient() {
    return AuthError(ErrorCode::InvalidClient, "client authentication failed");
}

LogContext clientContext(std::string_view clientId) {
    LogContext ctx;
    ctx.clientId = std::string(clientId);
    return ctx;
}

}  // anonymous namespace

OAuthClientService::OAuthClientService(std::shared_ptr<IOAuthClientStore> store,
                                       std::shared_ptr<ISecretHasher> hasher)
    : store_(std::move(store)), hasher_(std::move(hasher)) {}

AuthResult<std::string> OAuthClientService::hashClientSecret(std::string_view clientSecret) const {
    if (detail::isBlank(clientSecret)) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::InvalidArgument, "client secret must not be blank"));
    }
    return hasher_->hash(clientSecret);
}

bool OAuthClientService::verifyClientSecret(const OAuthClient& client,
                                            std::string_view clientSecret) const {
    if (detail::isBlank(clientSecret)) {
        return false;
    }
    if (!client.clientSecretHash || client.clientSecretHash->empty()) {
        // Public clients have no secret to verify.
        return false;
    }
    return hasher_->verify(*client.clientSecretHash, clientSecret) != SecretVerification::Failed;
}

AuthResult<OAuthClient> OAuthClientService::createClient(const CreateClientRequest& request) {
    if (detail::isBlank(request.clientId) || detail::isBlank(request.name)) {
        return AuthResult<OAuthClient>::err(
            AuthError(ErrorCode::InvalidArgument, "client id and name are required"));
    }

    auto existing = store_->findByClientId(request.clientId);
    if (!existing) {
        return AuthResult<OAuthClient>::err(existing.error());
    }
    if (existing.value().has_value()) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Client,
                    "Client creation rejected: client id already exists",
                    clientContext(request.clientId));
        return AuthResult<OAuthClient>::err(
            AuthError(ErrorCode::ClientAlreadyExists,
                      "client id '" + request.clientId + "' already exists"));
    }

    bool hasSecret = request.clientSecret && !detail::isBlank(*request.clientSecret);
    if (request.isConfidential && !hasSecret) {
        return AuthResult<OAuthClient>::err(
            AuthError(ErrorCode::ClientSecretRequired, "confidential clients require a secret"));
    }
    if (!request.isConfidential && hasSecret) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Client,
                    "Secret supplied for a public client was ignored",
                    clientContext(request.clientId));
    }

    OAuthClient client;
    client.id = detail::newUuid();
    client.clientId = request.clientId;
    client.name = request.name;
    client.description = request.description;
    client.redirectUris = request.redirectUris;
    client.isConfidential = request.isConfidential;
    client.isActive = true;
    client.tenantId = request.tenantId;
    client.createdAt = Clock::now();

    if (request.isConfidential) {
        auto hashed = hashClientSecret(*request.clientSecret);
        if (!hashed) {
            return AuthResult<OAuthClient>::err(hashed.error());
        }
        client.clientSecretHash = std::move(hashed).value();

        // The stored hash must round-trip before the client is persisted.
        if (!verifyClientSecret(client, *request.clientSecret)) {
            CAS_LOG_CTX(LogLevel::Error, LogCategory::Crypto,
                        "Freshly hashed client secret failed verification",
                        clientContext(request.clientId));
            return AuthResult<OAuthClient>::err(
                AuthError(ErrorCode::CryptoError, "client secret hash verification failed"));
        }
    }

    auto stored = store_->insert(client);
    if (!stored) {
        if (stored.error().code() == ErrorCode::StorageConflict) {
            return AuthResult<OAuthClient>::err(
                AuthError(ErrorCode::ClientAlreadyExists,
                          "client id '" + request.clientId + "' already exists"));
        }
        return AuthResult<OAuthClient>::err(stored.error());
    }

    LogContext ctx = clientContext(client.clientId);
    ctx.extra["confidential"] = client.isConfidential ? "true" : "false";
    if (client.tenantId) {
        ctx.tenantId = *client.tenantId;
    }
    CAS_LOG_CTX(LogLevel::Info, LogCategory::Client, "OAuth client created", ctx);
    return AuthResult<OAuthClient>::ok(std::move(client));
}

AuthResult<OAuthClient> OAuthClientService::updateClient(std::string_view clientId,
                                                         const UpdateClientRequest& request) {
    auto found = store_->findByClientId(clientId);
    if (!found) {
        return AuthResult<OAuthClient>::err(found.error());
    }
    if (!found.value().has_value()) {
        return AuthResult<OAuthClient>::err(
            AuthError(ErrorCode::ClientNotFound, "client '" + std::string(clientId) + "' not found"));
    }

    OAuthClient client = std::move(*found.value());
    if (request.newClientSecret && !detail::isBlank(*request.newClientSecret)) {
        if (!client.isConfidential) {
            CAS_LOG_CTX(LogLevel::Warning, LogCategory::Client,
                        "Client update rejected: secret supplied for a public client",
                        clientContext(clientId));
            return AuthResult<OAuthClient>::err(
                AuthError(ErrorCode::PublicClientSecretNotAllowed,
                          "public clients cannot have a secret"));
        }
        auto hashed = hashClientSecret(*request.newClientSecret);
        if (!hashed) {
            return AuthResult<OAuthClient>::err(hashed.error());
        }
        client.clientSecretHash = std::move(hashed).value();
    }

    if (request.name && !detail::isBlank(*request.name)) {
        client.name = *request.name;
    }
    if (request.description) {
        client.description = request.description->empty()
                                 ? std::nullopt
                                 : std::optional<std::string>(*request.description);
    }
    if (request.redirectUris && !request.redirectUris->empty()) {
        client.redirectUris = *request.redirectUris;
    }
    if (request.isActive) {
        client.isActive = *request.isActive;
    }
    client.updatedAt = Clock::now();

    auto stored = store_->update(client);
    if (!stored) {
        if (stored.error().code() == ErrorCode::NotFound) {
            return AuthResult<OAuthClient>::err(AuthError(
                ErrorCode::ClientNotFound, "client '" + std::string(clientId) + "' not found"));
        }
        return AuthResult<OAuthClient>::err(stored.error());
    }

    CAS_LOG_CTX(LogLevel::Info, LogCategory::Client, "OAuth client updated",
                clientContext(clientId));
    return AuthResult<OAuthClient>::ok(std::move(client));
}

AuthResult<void> OAuthClientService::deleteClient(std::string_view clientId) {
    auto removed = store_->remove(clientId);
    if (!removed) {
        return AuthResult<void>::err(removed.error());
    }
    if (!removed.value()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::ClientNotFound, "client '" + std::string(clientId) + "' not found"));
    }
    CAS_LOG_CTX(LogLevel::Info, LogCategory::Client, "OAuth client deleted",
                clientContext(clientId));
    return AuthResult<void>::ok();
}

AuthResult<std::optional<OAuthClient>> OAuthClientService::getClient(
    std::string_view clientId) const {
    return store_->findByClientId(clientId);
}

AuthResult<std::vector<OAuthClient>> OAuthClientService::listClients(
    const std::optional<std::string>& tenantId, bool includeInactive) const {
    auto all = store_->list();
    if (!all) {
        return all;
    }
    std::vector<OAuthClient> result;
    for (auto& client : all.value()) {
        if (tenantId && client.tenantId != tenantId) {
            continue;
        }
        if (!includeInactive && !client.isActive) {
            continue;
        }
        result.push_back(std::move(client));
    }
    return AuthResult<std::vector<OAuthClient>>::ok(std::move(result));
}

AuthResult<OAuthClient> OAuthClientService::authenticateClient(
    std::string_view clientId, std::optional<std::string_view> clientSecret) {
    auto found = store_->findByClientId(clientId);
    if (!found) {
        return AuthResult<OAuthClient>::err(found.error());
    }
    if (!found.value().has_value()) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Client, "Unknown client", clientContext(clientId));
        return AuthResult<OAuthClient>::err(invalidClient());
    }

    OAuthClient client = std::move(*found.value());
    if (!client.isActive) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Client, "Inactive client",
                    clientContext(clientId));
        return AuthResult<OAuthClient>::err(invalidClient());
    }
    if (!client.isConfidential) {
        return AuthResult<OAuthClient>::ok(std::move(client));
    }

    if (!clientSecret || !client.clientSecretHash) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Client,
                    "Confidential client presented no secret", clientContext(clientId));
        return AuthResult<OAuthClient>::err(invalidClient());
    }
    auto outcome = detail::isBlank(*clientSecret)
                       ? SecretVerification::Failed
                       : hasher_->verify(*client.clientSecretHash, *clientSecret);
    if (outcome == SecretVerification::Failed) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Client, "Client secret mismatch",
                    clientContext(clientId));
        return AuthResult<OAuthClient>::err(invalidClient());
    }

    if (outcome == SecretVerification::SuccessRehashNeeded) {
        auto rehashed = hasher_->hash(*clientSecret);
        if (rehashed) {
            OAuthClient upgraded = client;
            upgraded.clientSecretHash = std::move(rehashed).value();
            auto stored = store_->update(upgraded);
            if (stored) {
                client = std::move(upgraded);
                CAS_LOG_CTX(LogLevel::Info, LogCategory::Client, "Client secret hash upgraded",
                            clientContext(clientId));
            } else {
                CAS_LOG_CTX(LogLevel::Warning, LogCategory::Storage,
                            "Client secret hash upgrade not persisted: " +
                                std::string(stored.error().message()),
                            clientContext(clientId));
            }
        }
    }
    return AuthResult<OAuthClient>::ok(std::move(client));
}

bool OAuthClientService::isRedirectUriAllowed(const OAuthClient& client,
                                              std::string_view redirectUri) {
    if (redirectUri.empty()) {
        return false;
    }
    for (const auto& uri : client.redirectUris) {
        if (uri == redirectUri) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> OAuthClientService::parseRedirectUris(std::string_view text) {
    std::vector<std::string> uris;
    std::string current;
    auto flush = [&] {
        if (!current.empty()) {
            uris.push_back(std::move(current));
            current.clear();
        }
    };
    for (char c : text) {
        if (c == ',' || c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == ';') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return uris;
}

}  // namespace cas::service
