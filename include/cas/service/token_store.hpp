#pragma once

/// @file token_store.hpp
/// @brief Persistence interfaces for sealed token rows and their
///        thread-safe in-memory implementations.
///
/// Abstracts token storage so the token services can work with any
/// backend (in-memory, SQL database, etc.). Rows are looked up by the
/// SHA-256 hash of their plaintext, never by ciphertext.
///
/// State transitions are conditional writes: `markUsed` and `revoke`
/// report whether *this* call moved the flag, which is how exactly-once
/// consumption is enforced under concurrency. A relational backend maps
/// them to `UPDATE ... WHERE is_used = false` and the affected-row count.

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "cas/foundation/auth_result.hpp"
#include "cas/service/token_types.hpp"

namespace cas::service {

// -- Authorization codes ------------------------------------------------------

/// Authorization code rows.
///
/// Implementations must be thread-safe when shared across threads.
class IAuthorizationCodeStore {
public:
    virtual ~IAuthorizationCodeStore() = default;

    /// Persist a new row. StorageConflict if the id or hash already exists.
    virtual foundation::AuthResult<void> insert(AuthorizationCode row) = 0;

    /// Find a row by code hash.
    [[nodiscard]] virtual foundation::AuthResult<std::optional<AuthorizationCode>> findByHash(
        std::string_view codeHash) const = 0;

    /// Flip `isUsed` from false to true.
    /// @return true only for the single caller that performed the flip;
    ///         false if the row was already used or does not exist.
    virtual foundation::AuthResult<bool> markUsed(std::string_view id, TimePoint at) = 0;

    /// Delete rows that are expired or used. Returns the number deleted.
    virtual foundation::AuthResult<std::size_t> removeExpired(TimePoint now) = 0;
};

// -- Refresh tokens -----------------------------------------------------------

/// Refresh token rows.
///
/// Implementations must be thread-safe when shared across threads.
class IRefreshTokenStore {
public:
    virtual ~IRefreshTokenStore() = default;

    /// Persist a new row. StorageConflict if the id or hash already exists.
    virtual foundation::AuthResult<void> insert(RefreshToken row) = 0;

    /// Find a row by token hash.
    [[nodiscard]] virtual foundation::AuthResult<std::optional<RefreshToken>> findByHash(
        std::string_view tokenHash) const = 0;

    /// Record a successful validation. Last writer wins.
    virtual foundation::AuthResult<void> touchUsedAt(std::string_view id, TimePoint at) = 0;

    /// Revoke one row.
    /// @return true if this call revoked it, false if it was already revoked.
    ///         NotFound if no such row exists.
    virtual foundation::AuthResult<bool> revoke(std::string_view id, TimePoint at) = 0;

    /// Revoke every non-revoked row of a user within a tenant.
    /// @return Number of rows this call revoked.
    virtual foundation::AuthResult<std::size_t> revokeAllForUser(std::string_view userId,
                                                                 std::string_view tenantId,
                                                                 TimePoint at) = 0;

    /// Delete expired rows. Returns the number deleted.
    virtual foundation::AuthResult<std::size_t> removeExpired(TimePoint now) = 0;
};

// -- MFA challenge tokens -----------------------------------------------------

/// MFA challenge rows.
///
/// Implementations must be thread-safe when shared across threads.
class IMfaChallengeStore {
public:
    virtual ~IMfaChallengeStore() = default;

    /// Persist a new row. StorageConflict if the id or hash already exists.
    virtual foundation::AuthResult<void> insert(MfaChallengeToken row) = 0;

    /// Find a row by token hash.
    [[nodiscard]] virtual foundation::AuthResult<std::optional<MfaChallengeToken>> findByHash(
        std::string_view tokenHash) const = 0;

    /// Flip `isUsed` from false to true; true only for the flipping caller.
    virtual foundation::AuthResult<bool> markUsed(std::string_view id, TimePoint at) = 0;

    /// Delete rows that are expired or used. Returns the number deleted.
    virtual foundation::AuthResult<std::size_t> removeExpired(TimePoint now) = 0;
};

// -- In-memory implementations ------------------------------------------------

/// Thread-safe in-memory authorization code store for testing and development.
class InMemoryAuthorizationCodeStore : public IAuthorizationCodeStore {
public:
    foundation::AuthResult<void> insert(AuthorizationCode row) override;

    [[nodiscard]] foundation::AuthResult<std::optional<AuthorizationCode>> findByHash(
        std::string_view codeHash) const override;

    foundation::AuthResult<bool> markUsed(std::string_view id, TimePoint at) override;

    foundation::AuthResult<std::size_t> removeExpired(TimePoint now) override;

    /// Number of stored rows.
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, AuthorizationCode> rows_;  // id -> row
    std::unordered_map<std::string, std::string> byHash_;      // hash -> id
};

/// Thread-safe in-memory refresh token store for testing and development.
class InMemoryRefreshTokenStore : public IRefreshTokenStore {
public:
    foundation::AuthResult<void> insert(RefreshToken row) override;

    [[nodiscard]] foundation::AuthResult<std::optional<RefreshToken>> findByHash(
        std::string_view tokenHash) const override;

    foundation::AuthResult<void> touchUsedAt(std::string_view id, TimePoint at) override;

    foundation::AuthResult<bool> revoke(std::string_view id, TimePoint at) override;

    foundation::AuthResult<std::size_t> revokeAllForUser(std::string_view userId,
                                                         std::string_view tenantId,
                                                         TimePoint at) override;

    foundation::AuthResult<std::size_t> removeExpired(TimePoint now) override;

    /// Number of stored rows.
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RefreshToken> rows_;
    std::unordered_map<std::string, std::string> byHash_;
};

/// Thread-safe in-memory MFA challenge store for testing and development.
class InMemoryMfaChallengeStore : public IMfaChallengeStore {
public:
    foundation::AuthResult<void> insert(MfaChallengeToken row) override;

    [[nodiscard]] foundation::AuthResult<std::optional<MfaChallengeToken>> findByHash(
        std::string_view tokenHash) const override;

    foundation::AuthResult<bool> markUsed(std::string_view id, TimePoint at) override;

    foundation::AuthResult<std::size_t> removeExpired(TimePoint now) override;

    /// Number of stored rows.
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, MfaChallengeToken> rows_;
    std::unordered_map<std::string, std::string> byHash_;
};

}  // namespace cas::service
