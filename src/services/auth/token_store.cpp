/// @file token_store.cpp
/// @brief In-memory token store implementations.

#include "cas/service/token_store.hpp"

namespace cas::service {

using cas::foundation::AuthError;
using cas::foundation::AuthResult;
using cas::foundation::ErrorCode;

namespace {

/// Insert @p row into the id map and hash index, rejecting duplicates.
template <typename Row>
AuthResult<void> insertRow(std::unordered_map<std::string, Row>& rows,
                           std::unordered_map<std::string, std::string>& byHash,
                           Row row,
                           const std::string& hash) {
    if (row.id.empty() || hash.empty()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::InvalidArgument, "row id and hash are required"));
    }
    if (rows.count(row.id) != 0 || byHash.count(hash) != 0) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::StorageConflict, "duplicate token row"));
    }
    byHash.emplace(hash, row.id);
    auto id = row.id;
    rows.emplace(std::move(id), std::move(row));
    return AuthResult<void>::ok();
}

template <typename Row>
std::optional<Row> findRow(const std::unordered_map<std::string, Row>& rows,
                           const std::unordered_map<std::string, std::string>& byHash,
                           std::string_view hash) {
    auto idx = byHash.find(std::string(hash));
    if (idx == byHash.end()) {
        return std::nullopt;
    }
    auto it = rows.find(idx->second);
    if (it == rows.end()) {
        return std::nullopt;
    }
    return it->second;
}

/// Compare-and-set of the used flag.
template <typename Row>
bool markRowUsed(std::unordered_map<std::string, Row>& rows, std::string_view id, TimePoint at) {
    auto it = rows.find(std::string(id));
    if (it == rows.end() || it->second.isUsed) {
        return false;
    }
    it->second.isUsed = true;
    it->second.usedAt = at;
    return true;
}

/// Erase rows matching @p pred from both maps.
template <typename Row, typename Hash, typename Pred>
std::size_t eraseRows(std::unordered_map<std::string, Row>& rows,
                      std::unordered_map<std::string, std::string>& byHash,
                      Hash hashOf,
                      Pred pred) {
    std::size_t removed = 0;
    for (auto it = rows.begin(); it != rows.end();) {
        if (pred(it->second)) {
            byHash.erase(hashOf(it->second));
            it = rows.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

}  // anonymous namespace

// ---------------------------------------------------------------------------
// InMemoryAuthorizationCodeStore
// ---------------------------------------------------------------------------

AuthResult<void> InMemoryAuthorizationCodeStore::insert(AuthorizationCode row) {
    std::lock_guard lock(mutex_);
    auto hash = row.codeHash;
    // Plaintext codes never reach storage.
    row.code.clear();
    return insertRow(rows_, byHash_, std::move(row), hash);
}

AuthResult<std::optional<AuthorizationCode>> InMemoryAuthorizationCodeStore::findByHash(
    std::string_view codeHash) const {
    std::lock_guard lock(mutex_);
    return AuthResult<std::optional<AuthorizationCode>>::ok(findRow(rows_, byHash_, codeHash));
}

AuthResult<bool> InMemoryAuthorizationCodeStore::markUsed(std::string_view id, TimePoint at) {
    std::lock_guard lock(mutex_);
    return AuthResult<bool>::ok(markRowUsed(rows_, id, at));
}

AuthResult<std::size_t> InMemoryAuthorizationCodeStore::removeExpired(TimePoint now) {
    std::lock_guard lock(mutex_);
    auto removed = eraseRows(
        rows_, byHash_, [](const AuthorizationCode& r) { return r.codeHash; },
        [now](const AuthorizationCode& r) { return r.isUsed || r.expiresAt <= now; });
    return AuthResult<std::size_t>::ok(removed);
}

std::size_t InMemoryAuthorizationCodeStore::size() const {
    std::lock_guard lock(mutex_);
    return rows_.size();
}

// ---------------------------------------------------------------------------
// InMemoryRefreshTokenStore
// ---------------------------------------------------------------------------

AuthResult<void> InMemoryRefreshTokenStore::insert(RefreshToken row) {
    std::lock_guard lock(mutex_);
    auto hash = row.tokenHash;
    return insertRow(rows_, byHash_, std::move(row), hash);
}

AuthResult<std::optional<RefreshToken>> InMemoryRefreshTokenStore::findByHash(
    std::string_view tokenHash) const {
    std::lock_guard lock(mutex_);
    return AuthResult<std::optional<RefreshToken>>::ok(findRow(rows_, byHash_, tokenHash));
}

AuthResult<void> InMemoryRefreshTokenStore::touchUsedAt(std::string_view id, TimePoint at) {
    std::lock_guard lock(mutex_);
    auto it = rows_.find(std::string(id));
    if (it == rows_.end()) {
        return AuthResult<void>::err(AuthError(ErrorCode::NotFound, "refresh token not found"));
    }
    it->second.usedAt = at;
    return AuthResult<void>::ok();
}

AuthResult<bool> InMemoryRefreshTokenStore::revoke(std::string_view id, TimePoint at) {
    std::lock_guard lock(mutex_);
    auto it = rows_.find(std::string(id));
    if (it == rows_.end()) {
        return AuthResult<bool>::err(AuthError(ErrorCode::NotFound, "refresh token not found"));
    }
    if (it->second.isRevoked) {
        return AuthResult<bool>::ok(false);
    }
    it->second.isRevoked = true;
    it->second.revokedAt = at;
    return AuthResult<bool>::ok(true);
}

AuthResult<std::size_t> InMemoryRefreshTokenStore::revokeAllForUser(std::string_view userId,
                                                                    std::string_view tenantId,
                                                                    TimePoint at) {
    std::lock_guard lock(mutex_);
    std::size_t count = 0;
    for (auto& [id, row] : rows_) {
        if (row.userId == userId && row.tenantId == tenantId && !row.isRevoked) {
            row.isRevoked = true;
            row.revokedAt = at;
            ++count;
        }
    }
    return AuthResult<std::size_t>::ok(count);
}

AuthResult<std::size_t> InMemoryRefreshTokenStore::removeExpired(TimePoint now) {
    std::lock_guard lock(mutex_);
    auto removed = eraseRows(
        rows_, byHash_, [](const RefreshToken& r) { return r.tokenHash; },
        [now](const RefreshToken& r) { return r.expiresAt <= now; });
    return AuthResult<std::size_t>::ok(removed);
}

std::size_t InMemoryRefreshTokenStore::size() const {
    std::lock_guard lock(mutex_);
    return rows_.size();
}

// ---------------------------------------------------------------------------
// InMemoryMfaChallengeStore
// ---------------------------------------------------------------------------

AuthResult<void> InMemoryMfaChallengeStore::insert(MfaChallengeToken row) {
    std::lock_guard lock(mutex_);
    auto hash = row.tokenHash;
    return insertRow(rows_, byHash_, std::move(row), hash);
}

AuthResult<std::optional<MfaChallengeToken>> InMemoryMfaChallengeStore::findByHash(
    std::string_view tokenHash) const {
    std::lock_guard lock(mutex_);
    return AuthResult<std::optional<MfaChallengeToken>>::ok(findRow(rows_, byHash_, tokenHash));
}

AuthResult<bool> InMemoryMfaChallengeStore::markUsed(std::string_view id, TimePoint at) {
    std::lock_guard lock(mutex_);
    return AuthResult<bool>::ok(markRowUsed(rows_, id, at));
}

AuthResult<std::size_t> InMemoryMfaChallengeStore::removeExpired(TimePoint now) {
    std::lock_guard lock(mutex_);
    auto removed = eraseRows(
        rows_, byHash_, [](const MfaChallengeToken& r) { return r.tokenHash; },
        [now](const MfaChallengeToken& r) { return r.isUsed || r.expiresAt <= now; });
    return AuthResult<std::size_t>::ok(removed);
}

std::size_t InMemoryMfaChallengeStore::size() const {
    std::lock_guard lock(mutex_);
    return rows_.size();
}

}  // namespace cas::service
