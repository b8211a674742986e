#include <gtest/gtest.h>

#include "cas/service/client_store.hpp"
#include "cas/service/tenant_settings.hpp"
#include "cas/service/token_store.hpp"
#include "cas/service/user_directory.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace cas::service;
using cas::foundation::ErrorCode;

namespace {

RefreshToken makeRefreshRow(std::string id, std::string hash, std::string user,
                            TimePoint expiresAt) {
    RefreshToken row;
    row.id = std::move(id);
    row.tokenHash = std::move(hash);
    row.encryptedToken = "ciphertext";
    row.userId = std::move(user);
    row.tenantId = "tenant-a";
    row.expiresAt = expiresAt;
    row.createdAt = Clock::now();
    return row;
}

}  // namespace

// =============================================================================
// InMemoryAuthorizationCodeStore tests
// =============================================================================

TEST(AuthorizationCodeStoreTest, InsertDropsPlaintextCode) {
    InMemoryAuthorizationCodeStore store;
    AuthorizationCode row;
    row.id = "code-1";
    row.code = "plaintext";
    row.codeHash = "hash-1";
    row.expiresAt = Clock::now() + std::chrono::minutes(10);
    ASSERT_TRUE(store.insert(row));

    auto found = store.findByHash("hash-1");
    ASSERT_TRUE(found);
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->id, "code-1");
    EXPECT_TRUE(found.value()->code.empty());
}

TEST(AuthorizationCodeStoreTest, DuplicatesAreConflicts) {
    InMemoryAuthorizationCodeStore store;
    AuthorizationCode row;
    row.id = "code-1";
    row.codeHash = "hash-1";
    ASSERT_TRUE(store.insert(row));

    auto sameId = store.insert(row);
    ASSERT_FALSE(sameId);
    EXPECT_EQ(sameId.error().code(), ErrorCode::StorageConflict);

    row.id = "code-2";
    auto sameHash = store.insert(row);
    ASSERT_FALSE(sameHash);
    EXPECT_EQ(sameHash.error().code(), ErrorCode::StorageConflict);

    AuthorizationCode blank;
    EXPECT_FALSE(store.insert(blank));
}

TEST(AuthorizationCodeStoreTest, MarkUsedFlipsOnlyOnce) {
    InMemoryAuthorizationCodeStore store;
    AuthorizationCode row;
    row.id = "code-1";
    row.codeHash = "hash-1";
    ASSERT_TRUE(store.insert(row));

    auto first = store.markUsed("code-1", Clock::now());
    auto second = store.markUsed("code-1", Clock::now());
    auto missing = store.markUsed("code-9", Clock::now());
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    ASSERT_TRUE(missing);
    EXPECT_TRUE(first.value());
    EXPECT_FALSE(second.value());
    EXPECT_FALSE(missing.value());

    auto found = store.findByHash("hash-1");
    ASSERT_TRUE(found.value().has_value());
    EXPECT_TRUE(found.value()->isUsed);
    EXPECT_TRUE(found.value()->usedAt.has_value());
}

TEST(AuthorizationCodeStoreTest, ConcurrentMarkUsedHasSingleWinner) {
    InMemoryAuthorizationCodeStore store;
    AuthorizationCode row;
    row.id = "code-1";
    row.codeHash = "hash-1";
    ASSERT_TRUE(store.insert(row));

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            auto flipped = store.markUsed("code-1", Clock::now());
            if (flipped && flipped.value()) {
                winners.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(winners.load(), 1);
}

TEST(AuthorizationCodeStoreTest, RemoveExpiredDropsUsedAndExpiredRows) {
    InMemoryAuthorizationCodeStore store;
    auto now = Clock::now();

    AuthorizationCode live;
    live.id = "live";
    live.codeHash = "h-live";
    live.expiresAt = now + std::chrono::minutes(5);

    AuthorizationCode expired = live;
    expired.id = "expired";
    expired.codeHash = "h-expired";
    expired.expiresAt = now - std::chrono::minutes(1);

    AuthorizationCode used = live;
    used.id = "used";
    used.codeHash = "h-used";

    ASSERT_TRUE(store.insert(live));
    ASSERT_TRUE(store.insert(expired));
    ASSERT_TRUE(store.insert(used));
    ASSERT_TRUE(store.markUsed("used", now));

    auto removed = store.removeExpired(now);
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed.value(), 2u);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_FALSE(store.findByHash("h-used").value().has_value());
}

// =============================================================================
// InMemoryRefreshTokenStore tests
// =============================================================================

TEST(RefreshTokenStoreTest, RevokeIsIdempotent) {
    InMemoryRefreshTokenStore store;
    ASSERT_TRUE(store.insert(makeRefreshRow("r1", "h1", "alice", Clock::now() + std::chrono::hours(1))));

    auto first = store.revoke("r1", Clock::now());
    auto second = store.revoke("r1", Clock::now());
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_TRUE(first.value());
    EXPECT_FALSE(second.value());

    auto missing = store.revoke("nope", Clock::now());
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);
}

TEST(RefreshTokenStoreTest, RevokeAllCountsOnlyRowsItFlipped) {
    InMemoryRefreshTokenStore store;
    auto later = Clock::now() + std::chrono::hours(1);
    ASSERT_TRUE(store.insert(makeRefreshRow("r1", "h1", "alice", later)));
    ASSERT_TRUE(store.insert(makeRefreshRow("r2", "h2", "alice", later)));
    ASSERT_TRUE(store.insert(makeRefreshRow("r3", "h3", "alice", later)));
    ASSERT_TRUE(store.insert(makeRefreshRow("r4", "h4", "bob", later)));
    ASSERT_TRUE(store.revoke("r3", Clock::now()));

    auto count = store.revokeAllForUser("alice", "tenant-a", Clock::now());
    ASSERT_TRUE(count);
    EXPECT_EQ(count.value(), 2u);

    auto again = store.revokeAllForUser("alice", "tenant-a", Clock::now());
    EXPECT_EQ(again.value(), 0u);

    auto otherTenant = store.revokeAllForUser("bob", "tenant-b", Clock::now());
    EXPECT_EQ(otherTenant.value(), 0u);
    EXPECT_FALSE(store.findByHash("h4").value()->isRevoked);
}

TEST(RefreshTokenStoreTest, TouchUsedAtRequiresExistingRow) {
    InMemoryRefreshTokenStore store;
    ASSERT_TRUE(store.insert(makeRefreshRow("r1", "h1", "alice", Clock::now() + std::chrono::hours(1))));
    EXPECT_TRUE(store.touchUsedAt("r1", Clock::now()));
    EXPECT_TRUE(store.findByHash("h1").value()->usedAt.has_value());

    auto missing = store.touchUsedAt("r9", Clock::now());
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);
}

TEST(RefreshTokenStoreTest, RemoveExpiredKeepsRevokedButLiveRows) {
    InMemoryRefreshTokenStore store;
    auto now = Clock::now();
    ASSERT_TRUE(store.insert(makeRefreshRow("r1", "h1", "alice", now - std::chrono::seconds(1))));
    ASSERT_TRUE(store.insert(makeRefreshRow("r2", "h2", "alice", now + std::chrono::hours(1))));
    ASSERT_TRUE(store.revoke("r2", now));

    auto removed = store.removeExpired(now);
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed.value(), 1u);
    EXPECT_EQ(store.size(), 1u);
}

// =============================================================================
// InMemoryMfaChallengeStore tests
// =============================================================================

TEST(MfaChallengeStoreTest, MarkUsedAndSweep) {
    InMemoryMfaChallengeStore store;
    MfaChallengeToken row;
    row.id = "m1";
    row.tokenHash = "mh1";
    row.expiresAt = Clock::now() + std::chrono::minutes(10);
    ASSERT_TRUE(store.insert(row));

    EXPECT_TRUE(store.markUsed("m1", Clock::now()).value());
    EXPECT_FALSE(store.markUsed("m1", Clock::now()).value());

    auto removed = store.removeExpired(Clock::now());
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed.value(), 1u);
    EXPECT_EQ(store.size(), 0u);
}

// =============================================================================
// Collaborator stores
// =============================================================================

TEST(OAuthClientStoreTest, CrudAndSortedListing) {
    InMemoryOAuthClientStore store;
    OAuthClient b;
    b.id = "id-b";
    b.clientId = "b-client";
    OAuthClient a;
    a.id = "id-a";
    a.clientId = "a-client";

    ASSERT_TRUE(store.insert(b));
    ASSERT_TRUE(store.insert(a));
    auto dup = store.insert(a);
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error().code(), ErrorCode::StorageConflict);

    auto listed = store.list();
    ASSERT_TRUE(listed);
    ASSERT_EQ(listed.value().size(), 2u);
    EXPECT_EQ(listed.value()[0].clientId, "a-client");
    EXPECT_EQ(listed.value()[1].clientId, "b-client");

    a.name = "renamed";
    ASSERT_TRUE(store.update(a));
    EXPECT_EQ(store.findByClientId("a-client").value()->name, "renamed");

    OAuthClient ghost;
    ghost.clientId = "ghost";
    auto missing = store.update(ghost);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);

    EXPECT_TRUE(store.remove("a-client").value());
    EXPECT_FALSE(store.remove("a-client").value());
    EXPECT_FALSE(store.findByClientId("a-client").value().has_value());
}

TEST(TenantSettingsTest, SettingsAreScopedPerTenant) {
    InMemoryTenantSettingsProvider settings;
    settings.setSetting("tenant-a", tenant_setting_keys::kRefreshTokenExpirationDays, "7");

    auto a = settings.getSetting("tenant-a", tenant_setting_keys::kRefreshTokenExpirationDays);
    auto b = settings.getSetting("tenant-b", tenant_setting_keys::kRefreshTokenExpirationDays);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(a.value(), std::optional<std::string>("7"));
    EXPECT_FALSE(b.value().has_value());

    settings.removeSetting("tenant-a", tenant_setting_keys::kRefreshTokenExpirationDays);
    EXPECT_FALSE(settings.getSetting("tenant-a", tenant_setting_keys::kRefreshTokenExpirationDays)
                     .value()
                     .has_value());
}

TEST(UserDirectoryTest, UsersAreKeyedByTenantAndId) {
    InMemoryUserDirectory directory;
    DirectoryUser user;
    user.identity.id = "u1";
    user.identity.tenantId = "tenant-a";
    user.identity.userName = "alice";
    user.roles = {"Admin"};
    directory.upsert(user);

    auto found = directory.findUser("tenant-a", "u1");
    ASSERT_TRUE(found);
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->identity.userName, "alice");

    EXPECT_FALSE(directory.findUser("tenant-b", "u1").value().has_value());

    user.roles = {"User"};
    directory.upsert(user);
    EXPECT_EQ(directory.findUser("tenant-a", "u1").value()->roles,
              std::vector<std::string>{"User"});
}
