#include <gtest/gtest.h>

#include "application/PresenceStore.hpp"
#include "adapters/secondary/persistence/InMemoryPresenceRepository.hpp"

using namespace finger;
using namespace finger::application;
using namespace std::chrono_literals;

namespace {

domain::Timestamp at(int64_t seconds) {
    return domain::Timestamp::fromSeconds(seconds);
}

} // namespace

class PresenceStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<adapters::secondary::InMemoryPresenceRepository>();
        store_ = std::make_unique<PresenceStore>(repository_);
    }

    std::shared_ptr<adapters::secondary::InMemoryPresenceRepository> repository_;
    std::unique_ptr<PresenceStore> store_;
};

// ============================================
// GET STATUS
// ============================================

TEST_F(PresenceStoreTest, GetStatus_NeverLoggedIn) {
    EXPECT_FALSE(store_->getStatus("alice", at(0)).has_value());
}

TEST_F(PresenceStoreTest, SetOnline_OnlineUntilExpiry) {
    store_->setOnline("alice", at(0), 3600s, std::string("hi"));

    auto status = store_->getStatus("alice", at(3599));
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->online);
    EXPECT_EQ(status->message, "hi");
    EXPECT_EQ(status->expiresAt, at(3600));

    auto expired = store_->getStatus("alice", at(3600));
    ASSERT_TRUE(expired.has_value());
    EXPECT_FALSE(expired->online);
    EXPECT_EQ(expired->message, "hi");
    EXPECT_EQ(expired->since, at(3600));
}

TEST_F(PresenceStoreTest, GetStatus_LazilyRewritesExpiredRecord) {
    store_->setOnline("alice", at(0), 60s, std::nullopt);

    store_->getStatus("alice", at(120));

    auto stored = repository_->find("alice");
    ASSERT_TRUE(stored.has_value());
    EXPECT_FALSE(stored->online);

    // Повторное чтение ничего не меняет
    auto again = store_->getStatus("alice", at(500));
    EXPECT_FALSE(again->online);
    EXPECT_EQ(again->since, at(60));
}

// ============================================
// SET ONLINE
// ============================================

TEST_F(PresenceStoreTest, SetOnline_WithoutMessageKeepsPrevious) {
    store_->setOnline("alice", at(0), 3600s, std::string("at work"));
    store_->setOffline("alice", at(10));
    store_->setOnline("alice", at(20), 3600s, std::nullopt);

    auto status = store_->getStatus("alice", at(30));
    EXPECT_TRUE(status->online);
    EXPECT_EQ(status->message, "at work");
}

TEST_F(PresenceStoreTest, SetOnline_FirstTimeWithoutMessageIsEmpty) {
    store_->setOnline("alice", at(0), 3600s, std::nullopt);
    EXPECT_EQ(store_->getStatus("alice", at(1))->message, "");
}

TEST_F(PresenceStoreTest, SetOnline_WhileOnlineKeepsSince) {
    store_->setOnline("alice", at(0), 3600s, std::string("a"));
    store_->setOnline("alice", at(100), 3600s, std::string("b"));

    auto status = store_->getStatus("alice", at(200));
    EXPECT_EQ(status->since, at(0));
    EXPECT_EQ(status->expiresAt, at(3700));
    EXPECT_EQ(status->message, "b");
}

// ============================================
// BUMP
// ============================================

TEST_F(PresenceStoreTest, Bump_SlidesWindowFromBumpTime) {
    store_->setOnline("alice", at(0), 3600s, std::nullopt);

    EXPECT_TRUE(store_->bump("alice", at(3599), 3600s));

    auto status = store_->getStatus("alice", at(7198));
    EXPECT_TRUE(status->online);
    EXPECT_EQ(status->expiresAt, at(7199));
    EXPECT_FALSE(store_->getStatus("alice", at(7199))->online);
}

TEST_F(PresenceStoreTest, Bump_AfterExpiryFails) {
    store_->setOnline("alice", at(0), 3600s, std::nullopt);

    EXPECT_FALSE(store_->bump("alice", at(3600), 3600s));
    EXPECT_FALSE(repository_->find("alice")->online);
}

TEST_F(PresenceStoreTest, Bump_NeverLoggedInFails) {
    EXPECT_FALSE(store_->bump("alice", at(0), 3600s));
    EXPECT_FALSE(repository_->find("alice").has_value());
}

TEST_F(PresenceStoreTest, Bump_KeepsMessage) {
    store_->setOnline("alice", at(0), 3600s, std::string("hi"));
    store_->bump("alice", at(10), 3600s);
    EXPECT_EQ(store_->getStatus("alice", at(20))->message, "hi");
}

// ============================================
// SET OFFLINE
// ============================================

TEST_F(PresenceStoreTest, SetOffline_KeepsMessage) {
    store_->setOnline("alice", at(0), 3600s, std::string("gone fishing"));

    EXPECT_TRUE(store_->setOffline("alice", at(50)));

    auto status = store_->getStatus("alice", at(60));
    EXPECT_FALSE(status->online);
    EXPECT_EQ(status->message, "gone fishing");
    EXPECT_EQ(status->since, at(50));
}

TEST_F(PresenceStoreTest, SetOffline_WhenNotOnlineFails) {
    EXPECT_FALSE(store_->setOffline("alice", at(0)));

    store_->setOnline("alice", at(0), 3600s, std::nullopt);
    store_->setOffline("alice", at(10));
    EXPECT_FALSE(store_->setOffline("alice", at(20)));
}

// ============================================
// SNAPSHOT & EXPIRY
// ============================================

TEST_F(PresenceStoreTest, Snapshot_EvaluatesExpiryWithoutWriting) {
    store_->setOnline("alice", at(0), 100s, std::nullopt);
    store_->setOnline("bob", at(0), 3600s, std::nullopt);

    auto snapshot = store_->snapshot(at(200));

    ASSERT_EQ(snapshot.size(), 2u);
    for (const auto& status : snapshot) {
        EXPECT_EQ(status.online, status.username == "bob");
    }
    EXPECT_TRUE(repository_->find("alice")->online);
}

TEST_F(PresenceStoreTest, ExpireIfLapsed_IsIdempotent) {
    store_->setOnline("alice", at(0), 100s, std::nullopt);
    store_->setOnline("bob", at(0), 3600s, std::nullopt);

    auto lapsed = store_->lapsedUsernames(at(200));
    ASSERT_EQ(lapsed.size(), 1u);
    EXPECT_EQ(lapsed[0], "alice");

    EXPECT_TRUE(store_->expireIfLapsed("alice", at(200)));
    EXPECT_FALSE(store_->expireIfLapsed("alice", at(200)));
    EXPECT_FALSE(store_->expireIfLapsed("bob", at(200)));
    EXPECT_TRUE(store_->lapsedUsernames(at(200)).empty());
}
