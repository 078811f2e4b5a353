#include <gtest/gtest.h>

#include "application/AccountStore.hpp"
#include "adapters/secondary/OpenSslCredentialHasher.hpp"
#include "adapters/secondary/persistence/InMemoryAccountRepository.hpp"

using namespace finger;
using namespace finger::application;

class AccountStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<adapters::secondary::InMemoryAccountRepository>();
        hasher_ = std::make_shared<adapters::secondary::OpenSslCredentialHasher>();
        store_ = std::make_unique<AccountStore>(repository_, hasher_);
    }

    std::shared_ptr<adapters::secondary::InMemoryAccountRepository> repository_;
    std::shared_ptr<adapters::secondary::OpenSslCredentialHasher> hasher_;
    std::unique_ptr<AccountStore> store_;
    const domain::Timestamp now_ = domain::Timestamp::fromSeconds(1000);
};

TEST_F(AccountStoreTest, Create_StoresHashOfKey) {
    auto account = store_->create("alice", "secret-key", now_);

    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->username, "alice");
    EXPECT_NE(account->keyHash, "secret-key");
    EXPECT_EQ(account->keyHash, hasher_->hash("secret-key"));
    EXPECT_EQ(account->createdAt, now_);
    EXPECT_EQ(store_->count(), 1u);
}

TEST_F(AccountStoreTest, Create_DuplicateUsernameFails) {
    ASSERT_TRUE(store_->create("alice", "k1", now_).has_value());

    auto second = store_->create("alice", "k2", now_);

    EXPECT_FALSE(second.has_value());
    EXPECT_TRUE(store_->verify("alice", "k1"));
    EXPECT_FALSE(store_->verify("alice", "k2"));
}

TEST_F(AccountStoreTest, Lookup) {
    store_->create("alice", "k1", now_);

    EXPECT_TRUE(store_->lookup("alice").has_value());
    EXPECT_FALSE(store_->lookup("bob").has_value());
    EXPECT_FALSE(store_->lookup("Alice").has_value());
}

// ============================================
// VERIFY
// ============================================

TEST_F(AccountStoreTest, Verify_CorrectKey) {
    store_->create("alice", "k1", now_);
    EXPECT_TRUE(store_->verify("alice", "k1"));
}

TEST_F(AccountStoreTest, Verify_WrongKey) {
    store_->create("alice", "k1", now_);
    EXPECT_FALSE(store_->verify("alice", "k2"));
    EXPECT_FALSE(store_->verify("alice", ""));
}

TEST_F(AccountStoreTest, Verify_UnknownUser) {
    EXPECT_FALSE(store_->verify("nobody", "k1"));
}

TEST_F(AccountStoreTest, Verify_UnknownUserWithDummyPreimage) {
    // Ключ, из которого строится фиктивный хэш, не открывает несуществующий аккаунт
    EXPECT_FALSE(store_->verify("nobody", "finger-service/unknown-user"));
}
