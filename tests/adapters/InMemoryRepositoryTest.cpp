#include <gtest/gtest.h>

#include "adapters/secondary/persistence/InMemoryAccountRepository.hpp"
#include "adapters/secondary/persistence/InMemoryPresenceRepository.hpp"
#include "adapters/secondary/persistence/InMemoryVisibilityRepository.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace finger;
using namespace finger::adapters::secondary;

// ============================================
// ACCOUNTS
// ============================================

TEST(InMemoryAccountRepositoryTest, CreateIsCheckAndInsert) {
    InMemoryAccountRepository repo;

    EXPECT_TRUE(repo.create(domain::Account("alice", "h1", domain::Timestamp())));
    EXPECT_FALSE(repo.create(domain::Account("alice", "h2", domain::Timestamp())));
    EXPECT_EQ(repo.findByUsername("alice")->keyHash, "h1");
    EXPECT_EQ(repo.count(), 1u);
}

TEST(InMemoryAccountRepositoryTest, ConcurrentCreate_OneWinner) {
    InMemoryAccountRepository repo;
    std::atomic<int> created{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&repo, &created, i]() {
            if (repo.create(domain::Account("alice", "h" + std::to_string(i), domain::Timestamp()))) {
                ++created;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(created.load(), 1);
}

// ============================================
// PRESENCE
// ============================================

TEST(InMemoryPresenceRepositoryTest, SaveOverwrites) {
    InMemoryPresenceRepository repo;

    domain::PresenceStatus status;
    status.username = "alice";
    status.online = true;
    status.message = "first";
    repo.save(status);

    status.message = "second";
    repo.save(status);

    EXPECT_EQ(repo.find("alice")->message, "second");
    EXPECT_EQ(repo.findAll().size(), 1u);
    EXPECT_FALSE(repo.find("bob").has_value());
}

// ============================================
// VISIBILITY
// ============================================

TEST(InMemoryVisibilityRepositoryTest, KeepsInsertionOrderPerSubject) {
    InMemoryVisibilityRepository repo;

    repo.append(domain::VisibilityEntry("bob", "alice", domain::Timestamp::fromSeconds(30)));
    repo.append(domain::VisibilityEntry("carol", "alice", domain::Timestamp::fromSeconds(10)));
    repo.append(domain::VisibilityEntry("alice", "bob", domain::Timestamp::fromSeconds(20)));

    auto entries = repo.findBySubject("alice");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].observer, "bob");
    EXPECT_EQ(entries[1].observer, "carol");
    EXPECT_EQ(repo.size(), 3u);
}
