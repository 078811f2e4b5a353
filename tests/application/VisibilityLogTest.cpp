#include <gtest/gtest.h>

#include "application/VisibilityLog.hpp"
#include "adapters/secondary/persistence/InMemoryVisibilityRepository.hpp"

using namespace finger;
using namespace finger::application;

class VisibilityLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<adapters::secondary::InMemoryVisibilityRepository>();
        log_ = std::make_unique<VisibilityLog>(repository_);
    }

    std::shared_ptr<adapters::secondary::InMemoryVisibilityRepository> repository_;
    std::unique_ptr<VisibilityLog> log_;
};

TEST_F(VisibilityLogTest, EmptyForUnknownSubject) {
    EXPECT_TRUE(log_->listCheckers("alice").empty());
}

TEST_F(VisibilityLogTest, OldestFirstAndOnlyOwnSubject) {
    log_->record("alice", "bob", domain::Timestamp::fromSeconds(20));
    log_->record("carol", "bob", domain::Timestamp::fromSeconds(25));
    log_->record("alice", "carol", domain::Timestamp::fromSeconds(30));
    log_->record("alice", "bob", domain::Timestamp::fromSeconds(40));

    auto checkers = log_->listCheckers("alice");

    ASSERT_EQ(checkers.size(), 3u);
    EXPECT_EQ(checkers[0].observer, "bob");
    EXPECT_EQ(checkers[0].at, domain::Timestamp::fromSeconds(20));
    EXPECT_EQ(checkers[1].observer, "carol");
    EXPECT_EQ(checkers[2].observer, "bob");
    for (const auto& entry : checkers) {
        EXPECT_EQ(entry.subject, "alice");
    }
}

TEST_F(VisibilityLogTest, ReadingDoesNotDrain) {
    log_->record("alice", "bob", domain::Timestamp::fromSeconds(20));

    EXPECT_EQ(log_->listCheckers("alice").size(), 1u);
    EXPECT_EQ(log_->listCheckers("alice").size(), 1u);
    EXPECT_EQ(repository_->size(), 1u);
}
