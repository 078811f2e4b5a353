#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <algorithm>

struct Record {
    int value;
    std::string name;

    Record(int v = 0, const std::string& n = "") : value(v), name(n) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, Record> map;
};

TEST_F(ThreadSafeMapTest, InsertAndFind) {
    map.insert("alice", std::make_shared<Record>(42, "alice"));

    auto found = map.find("alice");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->value, 42);
    EXPECT_EQ(found->name, "alice");
}

TEST_F(ThreadSafeMapTest, FindMissingReturnsNull) {
    EXPECT_EQ(map.find("nobody"), nullptr);
    EXPECT_FALSE(map.contains("nobody"));
}

TEST_F(ThreadSafeMapTest, InsertIfAbsent_KeepsFirstValue) {
    EXPECT_TRUE(map.insertIfAbsent("bob", std::make_shared<Record>(1, "first")));
    EXPECT_FALSE(map.insertIfAbsent("bob", std::make_shared<Record>(2, "second")));

    auto found = map.find("bob");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->name, "first");
}

TEST_F(ThreadSafeMapTest, RemoveAndClear) {
    map.insert("a", std::make_shared<Record>(1));
    map.insert("b", std::make_shared<Record>(2));

    EXPECT_TRUE(map.remove("a"));
    EXPECT_FALSE(map.remove("a"));
    EXPECT_EQ(map.size(), 1u);

    map.clear();
    EXPECT_EQ(map.size(), 0u);
}

TEST_F(ThreadSafeMapTest, ValuesIsSnapshot) {
    map.insert("a", std::make_shared<Record>(1));
    map.insert("b", std::make_shared<Record>(2));

    auto snapshot = map.values();
    map.insert("c", std::make_shared<Record>(3));

    ASSERT_EQ(snapshot.size(), 2u);
    int sum = 0;
    for (const auto& r : snapshot) sum += r->value;
    EXPECT_EQ(sum, 3);
}

// Ровно один поток из многих должен выиграть гонку за ключ
TEST_F(ThreadSafeMapTest, ConcurrentInsertIfAbsent_ExactlyOneWins) {
    const int NUM_THREADS = 16;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([this, i, &winners]() {
            if (map.insertIfAbsent("contested", std::make_shared<Record>(i))) {
                winners++;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ThreadSafeMapTest, ConcurrentReadWrite_NoDataCorruption) {
    const std::string key = "shared_key";
    map.insert(key, std::make_shared<Record>(0, "initial"));

    std::vector<std::thread> threads;
    std::atomic<int> readCount(0);

    for (int writer = 0; writer < 4; ++writer) {
        threads.emplace_back([this, &key, writer]() {
            for (int i = 0; i < 50; ++i) {
                map.insert(key, std::make_shared<Record>(writer * 100 + i, "data"));
            }
        });
    }

    for (int reader = 0; reader < 4; ++reader) {
        threads.emplace_back([this, &key, &readCount]() {
            for (int i = 0; i < 100; ++i) {
                auto found = map.find(key);
                ASSERT_NE(found, nullptr);
                readCount++;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(readCount, 400);
}
