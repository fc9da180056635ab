#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <string>

struct Reservation {
    std::string owner;

    explicit Reservation(std::string o = "") : owner(std::move(o)) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, Reservation> map;
};

// ============================================================================
// БАЗОВЫЕ ОПЕРАЦИИ
// ============================================================================

TEST_F(ThreadSafeMapTest, InsertAndFind) {
    map.insert("port:8000", std::make_shared<Reservation>("sess-a"));

    auto found = map.find("port:8000");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->owner, "sess-a");
    EXPECT_TRUE(map.contains("port:8000"));
    EXPECT_EQ(map.find("port:8001"), nullptr);
}

TEST_F(ThreadSafeMapTest, TryInsert_SecondCallerLoses) {
    EXPECT_TRUE(map.tryInsert("subnet:172.20.1.0/24", std::make_shared<Reservation>("sess-a")));
    EXPECT_FALSE(map.tryInsert("subnet:172.20.1.0/24", std::make_shared<Reservation>("sess-b")));

    EXPECT_EQ(map.find("subnet:172.20.1.0/24")->owner, "sess-a");
}

TEST_F(ThreadSafeMapTest, Remove_ReturnsWhetherKeyExisted) {
    map.insert("port:3000", std::make_shared<Reservation>("sess-a"));

    EXPECT_TRUE(map.remove("port:3000"));
    EXPECT_FALSE(map.remove("port:3000"));
    EXPECT_EQ(map.size(), 0u);
}

TEST_F(ThreadSafeMapTest, RemoveIf_DropsOnlyMatchingOwner) {
    map.insert("port:8000", std::make_shared<Reservation>("sess-a"));
    map.insert("port:3000", std::make_shared<Reservation>("sess-a"));
    map.insert("port:8001", std::make_shared<Reservation>("sess-b"));

    auto removed = map.removeIf([](const std::string&, const Reservation& r) {
        return r.owner == "sess-a";
    });

    EXPECT_EQ(removed, 2u);
    EXPECT_EQ(map.size(), 1u);
    EXPECT_TRUE(map.contains("port:8001"));
}

TEST_F(ThreadSafeMapTest, GetAll_ReturnsSnapshot) {
    map.insert("a", std::make_shared<Reservation>("x"));
    map.insert("b", std::make_shared<Reservation>("y"));

    auto all = map.getAll();
    map.clear();

    EXPECT_EQ(all.size(), 2u);
    EXPECT_EQ(map.size(), 0u);
}

// ============================================================================
// МНОГОПОТОЧНОСТЬ
// ============================================================================

// Из множества конкурентов ключ достаётся ровно одному
TEST_F(ThreadSafeMapTest, ConcurrentTryInsert_ExactlyOneWinnerPerKey) {
    const int NUM_THREADS = 8;
    const int NUM_KEYS = 200;

    std::atomic<int> wins(0);
    std::vector<std::thread> threads;

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([this, t, &wins]() {
            for (int k = 0; k < NUM_KEYS; ++k) {
                auto owner = std::make_shared<Reservation>("t" + std::to_string(t));
                if (map.tryInsert("port:" + std::to_string(8000 + k), owner)) {
                    wins++;
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(wins.load(), NUM_KEYS);
    EXPECT_EQ(map.size(), static_cast<size_t>(NUM_KEYS));
}

TEST_F(ThreadSafeMapTest, ConcurrentReadWrite_ReadersAlwaysSeeValidObject) {
    const std::string key = "shared";
    map.insert(key, std::make_shared<Reservation>("initial"));

    std::vector<std::thread> threads;
    std::atomic<int> readCount(0);

    for (int writer = 0; writer < 4; ++writer) {
        threads.emplace_back([this, &key, writer]() {
            for (int i = 0; i < 50; ++i) {
                map.insert(key, std::make_shared<Reservation>("w" + std::to_string(writer)));
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

    EXPECT_EQ(readCount.load(), 400);
}
