#include <gtest/gtest.h>

#include "adapters/secondary/persistence/InMemoryEphemeralStore.hpp"
#include "adapters/secondary/persistence/InMemorySessionRegistry.hpp"
#include "application/ExpiryReconciler.hpp"

#include <thread>

using namespace sandbox;

class ExpiryReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::SessionSettings>();
        settings_->setTtlHours(72);
        registry_ = std::make_shared<adapters::secondary::InMemorySessionRegistry>(settings_);
        store_ = std::make_shared<adapters::secondary::InMemoryEphemeralStore>();
        reconciler_ = std::make_unique<application::ExpiryReconciler>(registry_, store_);
    }

    void importSession(const std::string& id, int hoursAgo, int ttlHours) {
        registry_->importSession(domain::Session(
            id, "researcher_" + id, "plain$secret",
            domain::Timestamp::now().addHours(-hoursAgo), std::chrono::hours(ttlHours)));
    }

    std::shared_ptr<settings::SessionSettings> settings_;
    std::shared_ptr<adapters::secondary::InMemorySessionRegistry> registry_;
    std::shared_ptr<adapters::secondary::InMemoryEphemeralStore> store_;
    std::unique_ptr<application::ExpiryReconciler> reconciler_;
};

TEST_F(ExpiryReconcilerTest, Sweep_RemovesExpiredSessionsAndTheirData) {
    importSession("old", 100, 72);
    importSession("fresh", 1, 72);
    store_->createConversation("old");
    store_->createConversation("fresh");

    auto removed = reconciler_->sweep();

    EXPECT_EQ(removed, 1u);
    EXPECT_FALSE(registry_->get("old").has_value());
    EXPECT_TRUE(registry_->get("fresh").has_value());
    EXPECT_EQ(store_->conversationCount(), 1u);
    EXPECT_EQ(reconciler_->sweepCount(), 1u);
}

// Сессия истекает строго после createdAt + ttl
TEST_F(ExpiryReconcilerTest, Sweep_UsesGivenClock) {
    auto createdAt = domain::Timestamp::fromUnixSeconds(1765881000);
    registry_->importSession(domain::Session(
        "edge", "researcher_edge", "plain$secret", createdAt, std::chrono::hours(1)));

    EXPECT_EQ(reconciler_->sweep(createdAt.addHours(1)), 0u);
    EXPECT_EQ(reconciler_->sweep(createdAt.addSeconds(3601)), 1u);
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(ExpiryReconcilerTest, StartStop_RunsSweepInBackground) {
    importSession("old", 100, 72);

    reconciler_->start(std::chrono::seconds(60));
    EXPECT_TRUE(reconciler_->isRunning());

    for (int i = 0; i < 100 && reconciler_->sweepCount() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    reconciler_->stop();

    EXPECT_FALSE(reconciler_->isRunning());
    EXPECT_GE(reconciler_->sweepCount(), 1u);
    EXPECT_EQ(registry_->size(), 0u);
}

// stop() не ждёт окончания интервала
TEST_F(ExpiryReconcilerTest, Stop_WakesSleepingWorker) {
    reconciler_->start(std::chrono::seconds(3600));

    auto begin = std::chrono::steady_clock::now();
    reconciler_->stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, std::chrono::seconds(5));
    reconciler_->stop();
}
