#include <gtest/gtest.h>

#include "application/DescriptorReconciler.hpp"
#include "mocks/SandboxTestBed.hpp"

using namespace sandbox;
using namespace sandbox::tests::mocks;

class DescriptorReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        bed_ = std::make_unique<SandboxTestBed>();
        reconciler_ = std::make_shared<application::DescriptorReconciler>(
            bed_->descriptors, bed_->orchestrator, bed_->runtime,
            bed_->registry, bed_->store, bed_->ledger, bed_->runtimeSettings);
    }

    static domain::Timestamp hoursAgo(int hours) {
        return domain::Timestamp::now().addHours(-hours);
    }

    std::unique_ptr<SandboxTestBed> bed_;
    std::shared_ptr<application::DescriptorReconciler> reconciler_;
};

// ============================================================================
// CLEANUP EXPIRED
// ============================================================================

TEST_F(DescriptorReconcilerTest, CleanupExpired_RemovesOnlyExpiredSessions) {
    bed_->registerSession("old", hoursAgo(100), 72, 18000, 13000, "172.20.1.0/24");
    bed_->registerSession("fresh", hoursAgo(1), 72, 18001, 13001, "172.20.2.0/24");
    bed_->store->createConversation("old");
    bed_->store->createConversation("fresh");
    bed_->ledger->reservePort(18000, "old");

    auto summary = reconciler_->cleanupExpired(false);

    EXPECT_EQ(summary.processed, 1u);
    EXPECT_EQ(summary.cleaned, 1u);
    EXPECT_EQ(summary.failed, 0u);
    ASSERT_EQ(summary.reports.size(), 1u);
    EXPECT_EQ(summary.reports[0].sessionId, "old");
    EXPECT_TRUE(summary.reports[0].runtimeStopped);
    EXPECT_TRUE(summary.reports[0].descriptorRemoved);

    EXPECT_FALSE(bed_->registry->get("old").has_value());
    EXPECT_TRUE(bed_->registry->get("fresh").has_value());
    EXPECT_FALSE(bed_->descriptors->exists("old"));
    EXPECT_TRUE(bed_->descriptors->exists("fresh"));
    EXPECT_EQ(bed_->runtime->downCallCount(), 1);
    EXPECT_EQ(bed_->store->conversationCount(), 1u);
    EXPECT_EQ(bed_->ledger->size(), 0u);
}

TEST_F(DescriptorReconcilerTest, CleanupExpired_NothingToDo) {
    bed_->registerSession("fresh", hoursAgo(1), 72, 18000, 13000, "172.20.1.0/24");

    auto summary = reconciler_->cleanupExpired(false);

    EXPECT_EQ(summary.processed, 0u);
    EXPECT_EQ(bed_->runtime->downCallCount(), 0);
}

TEST_F(DescriptorReconcilerTest, CleanupExpired_DryRunTouchesNothing) {
    bed_->registerSession("old", hoursAgo(100), 72, 18000, 13000, "172.20.1.0/24");
    bed_->runtime->addContainer("test_sandbox_old_backend");

    auto summary = reconciler_->cleanupExpired(true);

    EXPECT_TRUE(summary.dryRun);
    EXPECT_EQ(summary.processed, 1u);
    ASSERT_EQ(summary.reports.size(), 1u);
    EXPECT_TRUE(summary.reports[0].dryRun);
    EXPECT_FALSE(summary.reports[0].descriptorRemoved);

    EXPECT_TRUE(bed_->descriptors->exists("old"));
    EXPECT_TRUE(bed_->registry->get("old").has_value());
    EXPECT_EQ(bed_->runtime->downCallCount(), 0);
    EXPECT_EQ(bed_->runtime->containerCount(), 1u);
}

// Сессия, известная только реестру, тоже подбирается
TEST_F(DescriptorReconcilerTest, CleanupExpired_IncludesRegistryOnlySessions) {
    bed_->registry->importSession(domain::Session(
        "ghost", "researcher_ghost", "plain$secret", hoursAgo(100), std::chrono::hours(72)));

    auto summary = reconciler_->cleanupExpired(false);

    EXPECT_EQ(summary.processed, 1u);
    EXPECT_FALSE(bed_->registry->get("ghost").has_value());
}

// ============================================================================
// CLEANUP SESSION
// ============================================================================

// Контейнеры, пережившие compose down, удаляются принудительно
TEST_F(DescriptorReconcilerTest, CleanupSession_ForceRemovesLeftoverContainers) {
    bed_->registerSession("alpha", hoursAgo(1), 72, 18000, 13000, "172.20.1.0/24");
    bed_->runtime->addContainer("test_sandbox_alpha_worker");
    bed_->runtime->addContainer("test_sandbox_bravo_backend");

    auto report = reconciler_->cleanupSession("alpha", false);

    EXPECT_TRUE(report.success());
    EXPECT_EQ(report.containersRemoved, 1);
    auto removed = bed_->runtime->removedContainers();
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], "test_sandbox_alpha_worker");
    EXPECT_EQ(bed_->runtime->containerCount(), 1u);
}

// Сбой compose down не мешает остальным шагам
TEST_F(DescriptorReconcilerTest, CleanupSession_ContinuesAfterStopFailure) {
    bed_->registerSession("alpha", hoursAgo(1), 72, 18000, 13000, "172.20.1.0/24");
    bed_->ledger->reservePort(18000, "alpha");
    bed_->runtime->setDownResult({1, "", "daemon unavailable"});

    auto report = reconciler_->cleanupSession("alpha", false);

    EXPECT_FALSE(report.success());
    EXPECT_FALSE(report.runtimeStopped);
    EXPECT_TRUE(report.descriptorRemoved);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_NE(report.errors[0].find("daemon unavailable"), std::string::npos);
    EXPECT_FALSE(bed_->registry->get("alpha").has_value());
    // Пара могла остаться запущенной: её порт нельзя отдавать другой сессии
    EXPECT_TRUE(bed_->ledger->isPortReserved(18000));
}

TEST_F(DescriptorReconcilerTest, CleanupSession_ReleasesReservationsOnceStopped) {
    bed_->registerSession("alpha", hoursAgo(1), 72, 18000, 13000, "172.20.1.0/24");
    bed_->ledger->reservePort(18000, "alpha");
    bed_->ledger->reservePort(13000, "alpha");

    auto report = reconciler_->cleanupSession("alpha", false);

    EXPECT_TRUE(report.success());
    EXPECT_EQ(bed_->ledger->size(), 0u);
}

TEST_F(DescriptorReconcilerTest, CleanupExpired_RegistryOnlySessionWithoutContainersIsCleaned) {
    bed_->registry->importSession(domain::Session(
        "ghost", "researcher_ghost", "plain$secret", hoursAgo(100), std::chrono::hours(72)));
    bed_->ledger->reservePort(18005, "ghost");

    auto summary = reconciler_->cleanupExpired(false);

    EXPECT_EQ(summary.cleaned, 1u);
    EXPECT_EQ(bed_->ledger->size(), 0u);
}

// ============================================================================
// CLEANUP ALL
// ============================================================================

TEST_F(DescriptorReconcilerTest, CleanupAll_RefusesWithoutConfirmation) {
    bed_->registerSession("alpha", hoursAgo(1), 72, 18000, 13000, "172.20.1.0/24");

    auto summary = reconciler_->cleanupAll(false, false);

    EXPECT_FALSE(summary.confirmed);
    EXPECT_EQ(summary.processed, 0u);
    EXPECT_TRUE(bed_->descriptors->exists("alpha"));
    EXPECT_EQ(bed_->registry->size(), 1u);
}

TEST_F(DescriptorReconcilerTest, CleanupAll_RemovesSessionsAndOrphans) {
    bed_->registerSession("alpha", hoursAgo(1), 72, 18000, 13000, "172.20.1.0/24");
    bed_->registerSession("bravo", hoursAgo(2), 72, 18001, 13001, "172.20.2.0/24");
    bed_->registerSession("charlie", hoursAgo(100), 72, 18002, 13002, "172.20.3.0/24");
    bed_->runtime->addContainer("test_sandbox_orphan_backend");
    bed_->runtime->addContainer("other_project_db");

    auto summary = reconciler_->cleanupAll(true, false);

    EXPECT_EQ(summary.processed, 3u);
    EXPECT_EQ(summary.cleaned, 3u);
    EXPECT_EQ(summary.orphanContainersRemoved, 1);
    EXPECT_EQ(bed_->registry->size(), 0u);
    EXPECT_TRUE(bed_->descriptors->loadAll().empty());
    EXPECT_EQ(bed_->runtime->containerCount(), 1u);
}

// ============================================================================
// LIST
// ============================================================================

TEST_F(DescriptorReconcilerTest, List_StatusPrecedenceAndOrphans) {
    bed_->writeDescriptor("alpha", hoursAgo(4), 72, 18000, 13000, "172.20.1.0/24");
    bed_->writeDescriptor("bravo", hoursAgo(100), 72, 18001, 13001, "172.20.2.0/24");
    bed_->writeDescriptor("charlie", hoursAgo(2), 72, 18002, 13002, "172.20.3.0/24");
    bed_->writeDescriptor("delta", hoursAgo(1), 72, 18003, 13003, "172.20.4.0/24", false);

    bed_->runtime->addContainer("test_sandbox_alpha_backend");
    bed_->runtime->addContainer("test_sandbox_bravo_backend");
    bed_->runtime->addContainer("test_sandbox_ghost_backend");
    bed_->runtime->addContainer("test_sandbox_charlie_backend", "Exited (0) 2 hours ago");

    auto listing = reconciler_->list();

    ASSERT_EQ(listing.sessions.size(), 4u);
    // Старые первыми
    EXPECT_EQ(listing.sessions[0].sessionId, "bravo");
    EXPECT_EQ(listing.sessions[0].status, domain::SessionStatus::EXPIRED);
    EXPECT_EQ(listing.sessions[0].remaining.count(), 0);
    EXPECT_EQ(listing.sessions[1].sessionId, "alpha");
    EXPECT_EQ(listing.sessions[1].status, domain::SessionStatus::RUNNING);
    EXPECT_EQ(listing.sessions[1].containers.size(), 1u);
    EXPECT_EQ(listing.sessions[2].sessionId, "charlie");
    EXPECT_EQ(listing.sessions[2].status, domain::SessionStatus::ACTIVE);
    EXPECT_TRUE(listing.sessions[2].containers.empty());
    EXPECT_EQ(listing.sessions[3].sessionId, "delta");
    EXPECT_EQ(listing.sessions[3].status, domain::SessionStatus::STOPPED);

    ASSERT_EQ(listing.orphans.size(), 1u);
    EXPECT_EQ(listing.orphans[0].name, "test_sandbox_ghost_backend");

    EXPECT_EQ(listing.summary.totalSessions, 4u);
    EXPECT_EQ(listing.summary.running, 1u);
    EXPECT_EQ(listing.summary.expired, 1u);
    EXPECT_EQ(listing.summary.active, 1u);
    EXPECT_EQ(listing.summary.stopped, 1u);
    EXPECT_EQ(listing.summary.totalContainers, 3u);
    EXPECT_EQ(listing.summary.orphanedContainers, 1u);
}

TEST_F(DescriptorReconcilerTest, List_IsReadOnly) {
    bed_->writeDescriptor("bravo", hoursAgo(100), 72, 18001, 13001, "172.20.2.0/24");

    reconciler_->list();

    EXPECT_TRUE(bed_->descriptors->exists("bravo"));
    EXPECT_EQ(bed_->runtime->downCallCount(), 0);
}
