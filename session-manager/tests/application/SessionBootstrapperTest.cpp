#include <gtest/gtest.h>

#include "application/SessionBootstrapper.hpp"
#include "mocks/SandboxTestBed.hpp"

using namespace sandbox;
using namespace sandbox::tests::mocks;

class SessionBootstrapperTest : public ::testing::Test {
protected:
    void SetUp() override {
        bed_ = std::make_unique<SandboxTestBed>();
        bootstrapper_ = std::make_unique<application::SessionBootstrapper>(
            bed_->descriptors, bed_->registry, bed_->sessionSettings);
    }

    std::unique_ptr<SandboxTestBed> bed_;
    std::unique_ptr<application::SessionBootstrapper> bootstrapper_;
};

TEST_F(SessionBootstrapperTest, ImportAll_SkipsExpiredDescriptors) {
    bed_->writeDescriptor("alpha", domain::Timestamp::now().addHours(-2), 72, 18000, 13000, "172.20.1.0/24");
    bed_->writeDescriptor("bravo", domain::Timestamp::now().addHours(-100), 72, 18001, 13001, "172.20.2.0/24");

    EXPECT_EQ(bootstrapper_->importAll(), 1u);

    auto session = bed_->registry->get("alpha");
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->username, "researcher_alpha");
    EXPECT_EQ(session->passwordHash, "plain$secret");
    EXPECT_EQ(session->ttl.count(), 72);
    EXPECT_FALSE(bed_->registry->get("bravo").has_value());
}

TEST_F(SessionBootstrapperTest, ImportAll_KeepsInactiveFlag) {
    bed_->writeDescriptor("alpha", domain::Timestamp::now(), 72, 18000, 13000, "172.20.1.0/24", false);

    bootstrapper_->importAll();

    auto session = bed_->registry->get("alpha");
    ASSERT_TRUE(session.has_value());
    EXPECT_FALSE(session->active);
}

TEST_F(SessionBootstrapperTest, ImportAll_HonorsPinnedSession) {
    bed_->writeDescriptor("alpha", domain::Timestamp::now(), 72, 18000, 13000, "172.20.1.0/24");
    bed_->writeDescriptor("bravo", domain::Timestamp::now(), 72, 18001, 13001, "172.20.2.0/24");
    bed_->sessionSettings->setPinnedSessionId("bravo");

    EXPECT_EQ(bootstrapper_->importAll(), 1u);
    EXPECT_TRUE(bed_->registry->get("bravo").has_value());
    EXPECT_FALSE(bed_->registry->get("alpha").has_value());
}

TEST_F(SessionBootstrapperTest, ImportAll_EmptyDirectory) {
    EXPECT_EQ(bootstrapper_->importAll(), 0u);
    EXPECT_EQ(bed_->registry->size(), 0u);
}
