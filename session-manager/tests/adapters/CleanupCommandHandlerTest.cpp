#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "adapters/primary/cli/CleanupCommandHandler.hpp"
#include "mocks/GmockPorts.hpp"

#include <sstream>

using namespace sandbox;
using namespace sandbox::tests::mocks;
using sandbox::adapters::primary::CommandLine;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;

class CleanupCommandHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        cleanup_ = std::make_shared<MockCleanupService>();
        handler_ = std::make_unique<adapters::primary::CleanupCommandHandler>(cleanup_);
        handler_->setInput(in_);
    }

    int run(const std::vector<std::string>& args) {
        return handler_->handle(CommandLine::parse(args, {"session"}), out_, err_);
    }

    static domain::CleanupSummary summaryOf(size_t cleaned, size_t failed) {
        domain::CleanupSummary summary;
        summary.processed = cleaned + failed;
        summary.cleaned = cleaned;
        summary.failed = failed;
        for (size_t i = 0; i < summary.processed; ++i) {
            domain::CleanupReport report;
            report.sessionId = "session-" + std::to_string(i);
            if (i >= cleaned) {
                report.errors.push_back("stop: failed");
            }
            summary.reports.push_back(report);
        }
        return summary;
    }

    std::shared_ptr<MockCleanupService> cleanup_;
    std::unique_ptr<adapters::primary::CleanupCommandHandler> handler_;
    std::istringstream in_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(CleanupCommandHandlerTest, Default_CleansExpired) {
    EXPECT_CALL(*cleanup_, cleanupExpired(false)).WillOnce(Return(summaryOf(2, 0)));

    EXPECT_EQ(run({}), 0);
    EXPECT_THAT(out_.str(), HasSubstr("Processed: 2 | Cleaned: 2 | Failed: 0"));
}

TEST_F(CleanupCommandHandlerTest, Default_NothingExpired) {
    EXPECT_CALL(*cleanup_, cleanupExpired(true)).WillOnce(Return(domain::CleanupSummary{}));

    EXPECT_EQ(run({"--dry-run"}), 0);
    EXPECT_EQ(out_.str(), "No expired sessions\n");
}

TEST_F(CleanupCommandHandlerTest, Default_FailureExitsNonZero) {
    EXPECT_CALL(*cleanup_, cleanupExpired(false)).WillOnce(Return(summaryOf(1, 1)));

    EXPECT_EQ(run({}), 1);
    EXPECT_THAT(out_.str(), HasSubstr("error: stop: failed"));
}

TEST_F(CleanupCommandHandlerTest, Session_CleansOne) {
    domain::CleanupReport report;
    report.sessionId = "abc";
    report.descriptorRemoved = true;
    EXPECT_CALL(*cleanup_, cleanupSession("abc", false)).WillOnce(Return(report));

    EXPECT_EQ(run({"--session", "abc"}), 0);
}

TEST_F(CleanupCommandHandlerTest, All_AsksForConfirmation) {
    in_.str("yes\n");
    EXPECT_CALL(*cleanup_, cleanupAll(true, false)).WillOnce(Return(summaryOf(3, 0)));

    EXPECT_EQ(run({"--all"}), 0);
    EXPECT_THAT(out_.str(), HasSubstr("Type 'yes' to continue"));
}

TEST_F(CleanupCommandHandlerTest, All_DeclinedDoesNothing) {
    in_.str("no\n");
    domain::CleanupSummary refused;
    refused.confirmed = false;
    EXPECT_CALL(*cleanup_, cleanupAll(false, false)).WillOnce(Return(refused));

    EXPECT_EQ(run({"--all"}), 1);
    EXPECT_THAT(err_.str(), HasSubstr("Cleanup not confirmed"));
}

TEST_F(CleanupCommandHandlerTest, All_YesSkipsPrompt) {
    EXPECT_CALL(*cleanup_, cleanupAll(true, false)).WillOnce(Return(summaryOf(0, 0)));

    EXPECT_EQ(run({"--all", "--yes"}), 0);
    EXPECT_THAT(out_.str(), ::testing::Not(HasSubstr("Type 'yes'")));
}

TEST_F(CleanupCommandHandlerTest, List_DelegatesToListing) {
    EXPECT_CALL(*cleanup_, list()).WillOnce(Return(domain::SessionListing{}));
    EXPECT_CALL(*cleanup_, cleanupExpired(_)).Times(0);

    EXPECT_EQ(run({"--list"}), 0);
    EXPECT_THAT(out_.str(), HasSubstr("No sessions found"));
}
