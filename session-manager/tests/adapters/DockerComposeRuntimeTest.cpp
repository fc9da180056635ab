#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "adapters/secondary/runtime/DockerComposeRuntime.hpp"
#include "mocks/GmockPorts.hpp"

using namespace sandbox;
using namespace sandbox::tests::mocks;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;

class DockerComposeRuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::RuntimeSettings>();
        settings_->setProjectRoot("/srv/sandbox");
        settings_->setComposeFile("docker-compose.yml");
        settings_->setDockerBin("docker");
        settings_->setDockerComposeBin("docker-compose");

        runner_ = std::make_shared<MockCommandRunner>();
        runtime_ = std::make_shared<adapters::secondary::DockerComposeRuntime>(runner_, settings_);

        allocation_.sessionId = "abc";
        allocation_.backendPort = 8001;
        allocation_.frontendPort = 3001;
        allocation_.subnet = "172.22.5.0/24";
        allocation_.containerName = "research_sandbox_abc";
    }

    static ports::output::CommandResult ok(const std::string& out = "") {
        return {0, out, ""};
    }

    std::shared_ptr<settings::RuntimeSettings> settings_;
    std::shared_ptr<MockCommandRunner> runner_;
    std::shared_ptr<adapters::secondary::DockerComposeRuntime> runtime_;
    domain::ResourceAllocation allocation_;
};

// ============================================================================
// COMPOSE
// ============================================================================

TEST_F(DockerComposeRuntimeTest, Up_RunsComposeInProjectRoot) {
    EXPECT_CALL(*runner_, run(ElementsAre("docker-compose", "-f", "docker-compose.yml",
                                          "--env-file", "/data/abc/.env",
                                          "-p", "research_sandbox_abc", "up", "-d"),
                              "/srv/sandbox"))
        .WillOnce(Return(ok()));

    EXPECT_TRUE(runtime_->up(allocation_, "/data/abc/.env").ok());
}

TEST_F(DockerComposeRuntimeTest, Down_PassesFailureThrough) {
    EXPECT_CALL(*runner_, run(ElementsAre("docker-compose", "-f", "docker-compose.yml",
                                          "--env-file", "/data/abc/.env",
                                          "-p", "research_sandbox_abc", "down"),
                              "/srv/sandbox"))
        .WillOnce(Return(ports::output::CommandResult{1, "", "network in use"}));

    auto result = runtime_->down(allocation_, "/data/abc/.env");

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.err, "network in use");
}

// ============================================================================
// DOCKER CLI
// ============================================================================

TEST_F(DockerComposeRuntimeTest, ContainerCommands) {
    EXPECT_CALL(*runner_, run(ElementsAre("docker", "stop", "c1"), "")).WillOnce(Return(ok()));
    EXPECT_CALL(*runner_, run(ElementsAre("docker", "rm", "-f", "c1"), "")).WillOnce(Return(ok()));
    EXPECT_CALL(*runner_, run(ElementsAre("docker", "logs", "--tail", "50", "c1"), ""))
        .WillOnce(Return(ok("line\n")));

    EXPECT_TRUE(runtime_->stopContainer("c1").ok());
    EXPECT_TRUE(runtime_->removeContainer("c1").ok());
    EXPECT_EQ(runtime_->tailLogs("c1", 50).out, "line\n");
}

TEST_F(DockerComposeRuntimeTest, InspectStatus_MapsDockerStates) {
    EXPECT_CALL(*runner_, run(ElementsAre("docker", "inspect", "--format", "{{.State.Status}}", "up"), ""))
        .WillOnce(Return(ok("running\n")));
    EXPECT_CALL(*runner_, run(ElementsAre("docker", "inspect", "--format", "{{.State.Status}}", "down"), ""))
        .WillOnce(Return(ok("exited\n")));
    EXPECT_CALL(*runner_, run(ElementsAre("docker", "inspect", "--format", "{{.State.Status}}", "gone"), ""))
        .WillOnce(Return(ports::output::CommandResult{1, "", "Error: No such object: gone"}));
    EXPECT_CALL(*runner_, run(ElementsAre("docker", "inspect", "--format", "{{.State.Status}}", "broken"), ""))
        .WillOnce(Return(ports::output::CommandResult{1, "", "Cannot connect to the Docker daemon"}));

    EXPECT_EQ(runtime_->inspectStatus("up"), domain::ProcessStatus::RUNNING);
    EXPECT_EQ(runtime_->inspectStatus("down"), domain::ProcessStatus::EXITED);
    EXPECT_EQ(runtime_->inspectStatus("gone"), domain::ProcessStatus::NOT_FOUND);
    EXPECT_EQ(runtime_->inspectStatus("broken"), domain::ProcessStatus::ERROR);
}

// docker фильтрует по подстроке, адаптер оставляет только префикс
TEST_F(DockerComposeRuntimeTest, ListContainers_ParsesAndFiltersByPrefix) {
    std::string out =
        "research_sandbox_abc_backend\tid1\tUp 2 hours\t0.0.0.0:8001->8000/tcp\n"
        "old_research_sandbox_x\tid2\tUp 1 hour\t\n"
        "research_sandbox_abc_frontend\tid3\tExited (0) 5 minutes ago\t\n";

    EXPECT_CALL(*runner_, run(ElementsAre("docker", "ps", "-a", "--filter", "name=research_sandbox",
                                          "--format", "{{.Names}}\t{{.ID}}\t{{.Status}}\t{{.Ports}}"), ""))
        .WillOnce(Return(ok(out)));

    auto containers = runtime_->listContainers("research_sandbox", true);

    ASSERT_EQ(containers.size(), 2u);
    EXPECT_EQ(containers[0].name, "research_sandbox_abc_backend");
    EXPECT_EQ(containers[0].id, "id1");
    EXPECT_EQ(containers[0].status, "Up 2 hours");
    EXPECT_EQ(containers[0].ports, "0.0.0.0:8001->8000/tcp");
    EXPECT_EQ(containers[1].status, "Exited (0) 5 minutes ago");
}

TEST_F(DockerComposeRuntimeTest, ListContainers_FailureGivesEmptyList) {
    EXPECT_CALL(*runner_, run(_, "")).WillOnce(Return(ports::output::CommandResult{1, "", "daemon down"}));

    EXPECT_TRUE(runtime_->listContainers("research_sandbox", false).empty());
}

TEST_F(DockerComposeRuntimeTest, ListNetworkSubnets_InspectsEveryNetwork) {
    EXPECT_CALL(*runner_, run(ElementsAre("docker", "network", "ls", "-q"), ""))
        .WillOnce(Return(ok("n1\nn2\n")));
    EXPECT_CALL(*runner_, run(ElementsAre("docker", "network", "inspect", "--format",
                                          "{{range .IPAM.Config}}{{.Subnet}} {{end}}", "n1", "n2"), ""))
        .WillOnce(Return(ok("172.17.0.0/16 \n172.22.5.0/24 fd00::/64 \n")));

    auto subnets = runtime_->listNetworkSubnets();

    EXPECT_THAT(subnets, ElementsAre("172.17.0.0/16", "172.22.5.0/24", "fd00::/64"));
}
