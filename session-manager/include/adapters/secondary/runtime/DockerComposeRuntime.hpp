#pragma once

#include "ports/output/IContainerRuntime.hpp"
#include "ports/output/ICommandRunner.hpp"
#include "settings/RuntimeSettings.hpp"
#include <memory>

namespace sandbox::adapters::secondary {

/**
 * @brief Runtime-пара на docker-compose
 *
 * Пара (backend + frontend) поднимается и гасится одной compose-командой
 * с .env сессии; отдельные контейнеры обслуживаются docker CLI.
 * Все команды идут через ICommandRunner, поэтому argv легко проверить в тестах.
 */
class DockerComposeRuntime : public ports::output::IContainerRuntime {
public:
    DockerComposeRuntime(
        std::shared_ptr<ports::output::ICommandRunner> runner,
        std::shared_ptr<settings::RuntimeSettings> settings
    );

    ports::output::CommandResult up(const domain::ResourceAllocation& allocation, const std::string& envFile) override;
    ports::output::CommandResult down(const domain::ResourceAllocation& allocation, const std::string& envFile) override;

    ports::output::CommandResult stopContainer(const std::string& name) override;
    ports::output::CommandResult removeContainer(const std::string& name) override;
    domain::ProcessStatus inspectStatus(const std::string& name) override;
    ports::output::CommandResult tailLogs(const std::string& name, int lines) override;

    std::vector<domain::RuntimeContainer> listContainers(const std::string& prefix, bool includeStopped) override;

    std::vector<std::string> listNetworkSubnets() override;

private:
    std::shared_ptr<ports::output::ICommandRunner> runner_;
    std::shared_ptr<settings::RuntimeSettings> settings_;

    std::vector<std::string> composeCommand(
        const domain::ResourceAllocation& allocation,
        const std::string& envFile
    ) const;

    ports::output::CommandResult docker(const std::vector<std::string>& args);
};

} // namespace sandbox::adapters::secondary
