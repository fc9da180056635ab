#pragma once

#include "ports/output/ICommandRunner.hpp"
#include "domain/ResourceAllocation.hpp"
#include "domain/SessionListing.hpp"
#include "domain/enums/ProcessStatus.hpp"
#include <string>
#include <vector>

namespace sandbox::ports::output {

/**
 * @brief Движок контейнеров, на котором живут runtime-пары
 *
 * Output Port.
 *
 * Реализации:
 * - DockerComposeRuntime (docker / docker-compose через ICommandRunner)
 */
class IContainerRuntime {
public:
    virtual ~IContainerRuntime() = default;

    // ========================================================================
    // RUNTIME-ПАРА
    // ========================================================================

    virtual CommandResult up(const domain::ResourceAllocation& allocation, const std::string& envFile) = 0;

    virtual CommandResult down(const domain::ResourceAllocation& allocation, const std::string& envFile) = 0;

    // ========================================================================
    // ОТДЕЛЬНЫЕ КОНТЕЙНЕРЫ
    // ========================================================================

    virtual CommandResult stopContainer(const std::string& name) = 0;

    virtual CommandResult removeContainer(const std::string& name) = 0;

    virtual domain::ProcessStatus inspectStatus(const std::string& name) = 0;

    virtual CommandResult tailLogs(const std::string& name, int lines) = 0;

    /**
     * @brief Контейнеры, имя которых начинается с префикса
     * @param includeStopped false: только запущенные (docker ps), true: все (docker ps -a)
     */
    virtual std::vector<domain::RuntimeContainer> listContainers(
        const std::string& prefix,
        bool includeStopped
    ) = 0;

    // ========================================================================
    // СЕТИ
    // ========================================================================

    /**
     * @brief CIDR всех подсетей, уже занятых виртуальными сетями движка
     */
    virtual std::vector<std::string> listNetworkSubnets() = 0;
};

} // namespace sandbox::ports::output
