#pragma once

#include <string>

namespace sandbox::domain {

/**
 * @brief Ресурсы, выделенные под runtime-пару сессии
 *
 * Инвариант: у двух живых аллокаций нет общих портов и пересекающихся подсетей.
 * Резервирование снимается только после остановки runtime и удаления дескриптора.
 */
struct ResourceAllocation {
    std::string sessionId;
    int backendPort = 0;
    int frontendPort = 0;
    std::string subnet;         ///< CIDR, например "172.23.41.0/24"
    std::string containerName;  ///< <prefix>_<sessionId>, он же имя compose-проекта

    std::string backendContainer() const { return containerName + "_backend"; }

    std::string frontendContainer() const { return containerName + "_frontend"; }
};

} // namespace sandbox::domain
