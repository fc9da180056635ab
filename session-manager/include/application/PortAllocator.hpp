#pragma once

#include "application/AllocationLedger.hpp"
#include "domain/ResourceAllocation.hpp"
#include "domain/Subnet.hpp"
#include "ports/output/IContainerRuntime.hpp"
#include "ports/output/IDescriptorStore.hpp"
#include "ports/output/IPortProbe.hpp"
#include "settings/RuntimeSettings.hpp"
#include <functional>
#include <memory>
#include <set>
#include <vector>

namespace sandbox::application {

/**
 * @brief Выделение портов и подсетей под runtime-пару
 *
 * Порт свободен, если он не отвечает на TCP-connect, не записан
 * в живом дескрипторе и не зарезервирован в AllocationLedger.
 *
 * Подсеть: случайный /24 из 172.20.0.0-172.31.255.0, затем из
 * 10.100.0.0-10.199.255.0; кандидат отбрасывается при пересечении
 * с сетями движка, подсетями дескрипторов и резервированиями.
 */
class PortAllocator {
public:
    PortAllocator(
        std::shared_ptr<ports::output::IPortProbe> portProbe,
        std::shared_ptr<ports::output::IContainerRuntime> runtime,
        std::shared_ptr<ports::output::IDescriptorStore> descriptors,
        std::shared_ptr<AllocationLedger> ledger,
        std::shared_ptr<settings::RuntimeSettings> settings
    );

    /**
     * @brief Найти count свободных портов начиная со startingAt
     *
     * Порты не резервируются. Возвращаются по возрастанию.
     * @throws domain::ResourceConflictException если за PORT_PROBE_LIMIT проверок не нашлось
     */
    std::vector<int> findFreePorts(int startingAt, int count);

    /**
     * @brief Найти непересекающийся /24
     * @throws domain::ResourceConflictException если оба пула исчерпаны
     */
    domain::Subnet findFreeSubnet();

    /**
     * @brief Выделить и зарезервировать backend-порт, frontend-порт и подсеть
     *
     * При ошибке уже сделанные резервирования сессии снимаются.
     */
    domain::ResourceAllocation allocate(const std::string& sessionId);

private:
    std::shared_ptr<ports::output::IPortProbe> portProbe_;
    std::shared_ptr<ports::output::IContainerRuntime> runtime_;
    std::shared_ptr<ports::output::IDescriptorStore> descriptors_;
    std::shared_ptr<AllocationLedger> ledger_;
    std::shared_ptr<settings::RuntimeSettings> settings_;

    struct Occupied {
        std::set<int> ports;
        std::vector<domain::Subnet> subnets;
    };

    Occupied collectDescriptorResources();

    bool isPortFree(int port, const std::set<int>& occupied);

    /**
     * @brief Обход диапазона портов; claim решает, берётся ли свободный порт
     *
     * findFreePorts() только смотрит, allocate() резервирует через claim.
     */
    std::vector<int> scanPorts(
        int startingAt,
        int count,
        const std::set<int>& occupied,
        const std::function<bool(int)>& claim
    );

    domain::Subnet scanSubnets(
        const std::vector<domain::Subnet>& existing,
        const std::function<bool(const domain::Subnet&)>& claim
    );

    std::vector<domain::Subnet> existingSubnets(const Occupied& occupied);
};

} // namespace sandbox::application
