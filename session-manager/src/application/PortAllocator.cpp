#include "application/PortAllocator.hpp"
#include "domain/Errors.hpp"
#include "utils/SecureRandom.hpp"

#include <iostream>

namespace sandbox::application {

namespace {

/**
 * @brief Пул /24: первые два октета из диапазона, третий любой
 */
struct SubnetPool {
    int firstOctet;
    int secondMin;
    int secondMax;

    domain::Subnet randomCandidate() const {
        int second = secondMin + static_cast<int>(
            utils::SecureRandom::uniform(static_cast<uint32_t>(secondMax - secondMin + 1)));
        int third = static_cast<int>(utils::SecureRandom::uniform(256));
        return domain::Subnet::fromOctets(firstOctet, second, third, 0, 24);
    }
};

const SubnetPool PRIMARY_POOL{172, 20, 31};
const SubnetPool FALLBACK_POOL{10, 100, 199};

bool overlapsAny(const domain::Subnet& candidate, const std::vector<domain::Subnet>& existing) {
    for (const auto& subnet : existing) {
        if (candidate.overlaps(subnet)) {
            return true;
        }
    }
    return false;
}

} // namespace

PortAllocator::PortAllocator(
    std::shared_ptr<ports::output::IPortProbe> portProbe,
    std::shared_ptr<ports::output::IContainerRuntime> runtime,
    std::shared_ptr<ports::output::IDescriptorStore> descriptors,
    std::shared_ptr<AllocationLedger> ledger,
    std::shared_ptr<settings::RuntimeSettings> settings)
    : portProbe_(std::move(portProbe))
    , runtime_(std::move(runtime))
    , descriptors_(std::move(descriptors))
    , ledger_(std::move(ledger))
    , settings_(std::move(settings))
{}

// ============================================================================
// ПОРТЫ
// ============================================================================

std::vector<int> PortAllocator::findFreePorts(int startingAt, int count) {
    auto occupied = collectDescriptorResources();
    return scanPorts(startingAt, count, occupied.ports, [](int) { return true; });
}

bool PortAllocator::isPortFree(int port, const std::set<int>& occupied) {
    return occupied.count(port) == 0
        && !ledger_->isPortReserved(port)
        && !portProbe_->isInUse(port);
}

std::vector<int> PortAllocator::scanPorts(
    int startingAt,
    int count,
    const std::set<int>& occupied,
    const std::function<bool(int)>& claim)
{
    std::vector<int> ports;
    int limit = settings_->getPortProbeLimit();
    for (int port = startingAt; port < startingAt + limit && port <= 65535; ++port) {
        // Между проверкой и claim порт мог занять соседний поток
        if (!isPortFree(port, occupied) || !claim(port)) {
            continue;
        }
        ports.push_back(port);
        if (static_cast<int>(ports.size()) == count) {
            return ports;
        }
    }

    throw domain::ResourceConflictException(
        "No free port found in range " + std::to_string(startingAt) + "-" +
        std::to_string(startingAt + limit - 1));
}

// ============================================================================
// ПОДСЕТИ
// ============================================================================

domain::Subnet PortAllocator::findFreeSubnet() {
    auto occupied = collectDescriptorResources();
    return scanSubnets(existingSubnets(occupied), [](const domain::Subnet&) { return true; });
}

domain::Subnet PortAllocator::scanSubnets(
    const std::vector<domain::Subnet>& existing,
    const std::function<bool(const domain::Subnet&)>& claim)
{
    for (const auto* pool : {&PRIMARY_POOL, &FALLBACK_POOL}) {
        for (int attempt = 0; attempt < settings_->getSubnetMaxAttempts(); ++attempt) {
            auto candidate = pool->randomCandidate();
            if (!overlapsAny(candidate, existing) && claim(candidate)) {
                return candidate;
            }
        }
    }

    throw domain::ResourceConflictException("No free subnet found in primary or fallback pool");
}

std::vector<domain::Subnet> PortAllocator::existingSubnets(const Occupied& occupied) {
    std::vector<domain::Subnet> existing = occupied.subnets;

    for (const auto& cidr : runtime_->listNetworkSubnets()) {
        if (auto subnet = domain::Subnet::parse(cidr)) {
            existing.push_back(*subnet);
        }
    }

    auto reserved = ledger_->reservedSubnets();
    existing.insert(existing.end(), reserved.begin(), reserved.end());
    return existing;
}

PortAllocator::Occupied PortAllocator::collectDescriptorResources() {
    Occupied occupied;
    for (const auto& descriptor : descriptors_->loadAll()) {
        if (descriptor.allocation.backendPort > 0) {
            occupied.ports.insert(descriptor.allocation.backendPort);
        }
        if (descriptor.allocation.frontendPort > 0) {
            occupied.ports.insert(descriptor.allocation.frontendPort);
        }
        if (auto subnet = domain::Subnet::parse(descriptor.allocation.subnet)) {
            occupied.subnets.push_back(*subnet);
        }
    }
    return occupied;
}

// ============================================================================
// АЛЛОКАЦИЯ
// ============================================================================

domain::ResourceAllocation PortAllocator::allocate(const std::string& sessionId) {
    auto occupied = collectDescriptorResources();

    try {
        domain::ResourceAllocation allocation;
        allocation.sessionId = sessionId;
        auto reservePort = [this, &sessionId](int port) { return ledger_->reservePort(port, sessionId); };
        allocation.backendPort = scanPorts(settings_->getBackendPortBase(), 1, occupied.ports, reservePort).front();
        allocation.frontendPort = scanPorts(settings_->getFrontendPortBase(), 1, occupied.ports, reservePort).front();
        allocation.subnet = scanSubnets(existingSubnets(occupied), [this, &sessionId](const domain::Subnet& subnet) {
            return ledger_->reserveSubnet(subnet, sessionId);
        }).toString();
        allocation.containerName = settings_->getContainerPrefix() + "_" + sessionId;

        std::cout << "[PortAllocator] " << sessionId << ": backend " << allocation.backendPort
                  << ", frontend " << allocation.frontendPort
                  << ", subnet " << allocation.subnet << std::endl;
        return allocation;
    } catch (const domain::ResourceConflictException&) {
        ledger_->release(sessionId);
        throw;
    }
}

} // namespace sandbox::application
