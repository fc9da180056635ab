#pragma once

#include "domain/Subnet.hpp"
#include <ThreadSafeMap.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace sandbox::application {

/**
 * @brief Резервирования портов и подсетей внутри процесса
 *
 * Ключи "port:<N>" и "subnet:<CIDR>". tryInsert атомарен, поэтому два
 * конкурентных allocate() в одном процессе никогда не получат один порт.
 * Все кандидаты подсетей выровнены по /24, так что совпадение ключей
 * равносильно пересечению блоков.
 *
 * Между процессами гонка остаётся: её ловит конфликт bind при старте.
 */
class AllocationLedger {
public:
    struct Reservation {
        std::string sessionId;

        explicit Reservation(std::string id = "") : sessionId(std::move(id)) {}
    };

    bool reservePort(int port, const std::string& sessionId) {
        return reservations_.tryInsert(portKey(port), std::make_shared<Reservation>(sessionId));
    }

    bool isPortReserved(int port) const {
        return reservations_.contains(portKey(port));
    }

    bool reserveSubnet(const domain::Subnet& subnet, const std::string& sessionId) {
        return reservations_.tryInsert(subnetKey(subnet), std::make_shared<Reservation>(sessionId));
    }

    std::vector<domain::Subnet> reservedSubnets() const {
        std::vector<domain::Subnet> subnets;
        for (const auto& [key, reservation] : reservations_.getAll()) {
            if (key.rfind(SUBNET_PREFIX, 0) == 0) {
                if (auto subnet = domain::Subnet::parse(key.substr(sizeof(SUBNET_PREFIX) - 1))) {
                    subnets.push_back(*subnet);
                }
            }
        }
        return subnets;
    }

    /**
     * @brief Снять все резервирования сессии
     * @return Количество снятых резервирований
     */
    size_t release(const std::string& sessionId) {
        size_t released = reservations_.removeIf([&sessionId](const std::string&, const Reservation& r) {
            return r.sessionId == sessionId;
        });
        if (released > 0) {
            std::cout << "[AllocationLedger] Released " << released
                      << " reservation(s) of " << sessionId << std::endl;
        }
        return released;
    }

    void clear() {
        reservations_.clear();
    }

    size_t size() const {
        return reservations_.size();
    }

private:
    static constexpr char PORT_PREFIX[] = "port:";
    static constexpr char SUBNET_PREFIX[] = "subnet:";

    ThreadSafeMap<std::string, Reservation> reservations_;

    static std::string portKey(int port) {
        return PORT_PREFIX + std::to_string(port);
    }

    static std::string subnetKey(const domain::Subnet& subnet) {
        return SUBNET_PREFIX + subnet.toString();
    }
};

} // namespace sandbox::application
