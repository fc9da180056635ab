#pragma once

#include "Timestamp.hpp"
#include "enums/SessionStatus.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace sandbox::domain {

/**
 * @brief Контейнер, как его видит `docker ps`
 */
struct RuntimeContainer {
    std::string name;
    std::string id;
    std::string status;     ///< "Up 2 hours", "Exited (0) 5 minutes ago"
    std::string ports;
};

struct SessionListingEntry {
    std::string sessionId;
    std::string username;
    Timestamp createdAt;
    Timestamp expiresAt;
    std::chrono::seconds remaining{0};
    SessionStatus status = SessionStatus::STOPPED;
    int backendPort = 0;
    int frontendPort = 0;
    std::string subnet;
    std::vector<RuntimeContainer> containers;
};

struct ListingSummary {
    size_t totalSessions = 0;
    size_t running = 0;
    size_t expired = 0;
    size_t active = 0;
    size_t stopped = 0;
    size_t totalContainers = 0;
    size_t orphanedContainers = 0;
};

/**
 * @brief Снимок сессий и контейнеров для инструмента оператора
 */
struct SessionListing {
    std::vector<SessionListingEntry> sessions;
    std::vector<RuntimeContainer> orphans;  ///< Контейнеры с префиксом, но без известной сессии
    ListingSummary summary;
};

} // namespace sandbox::domain
