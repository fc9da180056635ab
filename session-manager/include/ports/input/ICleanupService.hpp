#pragma once

#include "domain/CleanupReport.hpp"
#include "domain/SessionListing.hpp"
#include <string>

namespace sandbox::ports::input {

/**
 * @brief Сверка дескрипторов с реальными контейнерами и очистка
 */
class ICleanupService {
public:
    virtual ~ICleanupService() = default;

    virtual domain::CleanupSummary cleanupExpired(bool dryRun) = 0;

    /**
     * @brief Полная очистка одной сессии
     *
     * Каждый шаг выполняется, даже если предыдущий не удался.
     */
    virtual domain::CleanupReport cleanupSession(const std::string& sessionId, bool dryRun) = 0;

    /**
     * @brief Удалить все сессии и все контейнеры с префиксом
     * @param confirmed Без подтверждения ничего не делается
     */
    virtual domain::CleanupSummary cleanupAll(bool confirmed, bool dryRun) = 0;

    /**
     * @brief Снимок состояния (только чтение)
     */
    virtual domain::SessionListing list() = 0;
};

} // namespace sandbox::ports::input
