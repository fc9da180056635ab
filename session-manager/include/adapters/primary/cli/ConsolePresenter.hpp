#pragma once

#include "domain/CleanupReport.hpp"
#include "domain/RuntimeHealth.hpp"
#include "domain/SessionListing.hpp"
#include "ports/input/ISessionProvisioner.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sandbox::adapters::primary {

/**
 * @brief Вывод результатов для оператора: таблицы и JSON
 */
class ConsolePresenter {
public:
    // ========================================================================
    // ЛИСТИНГ СЕССИЙ
    // ========================================================================

    static std::string renderListing(const domain::SessionListing& listing);

    /**
     * @brief Только контейнеры (включая сиротские), без сессий
     */
    static std::string renderContainers(const domain::SessionListing& listing);

    static nlohmann::json listingToJson(const domain::SessionListing& listing);

    // ========================================================================
    // RUNTIME
    // ========================================================================

    static std::string renderHealth(const domain::HealthReport& report);

    static std::string renderLogs(const std::vector<domain::LogOutput>& logs);

    // ========================================================================
    // ВЫДАЧА И ОЧИСТКА
    // ========================================================================

    static std::string renderProvisioned(const ports::input::ProvisionResult& result);

    static std::string renderCleanup(const domain::CleanupSummary& summary);

    static std::string renderCleanupReport(const domain::CleanupReport& report);

    /**
     * @brief Выровнять колонки по самой длинной ячейке
     */
    static std::string renderTable(
        const std::vector<std::string>& header,
        const std::vector<std::vector<std::string>>& rows
    );

    /**
     * @brief Первые 12 символов id для таблиц
     */
    static std::string shortId(const std::string& id);
};

} // namespace sandbox::adapters::primary
