#pragma once

#include <string>
#include <vector>

namespace sandbox::domain {

/**
 * @brief Итог очистки одной сессии
 *
 * Все шаги выполняются независимо друг от друга, ошибки собираются в errors.
 */
struct CleanupReport {
    std::string sessionId;
    bool runtimeStopped = false;
    bool descriptorRemoved = false;
    int containersRemoved = 0;
    bool dryRun = false;
    std::vector<std::string> errors;

    bool success() const { return errors.empty(); }
};

/**
 * @brief Итог пакетной очистки (expired / all)
 */
struct CleanupSummary {
    bool confirmed = true;
    bool dryRun = false;
    size_t processed = 0;
    size_t cleaned = 0;
    size_t failed = 0;
    int orphanContainersRemoved = 0;
    std::vector<CleanupReport> reports;
};

} // namespace sandbox::domain
