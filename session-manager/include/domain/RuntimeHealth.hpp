#pragma once

#include "Timestamp.hpp"
#include "enums/ProcessStatus.hpp"
#include "enums/RuntimeProcess.hpp"
#include <optional>
#include <string>

namespace sandbox::domain {

/**
 * @brief Результат проверки здоровья runtime-пары
 *
 * Недостижимость backend это значение поля, а не ошибка.
 * TTL-статус считается по дескриптору независимо от состояния процессов.
 */
struct HealthReport {
    std::string sessionId;
    ProcessStatus backend = ProcessStatus::NOT_FOUND;
    ProcessStatus frontend = ProcessStatus::NOT_FOUND;
    std::optional<bool> backendReachable;   ///< nullopt, если backend не запущен и проба не выполнялась
    std::string probeDetail;                ///< HTTP-статус или причина недостижимости
    bool expired = false;
    std::string ttlStatus;                  ///< "EXPIRED" или "5h 59m remaining"
    Timestamp checkedAt;

    bool isHealthy() const {
        return backend == ProcessStatus::RUNNING
            && frontend == ProcessStatus::RUNNING
            && backendReachable.value_or(false)
            && !expired;
    }
};

/**
 * @brief Хвост логов одного контейнера
 */
struct LogOutput {
    RuntimeProcess process = RuntimeProcess::BACKEND;
    std::string containerName;
    bool success = false;
    std::string content;    ///< Строки лога (stdout и stderr контейнера)
    std::string error;
};

} // namespace sandbox::domain
