#pragma once

#include "domain/OperationResult.hpp"
#include "domain/RuntimeHealth.hpp"
#include "domain/enums/RuntimeProcess.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sandbox::ports::input {

/**
 * @brief Управление runtime-парой сессии
 *
 * Все операции синхронны для вызывающего и не держат блокировку реестра.
 */
class IRuntimeManager {
public:
    virtual ~IRuntimeManager() = default;

    virtual domain::OperationResult start(const std::string& sessionId) = 0;

    virtual domain::OperationResult stop(const std::string& sessionId) = 0;

    /**
     * @brief stop, пауза, start; неуспешный stop прерывает операцию
     */
    virtual domain::OperationResult restart(const std::string& sessionId) = 0;

    /**
     * @brief Продлить TTL сессии
     *
     * @param hours Положительное число часов
     * @param requestId Ключ идемпотентности; повтор с тем же ключом ничего не меняет
     */
    virtual domain::OperationResult extendTtl(
        const std::string& sessionId,
        int hours,
        const std::optional<std::string>& requestId
    ) = 0;

    /**
     * @throws domain::NotFoundException если дескриптора нет
     */
    virtual domain::HealthReport health(const std::string& sessionId) = 0;

    /**
     * @param process nullopt: оба процесса
     */
    virtual std::vector<domain::LogOutput> logs(
        const std::string& sessionId,
        const std::optional<domain::RuntimeProcess>& process
    ) = 0;
};

} // namespace sandbox::ports::input
