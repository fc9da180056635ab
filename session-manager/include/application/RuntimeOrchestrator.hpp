#pragma once

#include "ports/input/IRuntimeManager.hpp"
#include "ports/output/IContainerRuntime.hpp"
#include "ports/output/IDescriptorStore.hpp"
#include "ports/output/IHealthProbe.hpp"
#include "settings/RuntimeSettings.hpp"
#include <functional>
#include <memory>

namespace sandbox::application {

/**
 * @brief Управление runtime-парой по дескриптору сессии
 *
 * Каждая операция находит дескриптор, вызывает движок контейнеров
 * с .env сессии и переводит код возврата в OperationResult.
 * Реестр сессий не трогается: команды движка выполняются без его блокировки.
 */
class RuntimeOrchestrator : public ports::input::IRuntimeManager {
public:
    using Sleeper = std::function<void(std::chrono::seconds)>;

    RuntimeOrchestrator(
        std::shared_ptr<ports::output::IDescriptorStore> descriptors,
        std::shared_ptr<ports::output::IContainerRuntime> runtime,
        std::shared_ptr<ports::output::IHealthProbe> healthProbe,
        std::shared_ptr<settings::RuntimeSettings> settings
    );

    domain::OperationResult start(const std::string& sessionId) override;
    domain::OperationResult stop(const std::string& sessionId) override;
    domain::OperationResult restart(const std::string& sessionId) override;

    domain::OperationResult extendTtl(
        const std::string& sessionId,
        int hours,
        const std::optional<std::string>& requestId
    ) override;

    domain::HealthReport health(const std::string& sessionId) override;

    std::vector<domain::LogOutput> logs(
        const std::string& sessionId,
        const std::optional<domain::RuntimeProcess>& process
    ) override;

    /**
     * @brief Отнести stderr движка к классу ошибки
     *
     * Конфликты bind/пула адресов дают RESOURCE_CONFLICT (можно повторить
     * с новой аллокацией), всё остальное ORCHESTRATION_FAILURE.
     */
    static domain::ErrorKind classifyFailure(const std::string& stderrText);

    /**
     * @brief Подменить паузу между stop и start при restart (для тестов)
     */
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

private:
    std::shared_ptr<ports::output::IDescriptorStore> descriptors_;
    std::shared_ptr<ports::output::IContainerRuntime> runtime_;
    std::shared_ptr<ports::output::IHealthProbe> healthProbe_;
    std::shared_ptr<settings::RuntimeSettings> settings_;
    Sleeper sleeper_;

    domain::ResourceAllocation allocationFor(const std::string& sessionId) const;

    static domain::OperationResult fromCommand(
        const ports::output::CommandResult& result,
        const std::string& successMessage
    );
};

} // namespace sandbox::application
