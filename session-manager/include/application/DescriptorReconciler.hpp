#pragma once

#include "application/AllocationLedger.hpp"
#include "ports/input/ICleanupService.hpp"
#include "ports/input/IRuntimeManager.hpp"
#include "ports/output/IContainerRuntime.hpp"
#include "ports/output/IDescriptorStore.hpp"
#include "ports/output/IEphemeralStore.hpp"
#include "ports/output/ISessionRegistry.hpp"
#include "settings/RuntimeSettings.hpp"
#include <memory>

namespace sandbox::application {

/**
 * @brief Сверка дескрипторов с контейнерами и очистка сессий
 *
 * Инструментальная форма reconciler: работает по дескрипторам на диске,
 * а не только по реестру процесса. Используется sandbox-cleanup и sandbox-sessions.
 *
 * Очистка сессии:
 * 1. stop runtime-пары через оркестратор
 * 2. удаление каталога дескриптора
 * 3. принудительные stop + rm всех контейнеров, в имени которых есть sessionId
 * 4. удаление из реестра и эфемерного хранилища, снятие резервирований
 *
 * Каждый шаг выполняется, даже если предыдущий не удался; ошибки попадают
 * в лог и в CleanupReport, исключения наружу не выходят.
 */
class DescriptorReconciler : public ports::input::ICleanupService {
public:
    DescriptorReconciler(
        std::shared_ptr<ports::output::IDescriptorStore> descriptors,
        std::shared_ptr<ports::input::IRuntimeManager> orchestrator,
        std::shared_ptr<ports::output::IContainerRuntime> containers,
        std::shared_ptr<ports::output::ISessionRegistry> registry,
        std::shared_ptr<ports::output::IEphemeralStore> store,
        std::shared_ptr<AllocationLedger> ledger,
        std::shared_ptr<settings::RuntimeSettings> settings
    );

    domain::CleanupSummary cleanupExpired(bool dryRun) override;
    domain::CleanupReport cleanupSession(const std::string& sessionId, bool dryRun) override;
    domain::CleanupSummary cleanupAll(bool confirmed, bool dryRun) override;
    domain::SessionListing list() override;

private:
    std::shared_ptr<ports::output::IDescriptorStore> descriptors_;
    std::shared_ptr<ports::input::IRuntimeManager> orchestrator_;
    std::shared_ptr<ports::output::IContainerRuntime> containers_;
    std::shared_ptr<ports::output::ISessionRegistry> registry_;
    std::shared_ptr<ports::output::IEphemeralStore> store_;
    std::shared_ptr<AllocationLedger> ledger_;
    std::shared_ptr<settings::RuntimeSettings> settings_;

    int forceRemoveContainers(
        const std::vector<domain::RuntimeContainer>& targets,
        std::vector<std::string>& errors
    );

    static void accumulate(domain::CleanupSummary& summary, domain::CleanupReport report);
};

} // namespace sandbox::application
