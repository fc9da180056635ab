#pragma once

#include "application/AllocationLedger.hpp"
#include "application/CredentialProvisioner.hpp"
#include "application/PortAllocator.hpp"
#include "ports/input/IRuntimeManager.hpp"
#include "ports/input/ISessionProvisioner.hpp"
#include "ports/output/IDescriptorStore.hpp"
#include "ports/output/ISessionRegistry.hpp"
#include "settings/RuntimeSettings.hpp"
#include <memory>

namespace sandbox::application {

/**
 * @brief Создание сессии целиком
 *
 * 1. Учётные данные (CredentialProvisioner)
 * 2. Регистрация в реестре
 * 3. Порты и подсеть (PortAllocator)
 * 4. session.json и .env
 * 5. Опционально запуск runtime-пары
 *
 * Конфликт ресурсов при запуске повторяется с новой аллокацией
 * до PROVISION_MAX_ATTEMPTS раз. Если сессию создать не удалось,
 * всё сделанное для неё откатывается.
 */
class SessionProvisioner : public ports::input::ISessionProvisioner {
public:
    SessionProvisioner(
        std::shared_ptr<CredentialProvisioner> credentials,
        std::shared_ptr<ports::output::ISessionRegistry> registry,
        std::shared_ptr<PortAllocator> allocator,
        std::shared_ptr<AllocationLedger> ledger,
        std::shared_ptr<ports::output::IDescriptorStore> descriptors,
        std::shared_ptr<ports::input::IRuntimeManager> runtime,
        std::shared_ptr<settings::RuntimeSettings> settings
    );

    ports::input::ProvisionResult provision(bool startRuntime) override;

    std::vector<ports::input::ProvisionResult> provisionBatch(int count, bool startRuntime) override;

private:
    std::shared_ptr<CredentialProvisioner> credentials_;
    std::shared_ptr<ports::output::ISessionRegistry> registry_;
    std::shared_ptr<PortAllocator> allocator_;
    std::shared_ptr<AllocationLedger> ledger_;
    std::shared_ptr<ports::output::IDescriptorStore> descriptors_;
    std::shared_ptr<ports::input::IRuntimeManager> runtime_;
    std::shared_ptr<settings::RuntimeSettings> settings_;

    void rollback(const std::string& sessionId, bool stopRuntime);

    /**
     * @brief Удалить дескриптор и запись реестра; резервирования снять, только если runtime остановлен
     */
    void discard(const std::string& sessionId, bool runtimeDown);
};

} // namespace sandbox::application
