#pragma once

#include <boost/di.hpp>

// Settings
#include "settings/DocumentSettings.hpp"
#include "settings/LlmSettings.hpp"
#include "settings/RuntimeSettings.hpp"
#include "settings/SessionSettings.hpp"

// Application Services
#include "application/AllocationLedger.hpp"
#include "application/ChatService.hpp"
#include "application/CredentialProvisioner.hpp"
#include "application/DescriptorReconciler.hpp"
#include "application/DocumentService.hpp"
#include "application/ExpiryReconciler.hpp"
#include "application/PortAllocator.hpp"
#include "application/RuntimeOrchestrator.hpp"
#include "application/SessionBootstrapper.hpp"
#include "application/SessionProvisioner.hpp"
#include "application/SessionService.hpp"

// Secondary Adapters
#include "adapters/secondary/auth/FakeJwtAdapter.hpp"
#include "adapters/secondary/auth/SodiumPasswordHasher.hpp"
#include "adapters/secondary/document/PlainTextExtractor.hpp"
#include "adapters/secondary/llm/OllamaLlmClient.hpp"
#include "adapters/secondary/network/AsioPortProbe.hpp"
#include "adapters/secondary/network/BeastHttpClient.hpp"
#include "adapters/secondary/network/HttpHealthProbe.hpp"
#include "adapters/secondary/persistence/FileDescriptorStore.hpp"
#include "adapters/secondary/persistence/InMemoryEphemeralStore.hpp"
#include "adapters/secondary/persistence/InMemorySessionRegistry.hpp"
#include "adapters/secondary/runtime/DockerComposeRuntime.hpp"
#include "adapters/secondary/runtime/ProcessCommandRunner.hpp"

namespace sandbox::apps {

/**
 * @brief Общий граф зависимостей для всех исполняемых файлов
 *
 * Boost.DI создаёт объекты лениво: инструмент, которому нужен только
 * IRuntimeManager, не поднимает LLM-клиент и хранилище разговоров.
 * Все stateful объекты живут в singleton scope инжектора.
 */
inline auto makeSandboxInjector() {
    namespace di = boost::di;
    using namespace sandbox;

    return di::make_injector(

        // ====================================================================
        // Layer 0: Settings (переменные окружения)
        // ====================================================================

        di::bind<settings::SessionSettings>().in(di::singleton),
        di::bind<settings::RuntimeSettings>().in(di::singleton),
        di::bind<settings::LlmSettings>().in(di::singleton),
        di::bind<settings::DocumentSettings>().in(di::singleton),

        // ====================================================================
        // Layer 1: Secondary Adapters (Output Ports implementations)
        // ====================================================================

        di::bind<ports::output::ISessionRegistry>()
            .to<adapters::secondary::InMemorySessionRegistry>()
            .in(di::singleton),

        di::bind<ports::output::IEphemeralStore>()
            .to<adapters::secondary::InMemoryEphemeralStore>()
            .in(di::singleton),

        di::bind<ports::output::IDescriptorStore>()
            .to<adapters::secondary::FileDescriptorStore>()
            .in(di::singleton),

        di::bind<ports::output::ICommandRunner>()
            .to<adapters::secondary::ProcessCommandRunner>()
            .in(di::singleton),

        di::bind<ports::output::IContainerRuntime>()
            .to<adapters::secondary::DockerComposeRuntime>()
            .in(di::singleton),

        di::bind<ports::output::IPortProbe>()
            .to<adapters::secondary::AsioPortProbe>()
            .in(di::singleton),

        di::bind<ports::output::IHttpClient>()
            .to<adapters::secondary::BeastHttpClient>()
            .in(di::singleton),

        di::bind<ports::output::IHealthProbe>()
            .to<adapters::secondary::HttpHealthProbe>()
            .in(di::singleton),

        di::bind<ports::output::ITokenProvider>()
            .to<adapters::secondary::FakeJwtAdapter>()
            .in(di::singleton),

        di::bind<ports::output::IPasswordHasher>()
            .to<adapters::secondary::SodiumPasswordHasher>()
            .in(di::singleton),

        di::bind<ports::output::ILlmClient>()
            .to<adapters::secondary::OllamaLlmClient>()
            .in(di::singleton),

        di::bind<ports::output::IDocumentExtractor>()
            .to<adapters::secondary::PlainTextExtractor>()
            .in(di::singleton),

        // ====================================================================
        // Layer 2: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<application::AllocationLedger>().in(di::singleton),
        di::bind<application::CredentialProvisioner>().in(di::singleton),
        di::bind<application::PortAllocator>().in(di::singleton),

        di::bind<ports::input::IRuntimeManager>()
            .to<application::RuntimeOrchestrator>()
            .in(di::singleton),

        di::bind<ports::input::ISessionProvisioner>()
            .to<application::SessionProvisioner>()
            .in(di::singleton),

        di::bind<ports::input::ICleanupService>()
            .to<application::DescriptorReconciler>()
            .in(di::singleton),

        di::bind<ports::input::ISessionService>()
            .to<application::SessionService>()
            .in(di::singleton),

        di::bind<ports::input::IChatService>()
            .to<application::ChatService>()
            .in(di::singleton),

        di::bind<ports::input::IDocumentService>()
            .to<application::DocumentService>()
            .in(di::singleton)
    );
}

} // namespace sandbox::apps
