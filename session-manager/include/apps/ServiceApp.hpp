#pragma once

#include "ConsoleApplication.hpp"
#include <memory>

namespace sandbox::application {
    class ExpiryReconciler;
    class SessionBootstrapper;
}

namespace sandbox::settings {
    class SessionSettings;
}

namespace sandbox::apps {

/**
 * @class ServiceApp
 * @brief sandbox-service: процесс обслуживающего хоста
 *
 * 1. loadEnvironment(): аргументы командной строки
 * 2. configureInjection(): граф Boost.DI, загрузчик дескрипторов и ExpiryReconciler
 * 3. start(): импорт дескрипторов в реестр, запуск ExpiryReconciler,
 *    ожидание stop() (SIGINT/SIGTERM)
 *
 * Сервисы сессий, чата и документов процесс не держит: они остаются
 * в makeSandboxInjector() для встраивающего кода.
 */
class ServiceApp : public ConsoleApplication {
public:
    ServiceApp();
    ~ServiceApp() override;

protected:
    void configureInjection() override;
    int start() override;

private:
    std::shared_ptr<settings::SessionSettings> settings_;
    std::shared_ptr<application::SessionBootstrapper> bootstrapper_;
    std::shared_ptr<application::ExpiryReconciler> reconciler_;

    void printStartupBanner();
};

} // namespace sandbox::apps
