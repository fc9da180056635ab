#include "apps/CleanupApp.hpp"
#include "apps/SandboxInjector.hpp"
#include <iostream>

namespace sandbox::apps {

void CleanupApp::configureInjection() {
    auto injector = makeSandboxInjector();

    // Реестр этого процесса пуст: подтягиваем сессии с диска,
    // чтобы очистка видела и реестровые, и дескрипторные истечения
    auto bootstrapper = injector.create<std::shared_ptr<application::SessionBootstrapper>>();
    bootstrapper->importAll();

    handler_ = injector.create<std::shared_ptr<adapters::primary::CleanupCommandHandler>>();
    std::cout << "[CleanupApp] ✓ CleanupCommandHandler ready" << std::endl;
}

std::set<std::string> CleanupApp::valueOptions() const {
    return {"session"};
}

std::string CleanupApp::usage() const {
    return adapters::primary::CleanupCommandHandler::usage();
}

} // namespace sandbox::apps
