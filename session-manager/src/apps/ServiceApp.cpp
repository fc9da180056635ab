#include "apps/ServiceApp.hpp"
#include "apps/SandboxInjector.hpp"

#include <chrono>
#include <iostream>
#include <thread>

namespace sandbox::apps {

ServiceApp::ServiceApp() {
    std::cout << "[ServiceApp] Application created" << std::endl;
}

ServiceApp::~ServiceApp() {
    if (reconciler_) {
        reconciler_->stop();
    }
    std::cout << "[ServiceApp] Application destroyed" << std::endl;
}

void ServiceApp::configureInjection() {
    printStartupBanner();

    std::cout << "[ServiceApp] Configuring Boost.DI injection..." << std::endl;

    auto injector = makeSandboxInjector();

    settings_ = injector.create<std::shared_ptr<settings::SessionSettings>>();
    bootstrapper_ = injector.create<std::shared_ptr<application::SessionBootstrapper>>();
    reconciler_ = injector.create<std::shared_ptr<application::ExpiryReconciler>>();

    std::cout << "\n📦 Boost.DI Injector configured:" << std::endl;
    std::cout << "  ✓ SessionBootstrapper" << std::endl;
    std::cout << "  ✓ ExpiryReconciler" << std::endl;
}

int ServiceApp::start() {
    size_t imported = bootstrapper_->importAll();
    std::cout << "[ServiceApp] " << imported << " session(s) loaded from "
              << settings_->getSessionsDir() << std::endl;

    reconciler_->start(std::chrono::seconds(settings_->getReconcileIntervalSeconds()));

    while (!isStopRequested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[ServiceApp] Shutting down..." << std::endl;
    reconciler_->stop();
    std::cout << "[ServiceApp] Sweeps performed: " << reconciler_->sweepCount() << std::endl;
    return 0;
}

void ServiceApp::printStartupBanner() {
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║       Research Sandbox Session Manager               ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  Runtime:      docker compose per session            ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}

} // namespace sandbox::apps
