#include "apps/CtlApp.hpp"
#include "apps/SandboxInjector.hpp"
#include <iostream>

namespace sandbox::apps {

void CtlApp::configureInjection() {
    auto injector = makeSandboxInjector();
    handler_ = injector.create<std::shared_ptr<adapters::primary::RuntimeCommandHandler>>();
    std::cout << "[CtlApp] ✓ RuntimeCommandHandler ready" << std::endl;
}

std::set<std::string> CtlApp::valueOptions() const {
    return {"request-id", "service"};
}

std::string CtlApp::usage() const {
    return adapters::primary::RuntimeCommandHandler::usage();
}

} // namespace sandbox::apps
