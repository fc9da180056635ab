#include "apps/ProvisionApp.hpp"
#include "apps/SandboxInjector.hpp"
#include <iostream>

namespace sandbox::apps {

void ProvisionApp::configureInjection() {
    auto injector = makeSandboxInjector();
    handler_ = injector.create<std::shared_ptr<adapters::primary::ProvisionCommandHandler>>();
    std::cout << "[ProvisionApp] ✓ ProvisionCommandHandler ready" << std::endl;
}

std::set<std::string> ProvisionApp::valueOptions() const {
    return {"count"};
}

std::string ProvisionApp::usage() const {
    return adapters::primary::ProvisionCommandHandler::usage();
}

} // namespace sandbox::apps
