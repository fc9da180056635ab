#include "apps/SessionsApp.hpp"
#include "apps/SandboxInjector.hpp"
#include <iostream>

namespace sandbox::apps {

void SessionsApp::configureInjection() {
    auto injector = makeSandboxInjector();
    handler_ = injector.create<std::shared_ptr<adapters::primary::ListingCommandHandler>>();
    handler_->setStopCondition([this]() { return isStopRequested(); });
    std::cout << "[SessionsApp] ✓ ListingCommandHandler ready" << std::endl;
}

std::set<std::string> SessionsApp::valueOptions() const {
    return {"interval"};
}

std::string SessionsApp::usage() const {
    return adapters::primary::ListingCommandHandler::usage();
}

} // namespace sandbox::apps
