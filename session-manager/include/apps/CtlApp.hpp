#pragma once

#include "apps/ToolApplication.hpp"
#include "adapters/primary/cli/RuntimeCommandHandler.hpp"

namespace sandbox::apps {

/**
 * @brief sandbox-ctl: управление runtime-парой одной сессии
 */
class CtlApp : public ToolApplication {
protected:
    void configureInjection() override;

    std::set<std::string> valueOptions() const override;

    std::string usage() const override;

    std::shared_ptr<adapters::primary::ICommandHandler> handler() override { return handler_; }

private:
    std::shared_ptr<adapters::primary::RuntimeCommandHandler> handler_;
};

} // namespace sandbox::apps
