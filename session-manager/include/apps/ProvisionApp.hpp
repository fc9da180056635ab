#pragma once

#include "apps/ToolApplication.hpp"
#include "adapters/primary/cli/ProvisionCommandHandler.hpp"

namespace sandbox::apps {

/**
 * @brief sandbox-provision: выдача новых сессий
 */
class ProvisionApp : public ToolApplication {
protected:
    void configureInjection() override;

    std::set<std::string> valueOptions() const override;

    std::string usage() const override;

    std::shared_ptr<adapters::primary::ICommandHandler> handler() override { return handler_; }

private:
    std::shared_ptr<adapters::primary::ProvisionCommandHandler> handler_;
};

} // namespace sandbox::apps
