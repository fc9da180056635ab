#pragma once

#include "apps/ToolApplication.hpp"
#include "adapters/primary/cli/CleanupCommandHandler.hpp"

namespace sandbox::apps {

/**
 * @brief sandbox-cleanup: очистка истёкших и выбранных сессий
 */
class CleanupApp : public ToolApplication {
protected:
    void configureInjection() override;

    std::set<std::string> valueOptions() const override;

    std::string usage() const override;

    std::shared_ptr<adapters::primary::ICommandHandler> handler() override { return handler_; }

private:
    std::shared_ptr<adapters::primary::CleanupCommandHandler> handler_;
};

} // namespace sandbox::apps
