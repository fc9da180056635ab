#pragma once

#include "apps/ToolApplication.hpp"
#include "adapters/primary/cli/ListingCommandHandler.hpp"

namespace sandbox::apps {

/**
 * @brief sandbox-sessions: листинг сессий и контейнеров
 */
class SessionsApp : public ToolApplication {
protected:
    void configureInjection() override;

    std::set<std::string> valueOptions() const override;

    std::string usage() const override;

    std::shared_ptr<adapters::primary::ICommandHandler> handler() override { return handler_; }

private:
    std::shared_ptr<adapters::primary::ListingCommandHandler> handler_;
};

} // namespace sandbox::apps
