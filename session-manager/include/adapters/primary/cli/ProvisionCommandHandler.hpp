#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/input/ISessionProvisioner.hpp"
#include <memory>

namespace sandbox::adapters::primary {

/**
 * @brief sandbox-provision [--count N] [--start] [--json]
 *
 * Пароль печатается один раз и нигде больше не хранится.
 */
class ProvisionCommandHandler : public ICommandHandler {
public:
    explicit ProvisionCommandHandler(std::shared_ptr<ports::input::ISessionProvisioner> provisioner)
        : provisioner_(std::move(provisioner))
    {}

    int handle(const CommandLine& commandLine, std::ostream& out, std::ostream& err) override;

    static std::string usage();

private:
    std::shared_ptr<ports::input::ISessionProvisioner> provisioner_;
};

} // namespace sandbox::adapters::primary
