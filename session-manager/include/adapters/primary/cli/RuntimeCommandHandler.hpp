#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/input/IRuntimeManager.hpp"
#include <memory>

namespace sandbox::adapters::primary {

/**
 * @brief sandbox-ctl: start|stop|restart|extend|health|logs <session_id>
 *
 * extend <session_id> <hours> [--request-id ID]
 * logs <session_id> [--service backend|frontend]
 * health <session_id> [--json]
 */
class RuntimeCommandHandler : public ICommandHandler {
public:
    explicit RuntimeCommandHandler(std::shared_ptr<ports::input::IRuntimeManager> runtime)
        : runtime_(std::move(runtime))
    {}

    int handle(const CommandLine& commandLine, std::ostream& out, std::ostream& err) override;

    static std::string usage();

private:
    std::shared_ptr<ports::input::IRuntimeManager> runtime_;

    int report(const domain::OperationResult& result, const std::string& action,
               const std::string& sessionId, std::ostream& out, std::ostream& err);

    int handleExtend(const CommandLine& commandLine, const std::string& sessionId,
                     std::ostream& out, std::ostream& err);

    int handleHealth(const CommandLine& commandLine, const std::string& sessionId,
                     std::ostream& out, std::ostream& err);

    int handleLogs(const CommandLine& commandLine, const std::string& sessionId,
                   std::ostream& out, std::ostream& err);
};

} // namespace sandbox::adapters::primary
