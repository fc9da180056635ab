#include "adapters/primary/cli/RuntimeCommandHandler.hpp"
#include "adapters/primary/cli/ConsolePresenter.hpp"
#include "domain/Errors.hpp"

namespace sandbox::adapters::primary {

std::string RuntimeCommandHandler::usage() {
    return "Usage: sandbox-ctl <command> <session_id> [options]\n"
           "\n"
           "Commands:\n"
           "  start <session_id>                          Start the runtime pair\n"
           "  stop <session_id>                           Stop the runtime pair\n"
           "  restart <session_id>                        Stop, pause, start\n"
           "  extend <session_id> <hours> [--request-id ID]  Extend the session TTL\n"
           "  health <session_id> [--json]                Show process status and TTL\n"
           "  logs <session_id> [--service backend|frontend]  Show recent log lines\n";
}

int RuntimeCommandHandler::handle(const CommandLine& commandLine, std::ostream& out, std::ostream& err) {
    auto command = commandLine.positional(0);
    auto sessionId = commandLine.positional(1);
    if (!command || !sessionId) {
        err << usage();
        return 1;
    }

    try {
        if (*command == "start") {
            return report(runtime_->start(*sessionId), "started", *sessionId, out, err);
        }
        if (*command == "stop") {
            return report(runtime_->stop(*sessionId), "stopped", *sessionId, out, err);
        }
        if (*command == "restart") {
            return report(runtime_->restart(*sessionId), "restarted", *sessionId, out, err);
        }
        if (*command == "extend") {
            return handleExtend(commandLine, *sessionId, out, err);
        }
        if (*command == "health") {
            return handleHealth(commandLine, *sessionId, out, err);
        }
        if (*command == "logs") {
            return handleLogs(commandLine, *sessionId, out, err);
        }
    } catch (const domain::SandboxException& e) {
        err << "Error [" << domain::toString(e.kind()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }

    err << "Unknown command: " << *command << "\n\n" << usage();
    return 1;
}

int RuntimeCommandHandler::report(const domain::OperationResult& result, const std::string& action,
                                  const std::string& sessionId, std::ostream& out, std::ostream& err) {
    if (!result.success) {
        err << "Error [" << domain::toString(result.errorKind) << "]: " << result.message << "\n";
        return 1;
    }
    out << "Session " << sessionId << " " << action;
    if (!result.message.empty()) {
        out << ": " << result.message;
    }
    out << "\n";
    return 0;
}

int RuntimeCommandHandler::handleExtend(const CommandLine& commandLine, const std::string& sessionId,
                                        std::ostream& out, std::ostream& err) {
    auto hoursArg = commandLine.positional(2);
    if (!hoursArg) {
        err << "extend requires an hour count\n\n" << usage();
        return 1;
    }
    int hours = CommandLine::toInt(*hoursArg, "hours");
    return report(runtime_->extendTtl(sessionId, hours, commandLine.option("request-id")),
                  "extended", sessionId, out, err);
}

int RuntimeCommandHandler::handleHealth(const CommandLine& commandLine, const std::string& sessionId,
                                        std::ostream& out, std::ostream& /*err*/) {
    auto report = runtime_->health(sessionId);

    if (commandLine.hasFlag("json")) {
        nlohmann::json j = {
            {"session_id", report.sessionId},
            {"backend", domain::toString(report.backend)},
            {"frontend", domain::toString(report.frontend)},
            {"ttl_status", report.ttlStatus},
            {"expired", report.expired},
            {"checked_at", report.checkedAt.toString()},
            {"healthy", report.isHealthy()}
        };
        j["backend_reachable"] = report.backendReachable.has_value()
            ? nlohmann::json(*report.backendReachable) : nlohmann::json(nullptr);
        out << j.dump(2) << "\n";
    } else {
        out << ConsolePresenter::renderHealth(report);
    }
    return 0;
}

int RuntimeCommandHandler::handleLogs(const CommandLine& commandLine, const std::string& sessionId,
                                      std::ostream& out, std::ostream& err) {
    std::optional<domain::RuntimeProcess> process;
    if (auto service = commandLine.option("service")) {
        process = domain::runtimeProcessFromString(*service);
        if (!process) {
            err << "Unknown service '" << *service << "', expected backend or frontend\n";
            return 1;
        }
    }

    auto logs = runtime_->logs(sessionId, process);
    out << ConsolePresenter::renderLogs(logs);

    for (const auto& log : logs) {
        if (!log.success) {
            err << "Failed to read logs of " << log.containerName << ": " << log.error << "\n";
            return 1;
        }
    }
    return 0;
}

} // namespace sandbox::adapters::primary
