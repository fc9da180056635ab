#include "adapters/primary/cli/ProvisionCommandHandler.hpp"
#include "adapters/primary/cli/ConsolePresenter.hpp"

namespace sandbox::adapters::primary {

std::string ProvisionCommandHandler::usage() {
    return "Usage: sandbox-provision [--count N] [--start] [--json]\n"
           "\n"
           "  --count N   Number of sessions to create (default 1)\n"
           "  --start     Start the runtime pair of each session\n"
           "  --json      Print credentials as JSON\n";
}

int ProvisionCommandHandler::handle(const CommandLine& commandLine, std::ostream& out, std::ostream& err) {
    if (commandLine.hasFlag("help")) {
        out << usage();
        return 0;
    }

    int count = commandLine.intOption("count").value_or(1);
    if (count <= 0) {
        err << "--count must be positive\n";
        return 1;
    }
    bool startRuntime = commandLine.hasFlag("start");

    auto results = provisioner_->provisionBatch(count, startRuntime);

    size_t failed = 0;
    nlohmann::json json = nlohmann::json::array();
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& result = results[i];
        if (!result.success) {
            ++failed;
            err << "Session " << (i + 1) << "/" << results.size() << ": "
                << ConsolePresenter::renderProvisioned(result);
            continue;
        }

        if (commandLine.hasFlag("json")) {
            json.push_back({
                {"session_id", result.credentials.sessionId},
                {"username", result.credentials.username},
                {"password", result.credentials.password},
                {"expires_at", result.expiresAt.toString()},
                {"backend_port", result.allocation.backendPort},
                {"frontend_port", result.allocation.frontendPort},
                {"subnet", result.allocation.subnet},
                {"runtime_started", result.runtimeStarted}
            });
        } else {
            out << "=== Session " << (i + 1) << "/" << results.size() << " ===\n"
                << ConsolePresenter::renderProvisioned(result) << "\n";
        }
    }

    if (commandLine.hasFlag("json")) {
        out << json.dump(2) << "\n";
    } else {
        out << "Created " << (results.size() - failed) << " of " << results.size() << " session(s)\n";
    }

    return failed == 0 ? 0 : 1;
}

} // namespace sandbox::adapters::primary
