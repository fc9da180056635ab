#include "adapters/primary/cli/CleanupCommandHandler.hpp"
#include "adapters/primary/cli/ConsolePresenter.hpp"
#include <string>

namespace sandbox::adapters::primary {

std::string CleanupCommandHandler::usage() {
    return "Usage: sandbox-cleanup [--session ID | --all | --list] [--dry-run] [--yes]\n"
           "\n"
           "  (default)      Remove expired sessions\n"
           "  --session ID   Remove one session\n"
           "  --all          Remove every session and every sandbox container\n"
           "  --list         Show sessions and containers, change nothing\n"
           "  --dry-run      Report what would be removed\n"
           "  --yes          Do not ask for confirmation with --all\n";
}

int CleanupCommandHandler::handle(const CommandLine& commandLine, std::ostream& out, std::ostream& err) {
    if (commandLine.hasFlag("help")) {
        out << usage();
        return 0;
    }

    bool dryRun = commandLine.hasFlag("dry-run");

    if (commandLine.hasFlag("list")) {
        out << ConsolePresenter::renderListing(cleanup_->list());
        return 0;
    }

    if (auto sessionId = commandLine.option("session")) {
        auto report = cleanup_->cleanupSession(*sessionId, dryRun);
        out << ConsolePresenter::renderCleanupReport(report);
        return report.success() ? 0 : 1;
    }

    domain::CleanupSummary summary;
    if (commandLine.hasFlag("all")) {
        bool confirmed = dryRun || commandLine.hasFlag("yes") || confirmAll(out);
        summary = cleanup_->cleanupAll(confirmed, dryRun);
        if (!summary.confirmed) {
            err << ConsolePresenter::renderCleanup(summary);
            return 1;
        }
    } else {
        summary = cleanup_->cleanupExpired(dryRun);
        if (summary.processed == 0) {
            out << "No expired sessions\n";
            return 0;
        }
    }

    out << ConsolePresenter::renderCleanup(summary);
    return summary.failed == 0 ? 0 : 1;
}

bool CleanupCommandHandler::confirmAll(std::ostream& out) {
    out << "This will remove ALL sessions and ALL sandbox containers. Type 'yes' to continue: ";
    out.flush();

    std::string answer;
    if (!std::getline(*in_, answer)) {
        return false;
    }
    return answer == "yes";
}

} // namespace sandbox::adapters::primary
