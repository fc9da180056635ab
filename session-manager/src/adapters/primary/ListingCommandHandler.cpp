#include "adapters/primary/cli/ListingCommandHandler.hpp"
#include "adapters/primary/cli/ConsolePresenter.hpp"
#include "domain/Timestamp.hpp"
#include <thread>

namespace sandbox::adapters::primary {

ListingCommandHandler::ListingCommandHandler(std::shared_ptr<ports::input::ICleanupService> cleanup)
    : cleanup_(std::move(cleanup))
    , stopRequested_([] { return false; })
    , sleeper_([](std::chrono::seconds pause) { std::this_thread::sleep_for(pause); })
{}

std::string ListingCommandHandler::usage() {
    return "Usage: sandbox-sessions [--json] [--watch [--interval N]] [--containers-only]\n"
           "\n"
           "  --json             Print the listing as JSON\n"
           "  --watch            Refresh the table until interrupted\n"
           "  --interval N       Refresh period in seconds for --watch (default 10)\n"
           "  --containers-only  Show containers only\n";
}

std::string ListingCommandHandler::render(const CommandLine& commandLine) {
    auto listing = cleanup_->list();
    if (commandLine.hasFlag("json")) {
        return ConsolePresenter::listingToJson(listing).dump(2) + "\n";
    }
    if (commandLine.hasFlag("containers-only")) {
        return ConsolePresenter::renderContainers(listing);
    }
    return ConsolePresenter::renderListing(listing);
}

int ListingCommandHandler::handle(const CommandLine& commandLine, std::ostream& out, std::ostream& err) {
    if (commandLine.hasFlag("help")) {
        out << usage();
        return 0;
    }

    if (!commandLine.hasFlag("watch")) {
        out << render(commandLine);
        return 0;
    }

    int interval = commandLine.intOption("interval").value_or(DEFAULT_WATCH_INTERVAL_SECONDS);
    if (interval <= 0) {
        err << "--interval must be positive\n";
        return 1;
    }

    while (!stopRequested_()) {
        // Очистка экрана и курсор в начало
        out << "\033[2J\033[H"
            << "Sandbox sessions at " << domain::Timestamp::now().toDisplayString()
            << " (every " << interval << "s, Ctrl+C to exit)\n\n"
            << render(commandLine);
        out.flush();

        // Спим по секунде, чтобы быстро реагировать на сигнал
        for (int i = 0; i < interval && !stopRequested_(); ++i) {
            sleeper_(std::chrono::seconds(1));
        }
    }
    return 0;
}

} // namespace sandbox::adapters::primary
