#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/input/ICleanupService.hpp"
#include <chrono>
#include <functional>
#include <memory>

namespace sandbox::adapters::primary {

/**
 * @brief sandbox-sessions [--json] [--watch [--interval N]] [--containers-only]
 *
 * --watch перерисовывает таблицу каждые N секунд (по умолчанию 10),
 * пока не сработает условие остановки (SIGINT/SIGTERM у приложения).
 */
class ListingCommandHandler : public ICommandHandler {
public:
    using StopCondition = std::function<bool()>;
    using Sleeper = std::function<void(std::chrono::seconds)>;

    static constexpr int DEFAULT_WATCH_INTERVAL_SECONDS = 10;

    explicit ListingCommandHandler(std::shared_ptr<ports::input::ICleanupService> cleanup);

    int handle(const CommandLine& commandLine, std::ostream& out, std::ostream& err) override;

    static std::string usage();

    void setStopCondition(StopCondition stopRequested) { stopRequested_ = std::move(stopRequested); }

    // ========================================================================
    // TEST HELPERS
    // ========================================================================

    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

private:
    std::shared_ptr<ports::input::ICleanupService> cleanup_;
    StopCondition stopRequested_;
    Sleeper sleeper_;

    std::string render(const CommandLine& commandLine);
};

} // namespace sandbox::adapters::primary
