#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/input/ICleanupService.hpp"
#include <iostream>
#include <memory>

namespace sandbox::adapters::primary {

/**
 * @brief sandbox-cleanup
 *
 * Без аргументов очищает истёкшие сессии.
 * --session ID   одна сессия
 * --all          все сессии и контейнеры (спрашивает подтверждение, --yes пропускает вопрос)
 * --dry-run      только показать, что будет удалено
 * --list         листинг без изменений
 */
class CleanupCommandHandler : public ICommandHandler {
public:
    explicit CleanupCommandHandler(std::shared_ptr<ports::input::ICleanupService> cleanup)
        : cleanup_(std::move(cleanup))
        , in_(&std::cin)
    {}

    int handle(const CommandLine& commandLine, std::ostream& out, std::ostream& err) override;

    static std::string usage();

    // ========================================================================
    // TEST HELPERS
    // ========================================================================

    void setInput(std::istream& in) { in_ = &in; }

private:
    std::shared_ptr<ports::input::ICleanupService> cleanup_;
    std::istream* in_;

    bool confirmAll(std::ostream& out);
};

} // namespace sandbox::adapters::primary
