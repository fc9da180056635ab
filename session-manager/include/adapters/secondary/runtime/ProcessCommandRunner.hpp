#pragma once

#include "ports/output/ICommandRunner.hpp"

namespace sandbox::adapters::secondary {

/**
 * @brief Запуск внешних команд через Boost.Process
 *
 * stdout и stderr читаются асинхронно, чтобы заполненный pipe
 * одного потока не блокировал дочерний процесс.
 * Если исполняемый файл не найден, возвращается код 127 и причина в err.
 */
class ProcessCommandRunner : public ports::output::ICommandRunner {
public:
    ProcessCommandRunner() = default;

    ports::output::CommandResult run(
        const std::vector<std::string>& argv,
        const std::string& workingDir
    ) override;
};

} // namespace sandbox::adapters::secondary
