#pragma once

#include "adapters/primary/cli/CommandLine.hpp"
#include <iostream>

namespace sandbox::adapters::primary {

/**
 * @brief Обработчик команды консольного инструмента
 *
 * Результат печатается в out, диагностика в err.
 * @return Код возврата процесса: 0 успех, 1 ошибка
 */
class ICommandHandler {
public:
    virtual ~ICommandHandler() = default;

    virtual int handle(const CommandLine& commandLine, std::ostream& out, std::ostream& err) = 0;
};

} // namespace sandbox::adapters::primary
