#pragma once

#include <string>
#include <vector>

namespace sandbox::ports::output {

/**
 * @brief Результат внешней команды
 */
struct CommandResult {
    int exitCode = -1;
    std::string out;
    std::string err;

    bool ok() const { return exitCode == 0; }
};

/**
 * @brief Запуск внешних процессов
 *
 * Output Port. Команда выполняется синхронно в вызывающем потоке;
 * успех определяется кодом возврата.
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /**
     * @param argv Исполняемый файл и аргументы (без shell)
     * @param workingDir Рабочий каталог; пустая строка означает текущий
     */
    virtual CommandResult run(const std::vector<std::string>& argv, const std::string& workingDir) = 0;
};

} // namespace sandbox::ports::output
