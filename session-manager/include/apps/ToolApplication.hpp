#pragma once

#include "ConsoleApplication.hpp"
#include "adapters/primary/cli/ICommandHandler.hpp"
#include <iostream>
#include <memory>
#include <set>
#include <string>

namespace sandbox::apps {

/**
 * @brief Базовый класс инструментов оператора
 *
 * Результат команды идёт в stdout, всё остальное (логи компонентов,
 * диагностика) в stderr: на время работы std::cout перенаправлен в std::cerr,
 * чтобы вывод --json оставался разбираемым.
 */
class ToolApplication : public ConsoleApplication {
public:
    ToolApplication();
    ~ToolApplication() override;

    ToolApplication(const ToolApplication&) = delete;
    ToolApplication& operator=(const ToolApplication&) = delete;

protected:
    /**
     * @brief Опции, за которыми следует значение ("--count 3")
     */
    virtual std::set<std::string> valueOptions() const = 0;

    virtual std::string usage() const = 0;

    /**
     * @brief Обработчик, собранный в configureInjection()
     */
    virtual std::shared_ptr<adapters::primary::ICommandHandler> handler() = 0;

    int start() override;

private:
    std::streambuf* stdoutBuf_;
    std::ostream result_;
};

} // namespace sandbox::apps
