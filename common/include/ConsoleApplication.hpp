#pragma once

#include <atomic>
#include <string>
#include <vector>

/**
 * @file ConsoleApplication.hpp
 * @brief Базовый класс консольного приложения (Template Method)
 *
 * run() вызывает по порядку:
 * 1. loadEnvironment(argc, argv): разбор аргументов
 * 2. configureInjection(): сборка графа зависимостей (Boost.DI)
 * 3. start(): основная работа, возвращает exit code
 *
 * stop() выставляет флаг, который долгоживущие приложения проверяют
 * в своём цикле (graceful shutdown по SIGINT/SIGTERM).
 */
class ConsoleApplication {
public:
    virtual ~ConsoleApplication() = default;

    /**
     * @brief Запустить приложение
     * @return Код возврата процесса
     */
    int run(int argc, char* argv[]);

    /**
     * @brief Попросить приложение завершиться
     */
    virtual void stop();

    bool isStopRequested() const { return stopRequested_.load(); }

protected:
    virtual void loadEnvironment(int argc, char* argv[]);
    virtual void configureInjection() = 0;
    virtual int start() = 0;

    const std::vector<std::string>& args() const { return args_; }

private:
    std::vector<std::string> args_;
    std::atomic<bool> stopRequested_{false};
};
