#include "ConsoleApplication.hpp"

int ConsoleApplication::run(int argc, char* argv[]) {
    loadEnvironment(argc, argv);
    configureInjection();
    return start();
}

void ConsoleApplication::stop() {
    stopRequested_.store(true);
}

void ConsoleApplication::loadEnvironment(int argc, char* argv[]) {
    args_.clear();
    for (int i = 1; i < argc; ++i) {
        args_.emplace_back(argv[i]);
    }
}
