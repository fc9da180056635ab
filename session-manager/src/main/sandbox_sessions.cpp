#include "apps/SessionsApp.hpp"
#include <iostream>
#include <csignal>

// Глобальный указатель для остановки --watch по сигналу
sandbox::apps::SessionsApp* g_app = nullptr;

void signalHandler(int /*signal*/)
{
    if (g_app)
    {
        g_app->stop();
    }
}

int main(int argc, char* argv[])
{
    try
    {
        sandbox::apps::SessionsApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        int code = app.run(argc, argv);
        g_app = nullptr;
        return code;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
