#include "apps/ServiceApp.hpp"
#include <iostream>
#include <csignal>

// Глобальный указатель для обработки сигналов
sandbox::apps::ServiceApp* g_app = nullptr;

void signalHandler(int signal)
{
    std::cout << "\n[main] Received signal " << signal << std::endl;
    if (g_app)
    {
        g_app->stop();
    }
}

int main(int argc, char* argv[])
{
    try
    {
        sandbox::apps::ServiceApp app;
        g_app = &app;

        // Graceful shutdown
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Sandbox Session Service Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << std::endl;

        int code = app.run(argc, argv);
        g_app = nullptr;

        std::cout << "\n========================================" << std::endl;
        std::cout << "  Sandbox Session Service Stopped" << std::endl;
        std::cout << "========================================" << std::endl;

        return code;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
