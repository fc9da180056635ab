#include "apps/CtlApp.hpp"
#include <iostream>

int main(int argc, char* argv[])
{
    try
    {
        sandbox::apps::CtlApp app;
        return app.run(argc, argv);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
