#include "apps/ToolApplication.hpp"
#include "adapters/primary/cli/CommandLine.hpp"
#include <stdexcept>

namespace sandbox::apps {

ToolApplication::ToolApplication()
    : stdoutBuf_(std::cout.rdbuf())
    , result_(stdoutBuf_)
{
    std::cout.rdbuf(std::cerr.rdbuf());
}

ToolApplication::~ToolApplication() {
    std::cout.flush();
    std::cout.rdbuf(stdoutBuf_);
}

int ToolApplication::start() {
    adapters::primary::CommandLine commandLine;
    try {
        commandLine = adapters::primary::CommandLine::parse(args(), valueOptions());
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage();
        return 1;
    }

    if (commandLine.hasFlag("help")) {
        result_ << usage();
        return 0;
    }

    try {
        int code = handler()->handle(commandLine, result_, std::cerr);
        result_.flush();
        return code;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage();
        return 1;
    }
}

} // namespace sandbox::apps
