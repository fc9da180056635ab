#include "adapters/secondary/runtime/ProcessCommandRunner.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/filesystem.hpp>
#include <boost/process.hpp>

#include <future>
#include <iostream>

namespace sandbox::adapters::secondary {

namespace bp = boost::process;

ports::output::CommandResult ProcessCommandRunner::run(
    const std::vector<std::string>& argv,
    const std::string& workingDir)
{
    ports::output::CommandResult result;
    if (argv.empty()) {
        result.exitCode = 127;
        result.err = "empty command";
        return result;
    }

    boost::filesystem::path executable = argv[0];
    if (executable.is_relative() && !executable.has_parent_path()) {
        executable = bp::search_path(argv[0]);
    }
    if (executable.empty()) {
        result.exitCode = 127;
        result.err = argv[0] + ": command not found";
        return result;
    }

    std::vector<std::string> args(argv.begin() + 1, argv.end());
    boost::filesystem::path startDir = workingDir.empty()
        ? boost::filesystem::current_path()
        : boost::filesystem::path(workingDir);

    try {
        boost::asio::io_context ios;
        std::future<std::string> out;
        std::future<std::string> err;

        bp::child child(
            executable,
            bp::args(args),
            bp::start_dir(startDir),
            bp::std_in.close(),
            bp::std_out > out,
            bp::std_err > err,
            ios
        );

        ios.run();
        child.wait();

        result.exitCode = child.exit_code();
        result.out = out.get();
        result.err = err.get();
    } catch (const bp::process_error& e) {
        std::cerr << "[ProcessCommandRunner] Failed to run " << argv[0] << ": " << e.what() << std::endl;
        result.exitCode = 127;
        result.err = e.what();
    }

    return result;
}

} // namespace sandbox::adapters::secondary
