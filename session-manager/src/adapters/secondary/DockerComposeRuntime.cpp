#include "adapters/secondary/runtime/DockerComposeRuntime.hpp"

#include <iostream>
#include <sstream>

namespace sandbox::adapters::secondary {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        line = trim(line);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

} // namespace

DockerComposeRuntime::DockerComposeRuntime(
    std::shared_ptr<ports::output::ICommandRunner> runner,
    std::shared_ptr<settings::RuntimeSettings> settings)
    : runner_(std::move(runner))
    , settings_(std::move(settings))
{}

// ============================================================================
// RUNTIME-ПАРА
// ============================================================================

std::vector<std::string> DockerComposeRuntime::composeCommand(
    const domain::ResourceAllocation& allocation,
    const std::string& envFile) const
{
    return {
        settings_->getDockerComposeBin(),
        "-f", settings_->getComposeFile(),
        "--env-file", envFile,
        "-p", allocation.containerName
    };
}

ports::output::CommandResult DockerComposeRuntime::up(
    const domain::ResourceAllocation& allocation,
    const std::string& envFile)
{
    auto argv = composeCommand(allocation, envFile);
    argv.push_back("up");
    argv.push_back("-d");

    std::cout << "[DockerComposeRuntime] Starting " << allocation.containerName << std::endl;
    return runner_->run(argv, settings_->getProjectRoot());
}

ports::output::CommandResult DockerComposeRuntime::down(
    const domain::ResourceAllocation& allocation,
    const std::string& envFile)
{
    auto argv = composeCommand(allocation, envFile);
    argv.push_back("down");

    std::cout << "[DockerComposeRuntime] Stopping " << allocation.containerName << std::endl;
    return runner_->run(argv, settings_->getProjectRoot());
}

// ============================================================================
// ОТДЕЛЬНЫЕ КОНТЕЙНЕРЫ
// ============================================================================

ports::output::CommandResult DockerComposeRuntime::docker(const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(settings_->getDockerBin());
    argv.insert(argv.end(), args.begin(), args.end());
    return runner_->run(argv, "");
}

ports::output::CommandResult DockerComposeRuntime::stopContainer(const std::string& name) {
    return docker({"stop", name});
}

ports::output::CommandResult DockerComposeRuntime::removeContainer(const std::string& name) {
    return docker({"rm", "-f", name});
}

domain::ProcessStatus DockerComposeRuntime::inspectStatus(const std::string& name) {
    auto result = docker({"inspect", "--format", "{{.State.Status}}", name});
    if (!result.ok()) {
        if (result.err.find("No such") != std::string::npos) {
            return domain::ProcessStatus::NOT_FOUND;
        }
        std::cerr << "[DockerComposeRuntime] inspect " << name << " failed: " << trim(result.err) << std::endl;
        return domain::ProcessStatus::ERROR;
    }
    return domain::processStatusFromDocker(trim(result.out));
}

ports::output::CommandResult DockerComposeRuntime::tailLogs(const std::string& name, int lines) {
    return docker({"logs", "--tail", std::to_string(lines), name});
}

std::vector<domain::RuntimeContainer> DockerComposeRuntime::listContainers(
    const std::string& prefix,
    bool includeStopped)
{
    std::vector<std::string> args = {"ps"};
    if (includeStopped) {
        args.push_back("-a");
    }
    args.insert(args.end(), {
        "--filter", "name=" + prefix,
        "--format", "{{.Names}}\t{{.ID}}\t{{.Status}}\t{{.Ports}}"
    });

    std::vector<domain::RuntimeContainer> containers;
    auto result = docker(args);
    if (!result.ok()) {
        std::cerr << "[DockerComposeRuntime] docker ps failed: " << trim(result.err) << std::endl;
        return containers;
    }

    for (const auto& line : splitLines(result.out)) {
        std::vector<std::string> fields;
        std::istringstream ss(line);
        std::string field;
        while (std::getline(ss, field, '\t')) {
            fields.push_back(field);
        }
        if (fields.empty()) {
            continue;
        }

        domain::RuntimeContainer container;
        container.name = fields[0];
        // name-фильтр docker ищет подстроку, нам нужен именно префикс
        if (container.name.rfind(prefix, 0) != 0) {
            continue;
        }
        if (fields.size() > 1) container.id = fields[1];
        if (fields.size() > 2) container.status = fields[2];
        if (fields.size() > 3) container.ports = fields[3];
        containers.push_back(container);
    }
    return containers;
}

// ============================================================================
// СЕТИ
// ============================================================================

std::vector<std::string> DockerComposeRuntime::listNetworkSubnets() {
    std::vector<std::string> subnets;

    auto ids = docker({"network", "ls", "-q"});
    if (!ids.ok()) {
        std::cerr << "[DockerComposeRuntime] docker network ls failed: " << trim(ids.err) << std::endl;
        return subnets;
    }

    auto networkIds = splitLines(ids.out);
    if (networkIds.empty()) {
        return subnets;
    }

    std::vector<std::string> args = {"network", "inspect", "--format", "{{range .IPAM.Config}}{{.Subnet}} {{end}}"};
    args.insert(args.end(), networkIds.begin(), networkIds.end());

    auto inspect = docker(args);
    if (!inspect.ok()) {
        std::cerr << "[DockerComposeRuntime] docker network inspect failed: " << trim(inspect.err) << std::endl;
        return subnets;
    }

    std::istringstream ss(inspect.out);
    std::string token;
    while (ss >> token) {
        subnets.push_back(token);
    }
    return subnets;
}

} // namespace sandbox::adapters::secondary
