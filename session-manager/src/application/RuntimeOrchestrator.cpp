#include "application/RuntimeOrchestrator.hpp"
#include "domain/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <thread>

namespace sandbox::application {

RuntimeOrchestrator::RuntimeOrchestrator(
    std::shared_ptr<ports::output::IDescriptorStore> descriptors,
    std::shared_ptr<ports::output::IContainerRuntime> runtime,
    std::shared_ptr<ports::output::IHealthProbe> healthProbe,
    std::shared_ptr<settings::RuntimeSettings> settings)
    : descriptors_(std::move(descriptors))
    , runtime_(std::move(runtime))
    , healthProbe_(std::move(healthProbe))
    , settings_(std::move(settings))
    , sleeper_([](std::chrono::seconds pause) { std::this_thread::sleep_for(pause); })
{}

domain::ErrorKind RuntimeOrchestrator::classifyFailure(const std::string& stderrText) {
    std::string lowered = stderrText;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const char* conflictMarkers[] = {
        "port is already allocated",
        "address already in use",
        "pool overlaps"
    };
    for (const char* marker : conflictMarkers) {
        if (lowered.find(marker) != std::string::npos) {
            return domain::ErrorKind::RESOURCE_CONFLICT;
        }
    }
    return domain::ErrorKind::ORCHESTRATION_FAILURE;
}

domain::OperationResult RuntimeOrchestrator::fromCommand(
    const ports::output::CommandResult& result,
    const std::string& successMessage)
{
    if (result.ok()) {
        return domain::OperationResult::ok(successMessage);
    }
    std::string reason = result.err.empty() ? result.out : result.err;
    if (reason.empty()) {
        reason = "exit code " + std::to_string(result.exitCode);
    }
    return domain::OperationResult::fail(classifyFailure(reason), reason);
}

domain::ResourceAllocation RuntimeOrchestrator::allocationFor(const std::string& sessionId) const {
    auto descriptor = descriptors_->load(sessionId);
    if (descriptor && !descriptor->allocation.containerName.empty()) {
        return descriptor->allocation;
    }
    domain::ResourceAllocation allocation;
    allocation.sessionId = sessionId;
    allocation.containerName = settings_->getContainerPrefix() + "_" + sessionId;
    return allocation;
}

// ============================================================================
// START / STOP / RESTART
// ============================================================================

domain::OperationResult RuntimeOrchestrator::start(const std::string& sessionId) {
    auto descriptor = descriptors_->load(sessionId);
    if (!descriptor) {
        return domain::OperationResult::fail(domain::ErrorKind::NOT_FOUND,
            "Session descriptor not found: " + sessionId);
    }

    auto envFile = descriptors_->envFilePath(sessionId);
    if (!envFile) {
        return domain::OperationResult::fail(domain::ErrorKind::NOT_FOUND,
            "Environment file not found for session: " + sessionId);
    }

    auto result = fromCommand(runtime_->up(descriptor->allocation, *envFile),
                              "Runtime started for session " + sessionId);
    if (result.success) {
        std::cout << "[RuntimeOrchestrator] Started " << sessionId
                  << " (frontend :" << descriptor->allocation.frontendPort
                  << ", backend :" << descriptor->allocation.backendPort << ")" << std::endl;
    } else {
        std::cerr << "[RuntimeOrchestrator] Start failed for " << sessionId
                  << " (" << domain::toString(result.errorKind) << "): " << result.message << std::endl;
    }
    return result;
}

domain::OperationResult RuntimeOrchestrator::stop(const std::string& sessionId) {
    auto envFile = descriptors_->envFilePath(sessionId);
    auto allocation = allocationFor(sessionId);

    if (envFile) {
        auto result = fromCommand(runtime_->down(allocation, *envFile),
                                  "Runtime stopped for session " + sessionId);
        if (!result.success) {
            std::cerr << "[RuntimeOrchestrator] Stop failed for " << sessionId << ": " << result.message << std::endl;
        }
        return result;
    }

    // Без .env compose не вызвать: гасим контейнеры по именам
    std::cout << "[RuntimeOrchestrator] No env file for " << sessionId
              << ", stopping containers by name" << std::endl;

    // Отсутствующий контейнер уже ничего не держит
    auto isDown = [](const ports::output::CommandResult& result) {
        return result.ok() || result.err.find("No such container") != std::string::npos;
    };

    auto backend = runtime_->stopContainer(allocation.backendContainer());
    auto frontend = runtime_->stopContainer(allocation.frontendContainer());
    if (isDown(backend) && isDown(frontend)) {
        return domain::OperationResult::ok("Containers stopped for session " + sessionId);
    }
    return fromCommand(isDown(backend) ? frontend : backend, "");
}

domain::OperationResult RuntimeOrchestrator::restart(const std::string& sessionId) {
    auto stopped = stop(sessionId);
    if (!stopped.success) {
        return stopped;
    }

    sleeper_(std::chrono::seconds(settings_->getRestartPauseSeconds()));

    auto started = start(sessionId);
    if (started.success) {
        started.message = "Runtime restarted for session " + sessionId;
    }
    return started;
}

// ============================================================================
// EXTEND
// ============================================================================

domain::OperationResult RuntimeOrchestrator::extendTtl(
    const std::string& sessionId,
    int hours,
    const std::optional<std::string>& requestId)
{
    if (hours <= 0) {
        return domain::OperationResult::fail(domain::ErrorKind::INVALID_REQUEST,
            "Extension hours must be positive, got " + std::to_string(hours));
    }

    bool alreadyApplied = false;
    std::optional<domain::SessionDescriptor> descriptor;
    try {
        descriptor = descriptors_->update(sessionId, [&](domain::SessionDescriptor& d) {
            if (requestId && d.hasExtension(*requestId)) {
                alreadyApplied = true;
                return false;
            }
            d.ttlHours += hours;
            d.expiresAt = d.createdAt.addHours(d.ttlHours);
            if (requestId) {
                d.appliedExtensions.push_back(*requestId);
            }
            return true;
        });
    } catch (const std::exception& e) {
        return domain::OperationResult::fail(domain::ErrorKind::ORCHESTRATION_FAILURE,
            std::string("Failed to persist extension: ") + e.what());
    }

    if (!descriptor) {
        return domain::OperationResult::fail(domain::ErrorKind::NOT_FOUND,
            "Session descriptor not found: " + sessionId);
    }

    if (alreadyApplied) {
        return domain::OperationResult::ok(
            "Extension " + *requestId + " already applied; expires at " + descriptor->expiresAt.toString());
    }

    std::cout << "[RuntimeOrchestrator] Extended " << sessionId << " by " << hours
              << "h, new TTL " << descriptor->ttlHours << "h" << std::endl;

    return domain::OperationResult::ok(
        "Session extended by " + std::to_string(hours) + "h; expires at " + descriptor->expiresAt.toString());
}

// ============================================================================
// HEALTH / LOGS
// ============================================================================

domain::HealthReport RuntimeOrchestrator::health(const std::string& sessionId) {
    auto descriptor = descriptors_->load(sessionId);
    if (!descriptor) {
        throw domain::NotFoundException("Session descriptor not found: " + sessionId);
    }

    domain::HealthReport report;
    report.sessionId = sessionId;
    report.checkedAt = domain::Timestamp::now();
    report.backend = runtime_->inspectStatus(descriptor->allocation.backendContainer());
    report.frontend = runtime_->inspectStatus(descriptor->allocation.frontendContainer());

    if (report.backend == domain::ProcessStatus::RUNNING) {
        auto probe = healthProbe_->probe(
            descriptor->allocation.backendPort,
            "/health",
            std::chrono::seconds(settings_->getHealthTimeoutSeconds())
        );
        report.backendReachable = probe.reachable;
        report.probeDetail = probe.detail;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
        descriptor->expiresAt.value - report.checkedAt.value);
    report.expired = remaining.count() <= 0;
    report.ttlStatus = report.expired
        ? "EXPIRED"
        : domain::formatRemaining(remaining) + " remaining";

    domain::HealthSnapshot snapshot;
    snapshot.backend = domain::toString(report.backend);
    snapshot.frontend = domain::toString(report.frontend);
    snapshot.backendReachable = report.backendReachable;
    snapshot.ttlStatus = report.ttlStatus;
    snapshot.checkedAt = report.checkedAt;
    // Пока шла проба, дескриптор мог продлить другой процесс: пишем только lastHealth
    try {
        descriptors_->update(sessionId, [&snapshot](domain::SessionDescriptor& d) {
            d.lastHealth = snapshot;
            return true;
        });
    } catch (const std::exception& e) {
        std::cerr << "[RuntimeOrchestrator] Failed to record health for " << sessionId
                  << ": " << e.what() << std::endl;
    }

    return report;
}

std::vector<domain::LogOutput> RuntimeOrchestrator::logs(
    const std::string& sessionId,
    const std::optional<domain::RuntimeProcess>& process)
{
    auto allocation = allocationFor(sessionId);

    std::vector<domain::RuntimeProcess> selected;
    if (process) {
        selected.push_back(*process);
    } else {
        selected = {domain::RuntimeProcess::BACKEND, domain::RuntimeProcess::FRONTEND};
    }

    std::vector<domain::LogOutput> outputs;
    for (auto p : selected) {
        domain::LogOutput output;
        output.process = p;
        output.containerName = p == domain::RuntimeProcess::BACKEND
            ? allocation.backendContainer()
            : allocation.frontendContainer();

        auto result = runtime_->tailLogs(output.containerName, settings_->getLogTailLines());
        output.success = result.ok();
        // docker logs пишет поток stderr контейнера в свой stderr
        output.content = result.out + result.err;
        if (!output.success) {
            output.content.clear();
            output.error = result.err.empty() ? "exit code " + std::to_string(result.exitCode) : result.err;
        }
        outputs.push_back(output);
    }
    return outputs;
}

} // namespace sandbox::application
