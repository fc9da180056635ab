#include "application/DescriptorReconciler.hpp"

#include <algorithm>
#include <iostream>
#include <set>

namespace sandbox::application {

DescriptorReconciler::DescriptorReconciler(
    std::shared_ptr<ports::output::IDescriptorStore> descriptors,
    std::shared_ptr<ports::input::IRuntimeManager> orchestrator,
    std::shared_ptr<ports::output::IContainerRuntime> containers,
    std::shared_ptr<ports::output::ISessionRegistry> registry,
    std::shared_ptr<ports::output::IEphemeralStore> store,
    std::shared_ptr<AllocationLedger> ledger,
    std::shared_ptr<settings::RuntimeSettings> settings)
    : descriptors_(std::move(descriptors))
    , orchestrator_(std::move(orchestrator))
    , containers_(std::move(containers))
    , registry_(std::move(registry))
    , store_(std::move(store))
    , ledger_(std::move(ledger))
    , settings_(std::move(settings))
{}

// ============================================================================
// ОЧИСТКА ОДНОЙ СЕССИИ
// ============================================================================

domain::CleanupReport DescriptorReconciler::cleanupSession(const std::string& sessionId, bool dryRun) {
    domain::CleanupReport report;
    report.sessionId = sessionId;
    report.dryRun = dryRun;

    if (dryRun) {
        std::cout << "[DescriptorReconciler] [dry-run] Would stop runtime, remove descriptor and containers of "
                  << sessionId << std::endl;
        return report;
    }

    std::cout << "[DescriptorReconciler] Cleaning up session " << sessionId << std::endl;

    // 1. Runtime-пара
    try {
        auto stopped = orchestrator_->stop(sessionId);
        report.runtimeStopped = stopped.success;
        if (!stopped.success) {
            report.errors.push_back("stop: " + stopped.message);
        }
    } catch (const std::exception& e) {
        report.errors.push_back(std::string("stop: ") + e.what());
    }

    // 2. Дескриптор
    try {
        report.descriptorRemoved = descriptors_->remove(sessionId);
    } catch (const std::exception& e) {
        report.errors.push_back(std::string("descriptor: ") + e.what());
    }

    // 3. Контейнеры, пережившие compose down
    try {
        std::vector<domain::RuntimeContainer> leftovers;
        for (const auto& container : containers_->listContainers(settings_->getContainerPrefix(), true)) {
            if (container.name.find(sessionId) != std::string::npos) {
                leftovers.push_back(container);
            }
        }
        report.containersRemoved = forceRemoveContainers(leftovers, report.errors);
    } catch (const std::exception& e) {
        report.errors.push_back(std::string("containers: ") + e.what());
    }

    // 4. Состояние процесса
    try {
        store_->clearSessionData(sessionId);
        registry_->remove(sessionId);
        // Порты и подсеть свободны, только если пара точно остановлена и дескриптора нет
        if (report.runtimeStopped && !descriptors_->exists(sessionId)) {
            ledger_->release(sessionId);
        } else {
            std::cerr << "[DescriptorReconciler] Keeping reservations of " << sessionId
                      << ": runtime or descriptor still present" << std::endl;
        }
    } catch (const std::exception& e) {
        report.errors.push_back(std::string("registry: ") + e.what());
    }

    for (const auto& error : report.errors) {
        std::cerr << "[DescriptorReconciler] " << sessionId << ": " << error << std::endl;
    }
    return report;
}

int DescriptorReconciler::forceRemoveContainers(
    const std::vector<domain::RuntimeContainer>& targets,
    std::vector<std::string>& errors)
{
    int removed = 0;
    for (const auto& container : targets) {
        auto stopped = containers_->stopContainer(container.name);
        if (!stopped.ok()) {
            std::cerr << "[DescriptorReconciler] stop " << container.name << ": " << stopped.err << std::endl;
        }
        auto rm = containers_->removeContainer(container.name);
        if (rm.ok()) {
            ++removed;
        } else {
            errors.push_back("rm " + container.name + ": " + rm.err);
        }
    }
    return removed;
}

void DescriptorReconciler::accumulate(domain::CleanupSummary& summary, domain::CleanupReport report) {
    ++summary.processed;
    if (report.success()) {
        ++summary.cleaned;
    } else {
        ++summary.failed;
    }
    summary.reports.push_back(std::move(report));
}

// ============================================================================
// ПАКЕТНАЯ ОЧИСТКА
// ============================================================================

domain::CleanupSummary DescriptorReconciler::cleanupExpired(bool dryRun) {
    domain::CleanupSummary summary;
    summary.dryRun = dryRun;

    auto now = domain::Timestamp::now();
    std::set<std::string> expired;

    for (const auto& descriptor : descriptors_->loadAll()) {
        if (descriptor.isExpired(now)) {
            expired.insert(descriptor.sessionId);
        }
    }
    for (const auto& sessionId : registry_->findExpired(now)) {
        expired.insert(sessionId);
    }

    if (expired.empty()) {
        std::cout << "[DescriptorReconciler] No expired sessions" << std::endl;
        return summary;
    }

    std::cout << "[DescriptorReconciler] Found " << expired.size() << " expired session(s)" << std::endl;
    for (const auto& sessionId : expired) {
        accumulate(summary, cleanupSession(sessionId, dryRun));
    }
    return summary;
}

domain::CleanupSummary DescriptorReconciler::cleanupAll(bool confirmed, bool dryRun) {
    domain::CleanupSummary summary;
    summary.confirmed = confirmed;
    summary.dryRun = dryRun;

    if (!confirmed) {
        std::cout << "[DescriptorReconciler] Cleanup of all sessions not confirmed, nothing done" << std::endl;
        return summary;
    }

    std::set<std::string> sessionIds;
    for (const auto& descriptor : descriptors_->loadAll()) {
        sessionIds.insert(descriptor.sessionId);
    }
    for (const auto& sessionId : registry_->listIds()) {
        sessionIds.insert(sessionId);
    }

    for (const auto& sessionId : sessionIds) {
        accumulate(summary, cleanupSession(sessionId, dryRun));
    }

    if (dryRun) {
        return summary;
    }

    // Всё, что осталось с префиксом, никому не принадлежит
    std::vector<std::string> errors;
    try {
        summary.orphanContainersRemoved = forceRemoveContainers(
            containers_->listContainers(settings_->getContainerPrefix(), true), errors);
    } catch (const std::exception& e) {
        errors.push_back(std::string("containers: ") + e.what());
    }
    for (const auto& error : errors) {
        std::cerr << "[DescriptorReconciler] " << error << std::endl;
    }

    registry_->clear();
    ledger_->clear();
    return summary;
}

// ============================================================================
// LIST
// ============================================================================

domain::SessionListing DescriptorReconciler::list() {
    domain::SessionListing listing;
    auto now = domain::Timestamp::now();

    auto live = containers_->listContainers(settings_->getContainerPrefix(), false);
    auto descriptors = descriptors_->loadAll();

    std::sort(descriptors.begin(), descriptors.end(),
              [](const domain::SessionDescriptor& a, const domain::SessionDescriptor& b) {
                  return a.createdAt < b.createdAt;
              });

    for (const auto& descriptor : descriptors) {
        domain::SessionListingEntry entry;
        entry.sessionId = descriptor.sessionId;
        entry.username = descriptor.username;
        entry.createdAt = descriptor.createdAt;
        entry.expiresAt = descriptor.expiresAt;
        entry.backendPort = descriptor.allocation.backendPort;
        entry.frontendPort = descriptor.allocation.frontendPort;
        entry.subnet = descriptor.allocation.subnet;

        auto remaining = std::chrono::duration_cast<std::chrono::seconds>(descriptor.expiresAt.value - now.value);
        entry.remaining = remaining.count() > 0 ? remaining : std::chrono::seconds(0);

        for (const auto& container : live) {
            if (container.name.find(descriptor.sessionId) != std::string::npos) {
                entry.containers.push_back(container);
            }
        }

        bool expired = descriptor.isExpired(now);
        if (!entry.containers.empty() && !expired) {
            entry.status = domain::SessionStatus::RUNNING;
            ++listing.summary.running;
        } else if (expired) {
            entry.status = domain::SessionStatus::EXPIRED;
            ++listing.summary.expired;
        } else if (descriptor.active) {
            entry.status = domain::SessionStatus::ACTIVE;
            ++listing.summary.active;
        } else {
            entry.status = domain::SessionStatus::STOPPED;
            ++listing.summary.stopped;
        }

        listing.sessions.push_back(entry);
    }

    for (const auto& container : live) {
        bool known = std::any_of(descriptors.begin(), descriptors.end(),
                                 [&container](const domain::SessionDescriptor& d) {
                                     return container.name.find(d.sessionId) != std::string::npos;
                                 });
        if (!known) {
            listing.orphans.push_back(container);
        }
    }

    listing.summary.totalSessions = listing.sessions.size();
    listing.summary.totalContainers = live.size();
    listing.summary.orphanedContainers = listing.orphans.size();
    return listing;
}

} // namespace sandbox::application
