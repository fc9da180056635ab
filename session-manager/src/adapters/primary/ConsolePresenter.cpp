#include "adapters/primary/cli/ConsolePresenter.hpp"
#include <algorithm>
#include <sstream>

namespace sandbox::adapters::primary {

namespace {

std::string portOrDash(int port) {
    return port > 0 ? std::to_string(port) : "-";
}

nlohmann::json containerToJson(const domain::RuntimeContainer& container) {
    return {
        {"name", container.name},
        {"id", container.id},
        {"status", container.status},
        {"ports", container.ports}
    };
}

} // namespace

// ============================================================================
// ЛИСТИНГ СЕССИЙ
// ============================================================================

std::string ConsolePresenter::renderListing(const domain::SessionListing& listing) {
    std::ostringstream out;

    if (listing.sessions.empty()) {
        out << "No sessions found\n";
    } else {
        std::vector<std::vector<std::string>> rows;
        for (const auto& entry : listing.sessions) {
            rows.push_back({
                shortId(entry.sessionId),
                entry.username,
                domain::toString(entry.status),
                portOrDash(entry.backendPort),
                portOrDash(entry.frontendPort),
                entry.subnet.empty() ? "-" : entry.subnet,
                entry.expiresAt.toDisplayString(),
                entry.status == domain::SessionStatus::EXPIRED
                    ? "EXPIRED" : domain::formatRemaining(entry.remaining),
                std::to_string(entry.containers.size())
            });
        }
        out << renderTable(
            {"SESSION", "USER", "STATUS", "BACKEND", "FRONTEND", "SUBNET", "EXPIRES", "REMAINING", "CONTAINERS"},
            rows);
    }

    if (!listing.orphans.empty()) {
        out << "\nOrphaned containers:\n";
        for (const auto& orphan : listing.orphans) {
            out << "  " << orphan.name << " (" << orphan.status << ")\n";
        }
    }

    const auto& s = listing.summary;
    out << "\nTotal: " << s.totalSessions
        << " | Running: " << s.running
        << " | Active: " << s.active
        << " | Stopped: " << s.stopped
        << " | Expired: " << s.expired
        << " | Containers: " << s.totalContainers
        << " | Orphaned: " << s.orphanedContainers << "\n";
    return out.str();
}

std::string ConsolePresenter::renderContainers(const domain::SessionListing& listing) {
    std::vector<std::vector<std::string>> rows;
    for (const auto& entry : listing.sessions) {
        for (const auto& c : entry.containers) {
            rows.push_back({c.name, c.id, c.status, c.ports, shortId(entry.sessionId)});
        }
    }
    for (const auto& c : listing.orphans) {
        rows.push_back({c.name, c.id, c.status, c.ports, "(orphan)"});
    }

    if (rows.empty()) {
        return "No sandbox containers running\n";
    }
    return renderTable({"NAME", "ID", "STATUS", "PORTS", "SESSION"}, rows);
}

nlohmann::json ConsolePresenter::listingToJson(const domain::SessionListing& listing) {
    nlohmann::json sessions = nlohmann::json::array();
    for (const auto& entry : listing.sessions) {
        nlohmann::json containers = nlohmann::json::array();
        for (const auto& c : entry.containers) {
            containers.push_back(containerToJson(c));
        }
        sessions.push_back({
            {"session_id", entry.sessionId},
            {"username", entry.username},
            {"status", domain::toString(entry.status)},
            {"created_at", entry.createdAt.toString()},
            {"expires_at", entry.expiresAt.toString()},
            {"remaining_seconds", entry.remaining.count()},
            {"backend_port", entry.backendPort},
            {"frontend_port", entry.frontendPort},
            {"subnet", entry.subnet},
            {"containers", containers}
        });
    }

    nlohmann::json orphans = nlohmann::json::array();
    for (const auto& c : listing.orphans) {
        orphans.push_back(containerToJson(c));
    }

    const auto& s = listing.summary;
    return {
        {"sessions", sessions},
        {"orphaned_containers", orphans},
        {"summary", {
            {"total_sessions", s.totalSessions},
            {"running", s.running},
            {"active", s.active},
            {"stopped", s.stopped},
            {"expired", s.expired},
            {"total_containers", s.totalContainers},
            {"orphaned_containers", s.orphanedContainers}
        }}
    };
}

// ============================================================================
// RUNTIME
// ============================================================================

std::string ConsolePresenter::renderHealth(const domain::HealthReport& report) {
    std::ostringstream out;
    out << "Session:   " << report.sessionId << "\n"
        << "Backend:   " << domain::toString(report.backend) << "\n"
        << "Frontend:  " << domain::toString(report.frontend) << "\n"
        << "Reachable: ";
    if (report.backendReachable.has_value()) {
        out << (*report.backendReachable ? "yes" : "no");
        if (!report.probeDetail.empty()) {
            out << " (" << report.probeDetail << ")";
        }
    } else {
        out << "not probed";
    }
    out << "\n"
        << "TTL:       " << report.ttlStatus << "\n"
        << "Checked:   " << report.checkedAt.toDisplayString() << "\n";
    return out.str();
}

std::string ConsolePresenter::renderLogs(const std::vector<domain::LogOutput>& logs) {
    std::ostringstream out;
    for (const auto& log : logs) {
        out << "==> " << log.containerName << " (" << domain::toString(log.process) << ") <==\n";
        if (log.success) {
            out << log.content;
            if (!log.content.empty() && log.content.back() != '\n') {
                out << "\n";
            }
        } else {
            out << "error: " << log.error << "\n";
        }
    }
    return out.str();
}

// ============================================================================
// ВЫДАЧА И ОЧИСТКА
// ============================================================================

std::string ConsolePresenter::renderProvisioned(const ports::input::ProvisionResult& result) {
    std::ostringstream out;
    if (!result.success) {
        out << "Provisioning failed after " << result.attempts << " attempt(s) ["
            << domain::toString(result.errorKind) << "]: " << result.message << "\n";
        return out.str();
    }

    out << "Session ID:    " << result.credentials.sessionId << "\n"
        << "Username:      " << result.credentials.username << "\n"
        << "Password:      " << result.credentials.password << "\n"
        << "Expires:       " << result.expiresAt.toDisplayString() << "\n"
        << "Backend port:  " << result.allocation.backendPort << "\n"
        << "Frontend port: " << result.allocation.frontendPort << "\n"
        << "Subnet:        " << result.allocation.subnet << "\n"
        << "Runtime:       " << (result.runtimeStarted ? "started" : "not started") << "\n";
    return out.str();
}

std::string ConsolePresenter::renderCleanupReport(const domain::CleanupReport& report) {
    std::ostringstream out;
    out << (report.dryRun ? "[dry-run] " : "")
        << shortId(report.sessionId) << ": "
        << (report.success() ? "cleaned" : "failed")
        << " (runtime stopped: " << (report.runtimeStopped ? "yes" : "no")
        << ", descriptor removed: " << (report.descriptorRemoved ? "yes" : "no")
        << ", containers removed: " << report.containersRemoved << ")\n";
    for (const auto& error : report.errors) {
        out << "    error: " << error << "\n";
    }
    return out.str();
}

std::string ConsolePresenter::renderCleanup(const domain::CleanupSummary& summary) {
    std::ostringstream out;
    if (!summary.confirmed) {
        out << "Cleanup not confirmed, nothing was removed\n";
        return out.str();
    }

    for (const auto& report : summary.reports) {
        out << renderCleanupReport(report);
    }
    out << (summary.dryRun ? "[dry-run] " : "")
        << "Processed: " << summary.processed
        << " | Cleaned: " << summary.cleaned
        << " | Failed: " << summary.failed
        << " | Orphan containers removed: " << summary.orphanContainersRemoved << "\n";
    return out.str();
}

std::string ConsolePresenter::renderTable(
    const std::vector<std::string>& header,
    const std::vector<std::vector<std::string>>& rows
) {
    std::vector<size_t> widths(header.size(), 0);
    for (size_t i = 0; i < header.size(); ++i) {
        widths[i] = header[i].size();
    }
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size() && i < widths.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto writeRow = [&widths](std::ostringstream& out, const std::vector<std::string>& cells) {
        for (size_t i = 0; i < widths.size(); ++i) {
            std::string cell = i < cells.size() ? cells[i] : "";
            out << cell;
            if (i + 1 < widths.size()) {
                out << std::string(widths[i] - cell.size() + 2, ' ');
            }
        }
        out << "\n";
    };

    std::ostringstream out;
    writeRow(out, header);
    for (const auto& row : rows) {
        writeRow(out, row);
    }
    return out.str();
}

std::string ConsolePresenter::shortId(const std::string& id) {
    return id.size() > 12 ? id.substr(0, 12) : id;
}

} // namespace sandbox::adapters::primary
