#pragma once

#include "domain/SessionDescriptor.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace sandbox::adapters::secondary {

/**
 * @brief Преобразование SessionDescriptor <-> session.json
 *
 * Формат:
 * {
 *   "session_id": "...", "username": "researcher_1a2b3c4d", "password_hash": "$argon2id$...",
 *   "created_at": "2025-12-16T10:30:00Z", "expires_at": "2025-12-19T10:30:00Z",
 *   "ttl_hours": 72, "active": true,
 *   "container_config": {"backend_port": 8000, "frontend_port": 3000, "subnet": "172.23.41.0/24",
 *                        "container_name": "research_sandbox_...", "expires_at": "..."},
 *   "applied_extensions": ["req-1"],
 *   "last_health": {"backend": "running", "frontend": "running", "backend_reachable": true,
 *                   "ttl_status": "71h 59m remaining", "checked_at": "..."}
 * }
 */
class DescriptorJson {
public:
    static nlohmann::json toJson(const domain::SessionDescriptor& d) {
        nlohmann::json j;
        j["session_id"] = d.sessionId;
        j["username"] = d.username;
        j["password_hash"] = d.passwordHash;
        j["created_at"] = d.createdAt.toString();
        j["expires_at"] = d.expiresAt.toString();
        j["ttl_hours"] = d.ttlHours;
        j["active"] = d.active;

        j["container_config"] = {
            {"backend_port", d.allocation.backendPort},
            {"frontend_port", d.allocation.frontendPort},
            {"subnet", d.allocation.subnet},
            {"container_name", d.allocation.containerName},
            {"expires_at", d.expiresAt.toString()}
        };

        j["applied_extensions"] = d.appliedExtensions;

        if (d.lastHealth) {
            nlohmann::json health;
            health["backend"] = d.lastHealth->backend;
            health["frontend"] = d.lastHealth->frontend;
            if (d.lastHealth->backendReachable) {
                health["backend_reachable"] = *d.lastHealth->backendReachable;
            } else {
                health["backend_reachable"] = nullptr;
            }
            health["ttl_status"] = d.lastHealth->ttlStatus;
            health["checked_at"] = d.lastHealth->checkedAt.toString();
            j["last_health"] = health;
        }

        return j;
    }

    /**
     * @throws std::runtime_error если обязательные поля отсутствуют или некорректны
     */
    static domain::SessionDescriptor fromJson(const nlohmann::json& j) {
        domain::SessionDescriptor d;
        d.sessionId = j.at("session_id").get<std::string>();
        d.username = j.value("username", "");
        d.passwordHash = j.value("password_hash", "");
        d.createdAt = parseTime(j.at("created_at").get<std::string>(), "created_at");
        d.ttlHours = j.value("ttl_hours", 0);
        d.active = j.value("active", true);

        // expires_at мог быть записан только в container_config
        if (j.contains("expires_at")) {
            d.expiresAt = parseTime(j.at("expires_at").get<std::string>(), "expires_at");
        } else if (j.contains("container_config") && j["container_config"].contains("expires_at")) {
            d.expiresAt = parseTime(j["container_config"]["expires_at"].get<std::string>(), "expires_at");
        } else {
            d.expiresAt = d.createdAt.addHours(d.ttlHours);
        }

        if (j.contains("container_config")) {
            const auto& cc = j["container_config"];
            d.allocation.sessionId = d.sessionId;
            d.allocation.backendPort = cc.value("backend_port", 0);
            d.allocation.frontendPort = cc.value("frontend_port", 0);
            d.allocation.subnet = cc.value("subnet", "");
            d.allocation.containerName = cc.value("container_name", "");
        }

        if (j.contains("applied_extensions") && j["applied_extensions"].is_array()) {
            d.appliedExtensions = j["applied_extensions"].get<std::vector<std::string>>();
        }

        if (j.contains("last_health") && j["last_health"].is_object()) {
            const auto& h = j["last_health"];
            domain::HealthSnapshot snapshot;
            snapshot.backend = h.value("backend", "");
            snapshot.frontend = h.value("frontend", "");
            if (h.contains("backend_reachable") && h["backend_reachable"].is_boolean()) {
                snapshot.backendReachable = h["backend_reachable"].get<bool>();
            }
            snapshot.ttlStatus = h.value("ttl_status", "");
            if (auto checked = domain::Timestamp::fromString(h.value("checked_at", ""))) {
                snapshot.checkedAt = *checked;
            }
            d.lastHealth = snapshot;
        }

        return d;
    }

private:
    static domain::Timestamp parseTime(const std::string& value, const char* field) {
        auto ts = domain::Timestamp::fromString(value);
        if (!ts) {
            throw std::runtime_error(std::string("Invalid timestamp in field ") + field + ": " + value);
        }
        return *ts;
    }
};

} // namespace sandbox::adapters::secondary
