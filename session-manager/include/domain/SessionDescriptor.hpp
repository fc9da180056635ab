#pragma once

#include "Timestamp.hpp"
#include "ResourceAllocation.hpp"
#include "RuntimeHealth.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace sandbox::domain {

/**
 * @brief Сохранённая на диске проекция последней проверки здоровья
 */
struct HealthSnapshot {
    std::string backend;
    std::string frontend;
    std::optional<bool> backendReachable;
    std::string ttlStatus;
    Timestamp checkedAt;
};

/**
 * @brief Долговременное зеркало сессии и её ресурсов
 *
 * Один файл session.json на каталог сессии. Именно по дескрипторам
 * работают инструменты оператора (ctl, cleanup, sessions) и загрузка реестра при старте.
 */
struct SessionDescriptor {
    std::string sessionId;
    std::string username;
    std::string passwordHash;
    Timestamp createdAt;
    Timestamp expiresAt;
    int ttlHours = 0;
    bool active = true;
    ResourceAllocation allocation;
    std::vector<std::string> appliedExtensions;     ///< Ключи идемпотентности применённых продлений
    std::optional<HealthSnapshot> lastHealth;

    bool isExpired(const Timestamp& now = Timestamp::now()) const {
        return now > expiresAt;
    }

    bool hasExtension(const std::string& requestId) const {
        return std::find(appliedExtensions.begin(), appliedExtensions.end(), requestId)
            != appliedExtensions.end();
    }
};

} // namespace sandbox::domain
