#pragma once

#include <string>

namespace sandbox::domain {

/**
 * @brief Сводный статус сессии в листинге
 *
 * Приоритет: RUNNING > EXPIRED > ACTIVE > STOPPED.
 */
enum class SessionStatus {
    RUNNING,    ///< Есть живой контейнер и TTL не истёк
    EXPIRED,    ///< TTL истёк (независимо от контейнеров)
    ACTIVE,     ///< TTL не истёк, живых контейнеров нет, сессия не деактивирована
    STOPPED     ///< TTL не истёк, живых контейнеров нет, сессия деактивирована
};

inline std::string toString(SessionStatus status) {
    switch (status) {
        case SessionStatus::RUNNING: return "RUNNING";
        case SessionStatus::EXPIRED: return "EXPIRED";
        case SessionStatus::ACTIVE:  return "ACTIVE";
        case SessionStatus::STOPPED: return "STOPPED";
    }
    return "UNKNOWN";
}

} // namespace sandbox::domain
