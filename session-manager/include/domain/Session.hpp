#pragma once

#include "Timestamp.hpp"
#include <string>
#include <set>
#include <chrono>

namespace sandbox::domain {

/**
 * @brief Сессия исследователя в реестре
 *
 * Инвариант: expiresAt == createdAt + ttl.
 * active=false означает logout, а не удаление: данные сессии живут до истечения TTL.
 */
struct Session {
    std::string sessionId;          ///< Непредсказуемый идентификатор (claim токена)
    std::string username;           ///< researcher_xxxxxxxx
    std::string passwordHash;       ///< Хэш пароля (формат определяет IPasswordHasher)
    Timestamp createdAt;
    Timestamp expiresAt;
    std::chrono::hours ttl{0};
    bool active = true;
    std::set<std::string> documentIds;
    std::set<std::string> conversationIds;

    Session() = default;

    Session(const std::string& sessionId,
            const std::string& username,
            const std::string& passwordHash,
            const Timestamp& createdAt,
            std::chrono::hours ttl)
        : sessionId(sessionId)
        , username(username)
        , passwordHash(passwordHash)
        , createdAt(createdAt)
        , expiresAt(Timestamp(createdAt.value + ttl))
        , ttl(ttl)
    {}

    /**
     * @brief Оставшееся время жизни, не меньше нуля
     */
    std::chrono::seconds timeRemaining(const Timestamp& now = Timestamp::now()) const {
        auto elapsed = now.value - createdAt.value;
        auto remaining = std::chrono::duration_cast<std::chrono::seconds>(ttl - elapsed);
        return remaining.count() > 0 ? remaining : std::chrono::seconds(0);
    }

    /**
     * @brief Истекла ли сессия (now - createdAt > ttl)
     */
    bool isExpired(const Timestamp& now = Timestamp::now()) const {
        return (now.value - createdAt.value) > ttl;
    }

    /**
     * @brief Пригодна ли сессия для обслуживания запросов
     */
    bool isUsable(const Timestamp& now = Timestamp::now()) const {
        return active && timeRemaining(now).count() > 0;
    }
};

} // namespace sandbox::domain
