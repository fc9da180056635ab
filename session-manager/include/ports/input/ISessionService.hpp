#pragma once

#include "domain/Session.hpp"
#include <optional>
#include <string>

namespace sandbox::ports::input {

/**
 * @brief Результат логина
 */
struct LoginResult {
    bool success = false;
    std::string token;
    std::string sessionId;
    std::string username;
    int64_t expiresInSeconds = 0;
    std::string message;
};

/**
 * @brief Результат проверки токена
 *
 * Неизвестная, истёкшая и неактивная сессия дают одно и то же сообщение.
 */
struct AuthResult {
    bool success = false;
    std::string sessionId;
    std::string username;
    std::string message;
};

/**
 * @brief Сведения о сессии для исследователя
 */
struct SessionInfo {
    std::string sessionId;
    std::string username;
    domain::Timestamp createdAt;
    domain::Timestamp expiresAt;
    int64_t remainingHours = 0;     ///< Полных часов
    int64_t remainingMinutes = 0;   ///< Всего минут (не остаток от часов)
    bool active = false;
};

/**
 * @brief Вход и выход исследователя, проверка токена
 */
class ISessionService {
public:
    virtual ~ISessionService() = default;

    virtual LoginResult login(const std::string& username, const std::string& password) = 0;

    /**
     * @brief Проверить токен и найти живую, активную, неистёкшую сессию
     */
    virtual AuthResult authenticate(const std::string& token) = 0;

    /**
     * @brief Выход: сессия помечается неактивной, токен отзывается
     *
     * Данные сессии не удаляются.
     */
    virtual bool logout(const std::string& token) = 0;

    virtual std::optional<SessionInfo> sessionInfo(const std::string& sessionId) = 0;
};

} // namespace sandbox::ports::input
