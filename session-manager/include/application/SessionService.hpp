#pragma once

#include "ports/input/ISessionService.hpp"
#include "ports/output/IPasswordHasher.hpp"
#include "ports/output/ISessionRegistry.hpp"
#include "ports/output/ITokenProvider.hpp"
#include <iostream>
#include <memory>

namespace sandbox::application {

/**
 * @brief Вход и выход исследователя
 *
 * Учётные данные выдаёт администратор, регистрации нет.
 * Неверный логин, неверный пароль и истёкшая сессия дают одинаковый ответ,
 * как и неизвестная/истёкшая/неактивная сессия при проверке токена.
 *
 * Зависимости:
 * - ISessionRegistry: поиск сессии по username, флаг active
 * - IPasswordHasher: проверка пароля
 * - ITokenProvider: выпуск, проверка и отзыв токенов
 */
class SessionService : public ports::input::ISessionService {
public:
    static constexpr const char* INVALID_CREDENTIALS =
        "Invalid credentials. Please use the credentials provided by your administrator.";
    static constexpr const char* INVALID_SESSION = "Invalid session";

    SessionService(
        std::shared_ptr<ports::output::ISessionRegistry> registry,
        std::shared_ptr<ports::output::IPasswordHasher> hasher,
        std::shared_ptr<ports::output::ITokenProvider> tokens
    ) : registry_(std::move(registry))
      , hasher_(std::move(hasher))
      , tokens_(std::move(tokens))
    {
        std::cout << "[SessionService] Created" << std::endl;
    }

    // ========================================================================
    // ВХОД В СИСТЕМУ
    // ========================================================================

    /**
     * @brief Войти по выданным учётным данным
     *
     * Успешный вход снова делает сессию активной.
     * Токен живёт ровно столько, сколько осталось сессии.
     */
    ports::input::LoginResult login(const std::string& username, const std::string& password) override {
        ports::input::LoginResult result;

        auto session = registry_->findByUsername(username);
        if (!session || !hasher_->verify(password, session->passwordHash)) {
            result.message = INVALID_CREDENTIALS;
            return result;
        }

        auto remaining = session->timeRemaining();
        if (remaining.count() <= 0) {
            result.message = INVALID_CREDENTIALS;
            return result;
        }

        registry_->markActive(session->sessionId);

        result.success = true;
        result.token = tokens_->issue(session->username, session->sessionId, remaining);
        result.sessionId = session->sessionId;
        result.username = session->username;
        result.expiresInSeconds = remaining.count();
        result.message = "Login successful";

        std::cout << "[SessionService] Login: " << username << std::endl;
        return result;
    }

    ports::input::AuthResult authenticate(const std::string& token) override {
        ports::input::AuthResult result;
        result.message = INVALID_SESSION;

        auto claims = tokens_->verify(token);
        if (!claims) {
            return result;
        }

        auto session = registry_->get(claims->sessionId);
        if (!session || !session->isUsable()) {
            return result;
        }

        result.success = true;
        result.sessionId = session->sessionId;
        result.username = session->username;
        result.message = "OK";
        return result;
    }

    // ========================================================================
    // ВЫХОД
    // ========================================================================

    bool logout(const std::string& token) override {
        auto claims = tokens_->verify(token);
        if (!claims) {
            return false;
        }

        registry_->markInactive(claims->sessionId);
        tokens_->revoke(token);

        std::cout << "[SessionService] Logout: " << claims->subject << std::endl;
        return true;
    }

    std::optional<ports::input::SessionInfo> sessionInfo(const std::string& sessionId) override {
        auto session = registry_->get(sessionId);
        if (!session) {
            return std::nullopt;
        }

        auto remaining = session->timeRemaining();
        if (remaining.count() <= 0) {
            return std::nullopt;
        }

        ports::input::SessionInfo info;
        info.sessionId = session->sessionId;
        info.username = session->username;
        info.createdAt = session->createdAt;
        info.expiresAt = session->expiresAt;
        info.remainingMinutes = remaining.count() / 60;
        info.remainingHours = remaining.count() / 3600;
        info.active = session->active;
        return info;
    }

private:
    std::shared_ptr<ports::output::ISessionRegistry> registry_;
    std::shared_ptr<ports::output::IPasswordHasher> hasher_;
    std::shared_ptr<ports::output::ITokenProvider> tokens_;
};

} // namespace sandbox::application
