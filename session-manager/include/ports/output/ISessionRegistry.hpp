#pragma once

#include "domain/Session.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sandbox::ports::output {

/**
 * @brief Реестр живых сессий
 *
 * Output Port. Единственный источник правды о сессиях внутри процесса.
 * Все мутации выполняются под одним мьютексом, наружу отдаются копии.
 *
 * Реализации:
 * - InMemorySessionRegistry
 */
class ISessionRegistry {
public:
    virtual ~ISessionRegistry() = default;

    /**
     * @brief Зарегистрировать новую сессию
     *
     * Идентификатор берётся из криптографически стойкого источника,
     * createdAt = now, expiresAt = createdAt + настроенный TTL.
     *
     * @return sessionId
     */
    virtual std::string create(const std::string& username, const std::string& passwordHash) = 0;

    /**
     * @brief Загрузить готовую сессию (восстановление из дескриптора)
     */
    virtual void importSession(const domain::Session& session) = 0;

    virtual std::optional<domain::Session> get(const std::string& sessionId) = 0;

    virtual std::optional<domain::Session> findByUsername(const std::string& username) = 0;

    /**
     * @brief Пометить сессию неактивной (logout)
     *
     * Идемпотентно, данные сессии не удаляются.
     * @return false если сессии нет
     */
    virtual bool markInactive(const std::string& sessionId) = 0;

    /**
     * @brief Вернуть сессию в активное состояние (повторный login)
     */
    virtual bool markActive(const std::string& sessionId) = 0;

    /**
     * @brief Оставшееся время жизни, не меньше нуля
     * @return nullopt если сессии нет
     */
    virtual std::optional<std::chrono::seconds> timeRemaining(const std::string& sessionId) = 0;

    virtual bool remove(const std::string& sessionId) = 0;

    virtual bool attachConversation(const std::string& sessionId, const std::string& conversationId) = 0;
    virtual bool detachConversation(const std::string& sessionId, const std::string& conversationId) = 0;
    virtual bool attachDocument(const std::string& sessionId, const std::string& documentId) = 0;
    virtual bool detachDocument(const std::string& sessionId, const std::string& documentId) = 0;

    virtual std::vector<std::string> listIds() = 0;

    /**
     * @brief Идентификаторы сессий, у которых now - createdAt > ttl
     */
    virtual std::vector<std::string> findExpired(const domain::Timestamp& now) = 0;

    virtual size_t size() const = 0;

    virtual void clear() = 0;
};

} // namespace sandbox::ports::output
