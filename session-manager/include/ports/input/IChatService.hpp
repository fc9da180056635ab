#pragma once

#include "domain/Conversation.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sandbox::ports::input {

/**
 * @brief Результат отправки сообщения
 */
struct ChatResult {
    bool success = false;
    std::string conversationId;
    domain::Message userMessage;
    domain::Message assistantMessage;
    std::string message;
};

/**
 * @brief Чат исследователя с LLM
 */
class IChatService {
public:
    virtual ~IChatService() = default;

    /**
     * @brief Отправить сообщение
     *
     * Если conversationId пуст или не найден в сессии, создаётся новый разговор.
     * Ошибки LLM (LlmUnavailableException, LlmTimeoutException) пробрасываются без изменений,
     * сообщение пользователя при этом уже сохранено.
     */
    virtual ChatResult sendMessage(
        const std::string& sessionId,
        const std::string& conversationId,
        const std::string& content,
        const std::vector<std::string>& documentIds
    ) = 0;

    virtual std::optional<domain::Conversation> getHistory(
        const std::string& sessionId,
        const std::string& conversationId
    ) = 0;

    virtual std::vector<domain::Conversation> listConversations(const std::string& sessionId) = 0;

    virtual bool deleteConversation(const std::string& sessionId, const std::string& conversationId) = 0;
};

} // namespace sandbox::ports::input
