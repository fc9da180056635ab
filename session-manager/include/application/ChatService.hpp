#pragma once

#include "ports/input/IChatService.hpp"
#include "ports/output/IEphemeralStore.hpp"
#include "ports/output/ILlmClient.hpp"
#include "ports/output/ISessionRegistry.hpp"
#include "settings/LlmSettings.hpp"
#include <memory>

namespace sandbox::application {

/**
 * @brief Чат исследователя с LLM в рамках сессии
 *
 * Сообщение пользователя сохраняется до обращения к LLM, вся история
 * разговора уходит в LLM целиком. Ответ сохраняется как сообщение assistant.
 * Ошибки LLM не перехватываются и не повторяются.
 */
class ChatService : public ports::input::IChatService {
public:
    ChatService(
        std::shared_ptr<ports::output::ISessionRegistry> registry,
        std::shared_ptr<ports::output::IEphemeralStore> store,
        std::shared_ptr<ports::output::ILlmClient> llm,
        std::shared_ptr<settings::LlmSettings> settings
    );

    ports::input::ChatResult sendMessage(
        const std::string& sessionId,
        const std::string& conversationId,
        const std::string& content,
        const std::vector<std::string>& documentIds
    ) override;

    std::optional<domain::Conversation> getHistory(
        const std::string& sessionId,
        const std::string& conversationId
    ) override;

    std::vector<domain::Conversation> listConversations(const std::string& sessionId) override;

    bool deleteConversation(const std::string& sessionId, const std::string& conversationId) override;

    /**
     * @brief Текст реплики для LLM: сообщение плюс снимки процитированных документов
     */
    static std::string composeTurn(const domain::Message& message);

private:
    std::shared_ptr<ports::output::ISessionRegistry> registry_;
    std::shared_ptr<ports::output::IEphemeralStore> store_;
    std::shared_ptr<ports::output::ILlmClient> llm_;
    std::shared_ptr<settings::LlmSettings> settings_;

    bool isUsableSession(const std::string& sessionId);
};

} // namespace sandbox::application
