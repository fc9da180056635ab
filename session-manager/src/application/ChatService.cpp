#include "application/ChatService.hpp"

#include <iostream>

namespace sandbox::application {

ChatService::ChatService(
    std::shared_ptr<ports::output::ISessionRegistry> registry,
    std::shared_ptr<ports::output::IEphemeralStore> store,
    std::shared_ptr<ports::output::ILlmClient> llm,
    std::shared_ptr<settings::LlmSettings> settings)
    : registry_(std::move(registry))
    , store_(std::move(store))
    , llm_(std::move(llm))
    , settings_(std::move(settings))
{
    std::cout << "[ChatService] Created, model: " << settings_->getModel() << std::endl;
}

bool ChatService::isUsableSession(const std::string& sessionId) {
    auto session = registry_->get(sessionId);
    return session && session->isUsable();
}

ports::input::ChatResult ChatService::sendMessage(
    const std::string& sessionId,
    const std::string& conversationId,
    const std::string& content,
    const std::vector<std::string>& documentIds)
{
    ports::input::ChatResult result;

    if (!isUsableSession(sessionId)) {
        result.message = "Invalid session";
        return result;
    }

    // Get-or-create: чужой или неизвестный id равносилен отсутствию
    std::string targetId;
    if (!conversationId.empty()) {
        auto existing = store_->getConversation(conversationId);
        if (existing && existing->sessionId == sessionId) {
            targetId = existing->id;
        }
    }
    if (targetId.empty()) {
        targetId = store_->createConversation(sessionId);
        // Сессию могла снять очистка: её данные уже вычищены, новый разговор не должен остаться
        if (!registry_->attachConversation(sessionId, targetId)) {
            store_->deleteConversation(targetId, sessionId);
            result.message = "Invalid session";
            return result;
        }
    }
    result.conversationId = targetId;

    // Снимок текста процитированных документов этой сессии
    std::vector<std::string> citedIds;
    std::map<std::string, std::string> contents;
    for (const auto& document : store_->getDocumentsByIds(documentIds)) {
        if (document.sessionId != sessionId) {
            continue;
        }
        citedIds.push_back(document.id);
        if (document.processing && document.processing->succeeded()) {
            contents[document.id] = document.processing->content;
        }
    }

    auto userMessage = store_->addMessage(targetId, domain::MessageRole::USER, content, citedIds, contents);
    if (!userMessage) {
        result.message = "Conversation not found";
        return result;
    }
    result.userMessage = *userMessage;

    auto conversation = store_->getConversation(targetId);
    if (!conversation) {
        result.message = "Conversation not found";
        return result;
    }

    std::vector<domain::ChatTurn> turns;
    turns.reserve(conversation->messages.size());
    for (const auto& message : conversation->messages) {
        turns.push_back({message.role, composeTurn(message)});
    }

    domain::LlmOptions options;
    options.temperature = settings_->getTemperature();
    options.maxTokens = settings_->getMaxTokens();

    std::string reply = llm_->chat(turns, settings_->getModel(), options);

    auto assistantMessage = store_->addMessage(targetId, domain::MessageRole::ASSISTANT, reply, {}, {});
    if (!assistantMessage) {
        // Разговор удалили, пока ждали LLM
        result.message = "Conversation not found";
        return result;
    }

    result.success = true;
    result.assistantMessage = *assistantMessage;
    result.message = "OK";
    return result;
}

std::string ChatService::composeTurn(const domain::Message& message) {
    if (message.documentContents.empty()) {
        return message.content;
    }

    std::string text;
    for (const auto& [documentId, content] : message.documentContents) {
        text += "[Document " + documentId + "]\n" + content + "\n\n";
    }
    text += message.content;
    return text;
}

std::optional<domain::Conversation> ChatService::getHistory(
    const std::string& sessionId,
    const std::string& conversationId)
{
    auto conversation = store_->getConversation(conversationId);
    if (!conversation || conversation->sessionId != sessionId) {
        return std::nullopt;
    }
    return conversation;
}

std::vector<domain::Conversation> ChatService::listConversations(const std::string& sessionId) {
    return store_->listConversations(sessionId);
}

bool ChatService::deleteConversation(const std::string& sessionId, const std::string& conversationId) {
    if (!store_->deleteConversation(conversationId, sessionId)) {
        return false;
    }
    registry_->detachConversation(sessionId, conversationId);
    return true;
}

} // namespace sandbox::application
