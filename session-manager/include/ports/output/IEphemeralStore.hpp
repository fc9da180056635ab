#pragma once

#include "domain/Conversation.hpp"
#include "domain/Document.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sandbox::ports::output {

/**
 * @brief Эфемерное хранилище разговоров и документов сессий
 *
 * Output Port. Ничего не переживает перезапуск процесса.
 * Каждая операция атомарна: читатель никогда не видит
 * наполовину записанное сообщение или разговор.
 *
 * Владение: сессия владеет разговорами и документами (каскадное удаление),
 * разговор владеет сообщениями, сообщения только ссылаются на документы.
 */
class IEphemeralStore {
public:
    virtual ~IEphemeralStore() = default;

    // ========================================================================
    // РАЗГОВОРЫ
    // ========================================================================

    virtual std::string createConversation(const std::string& sessionId) = 0;

    /**
     * @brief Добавить сообщение
     *
     * Вставка сообщения и обновление updatedAt разговора происходят атомарно.
     * @return Сообщение с присвоенными sequence и timestamp, nullopt если разговора нет
     */
    virtual std::optional<domain::Message> addMessage(
        const std::string& conversationId,
        domain::MessageRole role,
        const std::string& content,
        const std::vector<std::string>& documentIds,
        const std::map<std::string, std::string>& documentContents
    ) = 0;

    virtual std::optional<domain::Conversation> getConversation(const std::string& conversationId) = 0;

    /**
     * @brief Разговоры сессии, последние обновлённые первыми
     */
    virtual std::vector<domain::Conversation> listConversations(const std::string& sessionId) = 0;

    /**
     * @brief Удалить разговор, если он принадлежит сессии
     * @return false если разговора нет или он чужой
     */
    virtual bool deleteConversation(const std::string& conversationId, const std::string& sessionId) = 0;

    // ========================================================================
    // ДОКУМЕНТЫ
    // ========================================================================

    virtual domain::Document addDocument(
        const std::string& sessionId,
        const std::string& filename,
        const std::string& storagePath,
        int64_t sizeBytes,
        const std::string& fileType
    ) = 0;

    virtual std::optional<domain::Document> getDocument(const std::string& documentId) = 0;

    virtual std::vector<domain::Document> getDocumentsByIds(const std::vector<std::string>& documentIds) = 0;

    /**
     * @brief Документы сессии, новые первыми
     */
    virtual std::vector<domain::Document> listDocuments(const std::string& sessionId) = 0;

    /**
     * @brief Удалить документ и его файл, если он принадлежит сессии
     */
    virtual bool deleteDocument(const std::string& documentId, const std::string& sessionId) = 0;

    /**
     * @brief Записать результат обработки
     * @return false если документа нет или он уже обработан
     */
    virtual bool recordProcessing(const std::string& documentId, const domain::ProcessingResult& result) = 0;

    // ========================================================================
    // КАСКАД
    // ========================================================================

    /**
     * @brief Удалить все разговоры и документы сессии
     * @return Количество удалённых объектов
     */
    virtual size_t clearSessionData(const std::string& sessionId) = 0;

    virtual size_t conversationCount() const = 0;
    virtual size_t documentCount() const = 0;
};

} // namespace sandbox::ports::output
