#pragma once

#include "ports/output/IEphemeralStore.hpp"
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace sandbox::adapters::secondary {

/**
 * @brief Эфемерное хранилище разговоров и документов в памяти
 *
 * Каждая операция выполняется целиком под одним мьютексом.
 * sequence сообщений сквозной для всего хранилища и строго возрастает.
 */
class InMemoryEphemeralStore : public ports::output::IEphemeralStore {
public:
    InMemoryEphemeralStore();

    std::string createConversation(const std::string& sessionId) override;

    std::optional<domain::Message> addMessage(
        const std::string& conversationId,
        domain::MessageRole role,
        const std::string& content,
        const std::vector<std::string>& documentIds,
        const std::map<std::string, std::string>& documentContents
    ) override;

    std::optional<domain::Conversation> getConversation(const std::string& conversationId) override;
    std::vector<domain::Conversation> listConversations(const std::string& sessionId) override;
    bool deleteConversation(const std::string& conversationId, const std::string& sessionId) override;

    domain::Document addDocument(
        const std::string& sessionId,
        const std::string& filename,
        const std::string& storagePath,
        int64_t sizeBytes,
        const std::string& fileType
    ) override;

    std::optional<domain::Document> getDocument(const std::string& documentId) override;
    std::vector<domain::Document> getDocumentsByIds(const std::vector<std::string>& documentIds) override;
    std::vector<domain::Document> listDocuments(const std::string& sessionId) override;
    bool deleteDocument(const std::string& documentId, const std::string& sessionId) override;
    bool recordProcessing(const std::string& documentId, const domain::ProcessingResult& result) override;

    size_t clearSessionData(const std::string& sessionId) override;

    size_t conversationCount() const override;
    size_t documentCount() const override;

private:
    struct ConversationRecord {
        domain::Conversation conversation;
        uint64_t revision = 0;  ///< Порядок изменений при равных updatedAt
    };

    struct DocumentRecord {
        domain::Document document;
        uint64_t revision = 0;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConversationRecord> conversations_;
    std::unordered_map<std::string, DocumentRecord> documents_;
    int64_t nextSequence_ = 1;
    uint64_t revision_ = 0;

    static void removeFile(const std::string& path);
};

} // namespace sandbox::adapters::secondary
