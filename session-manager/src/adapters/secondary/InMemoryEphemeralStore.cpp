#include "adapters/secondary/persistence/InMemoryEphemeralStore.hpp"
#include "utils/SecureRandom.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace sandbox::adapters::secondary {

namespace fs = std::filesystem;

InMemoryEphemeralStore::InMemoryEphemeralStore() {
    std::cout << "[InMemoryEphemeralStore] Created" << std::endl;
}

// ============================================================================
// РАЗГОВОРЫ
// ============================================================================

std::string InMemoryEphemeralStore::createConversation(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);

    ConversationRecord record;
    record.conversation.id = "conv-" + utils::SecureRandom::hex(16);
    record.conversation.sessionId = sessionId;
    record.conversation.createdAt = domain::Timestamp::now();
    record.conversation.updatedAt = record.conversation.createdAt;
    record.revision = ++revision_;

    std::string id = record.conversation.id;
    conversations_[id] = std::move(record);
    return id;
}

std::optional<domain::Message> InMemoryEphemeralStore::addMessage(
    const std::string& conversationId,
    domain::MessageRole role,
    const std::string& content,
    const std::vector<std::string>& documentIds,
    const std::map<std::string, std::string>& documentContents)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = conversations_.find(conversationId);
    if (it == conversations_.end()) {
        return std::nullopt;
    }

    domain::Message message;
    message.sequence = nextSequence_++;
    message.role = role;
    message.content = content;
    message.timestamp = domain::Timestamp::now();
    message.documentIds = documentIds;
    message.documentContents = documentContents;

    auto& record = it->second;
    record.conversation.messages.push_back(message);
    record.conversation.updatedAt = message.timestamp;
    record.revision = ++revision_;

    return message;
}

std::optional<domain::Conversation> InMemoryEphemeralStore::getConversation(const std::string& conversationId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(conversationId);
    if (it == conversations_.end()) return std::nullopt;
    return it->second.conversation;
}

std::vector<domain::Conversation> InMemoryEphemeralStore::listConversations(const std::string& sessionId) {
    std::vector<const ConversationRecord*> owned;
    std::vector<domain::Conversation> result;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, record] : conversations_) {
        if (record.conversation.sessionId == sessionId) {
            owned.push_back(&record);
        }
    }

    std::sort(owned.begin(), owned.end(), [](const ConversationRecord* a, const ConversationRecord* b) {
        if (a->conversation.updatedAt != b->conversation.updatedAt) {
            return a->conversation.updatedAt > b->conversation.updatedAt;
        }
        return a->revision > b->revision;
    });

    result.reserve(owned.size());
    for (const auto* record : owned) {
        result.push_back(record->conversation);
    }
    return result;
}

bool InMemoryEphemeralStore::deleteConversation(const std::string& conversationId, const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(conversationId);
    if (it == conversations_.end() || it->second.conversation.sessionId != sessionId) {
        return false;
    }
    conversations_.erase(it);
    return true;
}

// ============================================================================
// ДОКУМЕНТЫ
// ============================================================================

domain::Document InMemoryEphemeralStore::addDocument(
    const std::string& sessionId,
    const std::string& filename,
    const std::string& storagePath,
    int64_t sizeBytes,
    const std::string& fileType)
{
    std::lock_guard<std::mutex> lock(mutex_);

    DocumentRecord record;
    record.document.id = "doc-" + utils::SecureRandom::hex(16);
    record.document.sessionId = sessionId;
    record.document.filename = filename;
    record.document.storagePath = storagePath;
    record.document.sizeBytes = sizeBytes;
    record.document.fileType = fileType;
    record.document.uploadedAt = domain::Timestamp::now();
    record.revision = ++revision_;

    domain::Document copy = record.document;
    documents_[copy.id] = std::move(record);
    return copy;
}

std::optional<domain::Document> InMemoryEphemeralStore::getDocument(const std::string& documentId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(documentId);
    if (it == documents_.end()) return std::nullopt;
    return it->second.document;
}

std::vector<domain::Document> InMemoryEphemeralStore::getDocumentsByIds(const std::vector<std::string>& documentIds) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<domain::Document> result;
    for (const auto& id : documentIds) {
        auto it = documents_.find(id);
        if (it != documents_.end()) {
            result.push_back(it->second.document);
        }
    }
    return result;
}

std::vector<domain::Document> InMemoryEphemeralStore::listDocuments(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<const DocumentRecord*> owned;
    for (const auto& [id, record] : documents_) {
        if (record.document.sessionId == sessionId) {
            owned.push_back(&record);
        }
    }

    std::sort(owned.begin(), owned.end(), [](const DocumentRecord* a, const DocumentRecord* b) {
        if (a->document.uploadedAt != b->document.uploadedAt) {
            return a->document.uploadedAt > b->document.uploadedAt;
        }
        return a->revision > b->revision;
    });

    std::vector<domain::Document> result;
    result.reserve(owned.size());
    for (const auto* record : owned) {
        result.push_back(record->document);
    }
    return result;
}

bool InMemoryEphemeralStore::deleteDocument(const std::string& documentId, const std::string& sessionId) {
    std::string path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = documents_.find(documentId);
        if (it == documents_.end() || it->second.document.sessionId != sessionId) {
            return false;
        }
        path = it->second.document.storagePath;
        documents_.erase(it);
    }
    removeFile(path);
    return true;
}

bool InMemoryEphemeralStore::recordProcessing(const std::string& documentId, const domain::ProcessingResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(documentId);
    if (it == documents_.end() || it->second.document.processing) {
        return false;
    }
    it->second.document.processing = result;
    return true;
}

// ============================================================================
// КАСКАД
// ============================================================================

size_t InMemoryEphemeralStore::clearSessionData(const std::string& sessionId) {
    std::vector<std::string> paths;
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = conversations_.begin(); it != conversations_.end();) {
            if (it->second.conversation.sessionId == sessionId) {
                it = conversations_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        for (auto it = documents_.begin(); it != documents_.end();) {
            if (it->second.document.sessionId == sessionId) {
                paths.push_back(it->second.document.storagePath);
                it = documents_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    for (const auto& path : paths) {
        removeFile(path);
    }
    return removed;
}

size_t InMemoryEphemeralStore::conversationCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conversations_.size();
}

size_t InMemoryEphemeralStore::documentCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return documents_.size();
}

void InMemoryEphemeralStore::removeFile(const std::string& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "[InMemoryEphemeralStore] Failed to remove " << path
                  << ": " << ec.message() << std::endl;
    }
}

} // namespace sandbox::adapters::secondary
