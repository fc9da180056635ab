#pragma once

#include "domain/Document.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sandbox::ports::input {

/**
 * @brief Результат загрузки документа
 */
struct UploadResult {
    bool success = false;
    domain::Document document;
    std::string message;
};

/**
 * @brief Загрузка и управление документами сессии
 */
class IDocumentService {
public:
    virtual ~IDocumentService() = default;

    /**
     * @brief Принять файл, сохранить его и один раз обработать экстрактором
     */
    virtual UploadResult upload(
        const std::string& sessionId,
        const std::string& filename,
        const std::string& content
    ) = 0;

    virtual std::vector<domain::Document> listDocuments(const std::string& sessionId) = 0;

    /**
     * @return nullopt если документа нет или он принадлежит другой сессии
     */
    virtual std::optional<domain::Document> getDocument(
        const std::string& sessionId,
        const std::string& documentId
    ) = 0;

    virtual bool deleteDocument(const std::string& sessionId, const std::string& documentId) = 0;
};

} // namespace sandbox::ports::input
