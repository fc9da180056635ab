#pragma once

#include "ports/input/IDocumentService.hpp"
#include "ports/output/IDocumentExtractor.hpp"
#include "ports/output/IEphemeralStore.hpp"
#include "ports/output/ISessionRegistry.hpp"
#include "settings/DocumentSettings.hpp"
#include <memory>

namespace sandbox::application {

/**
 * @brief Загрузка документов в сессию
 *
 * Файл пишется в UPLOAD_DIR/<sessionId>/, затем один раз проходит
 * через экстрактор; результат (или ошибка) сохраняется как есть.
 */
class DocumentService : public ports::input::IDocumentService {
public:
    DocumentService(
        std::shared_ptr<ports::output::ISessionRegistry> registry,
        std::shared_ptr<ports::output::IEphemeralStore> store,
        std::shared_ptr<ports::output::IDocumentExtractor> extractor,
        std::shared_ptr<settings::DocumentSettings> settings
    );

    ports::input::UploadResult upload(
        const std::string& sessionId,
        const std::string& filename,
        const std::string& content
    ) override;

    std::vector<domain::Document> listDocuments(const std::string& sessionId) override;

    std::optional<domain::Document> getDocument(
        const std::string& sessionId,
        const std::string& documentId
    ) override;

    bool deleteDocument(const std::string& sessionId, const std::string& documentId) override;

    /**
     * @brief Расширение в нижнем регистре с точкой, "" если его нет
     */
    static std::string extensionOf(const std::string& filename);

private:
    std::shared_ptr<ports::output::ISessionRegistry> registry_;
    std::shared_ptr<ports::output::IEphemeralStore> store_;
    std::shared_ptr<ports::output::IDocumentExtractor> extractor_;
    std::shared_ptr<settings::DocumentSettings> settings_;
};

} // namespace sandbox::application
