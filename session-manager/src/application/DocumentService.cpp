#include "application/DocumentService.hpp"
#include "utils/SecureRandom.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace sandbox::application {

namespace fs = std::filesystem;

DocumentService::DocumentService(
    std::shared_ptr<ports::output::ISessionRegistry> registry,
    std::shared_ptr<ports::output::IEphemeralStore> store,
    std::shared_ptr<ports::output::IDocumentExtractor> extractor,
    std::shared_ptr<settings::DocumentSettings> settings)
    : registry_(std::move(registry))
    , store_(std::move(store))
    , extractor_(std::move(extractor))
    , settings_(std::move(settings))
{
    std::cout << "[DocumentService] Created, upload dir: " << settings_->getUploadDir() << std::endl;
}

std::string DocumentService::extensionOf(const std::string& filename) {
    std::string extension = fs::path(filename).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

ports::input::UploadResult DocumentService::upload(
    const std::string& sessionId,
    const std::string& filename,
    const std::string& content)
{
    ports::input::UploadResult result;

    auto session = registry_->get(sessionId);
    if (!session || !session->isUsable()) {
        result.message = "Invalid session";
        return result;
    }

    std::string baseName = fs::path(filename).filename().string();
    if (baseName.empty() || baseName == "." || baseName == "..") {
        result.message = "Invalid filename";
        return result;
    }

    std::string fileType = extensionOf(baseName);
    const auto& allowed = settings_->getAllowedTypes();
    if (allowed.count(fileType) == 0) {
        std::string list;
        for (const auto& type : allowed) {
            list += (list.empty() ? "" : ", ") + type;
        }
        result.message = "File type not allowed. Allowed types: " + list;
        return result;
    }

    auto size = static_cast<int64_t>(content.size());
    if (size > settings_->getMaxFileSizeBytes()) {
        result.message = "File too large. Maximum size: " + std::to_string(settings_->getMaxFileSizeMb()) + "MB";
        return result;
    }

    fs::path dir = fs::path(settings_->getUploadDir()) / sessionId;
    fs::path path = dir / (utils::SecureRandom::hex(8) + "_" + baseName);
    try {
        fs::create_directories(dir);
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot open " + path.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            throw std::runtime_error("write failed for " + path.string());
        }
    } catch (const std::exception& e) {
        std::cerr << "[DocumentService] Failed to store upload: " << e.what() << std::endl;
        result.message = std::string("Failed to store file: ") + e.what();
        return result;
    }

    auto document = store_->addDocument(sessionId, baseName, path.string(), size, fileType);
    if (!registry_->attachDocument(sessionId, document.id)) {
        std::cerr << "[DocumentService] Session " << sessionId << " ended during upload of " << baseName << std::endl;
        store_->deleteDocument(document.id, sessionId);
        result.message = "Invalid session";
        return result;
    }

    auto processing = extractor_->extract(path.string(), fileType);
    if (!processing.succeeded()) {
        std::cerr << "[DocumentService] Processing of " << baseName << " failed: " << processing.error << std::endl;
    }
    store_->recordProcessing(document.id, processing);

    result.success = true;
    result.document = store_->getDocument(document.id).value_or(document);
    result.message = "File uploaded successfully";
    return result;
}

std::vector<domain::Document> DocumentService::listDocuments(const std::string& sessionId) {
    return store_->listDocuments(sessionId);
}

std::optional<domain::Document> DocumentService::getDocument(
    const std::string& sessionId,
    const std::string& documentId)
{
    auto document = store_->getDocument(documentId);
    if (!document || document->sessionId != sessionId) {
        return std::nullopt;
    }
    return document;
}

bool DocumentService::deleteDocument(const std::string& sessionId, const std::string& documentId) {
    if (!store_->deleteDocument(documentId, sessionId)) {
        return false;
    }
    registry_->detachDocument(sessionId, documentId);
    return true;
}

} // namespace sandbox::application
