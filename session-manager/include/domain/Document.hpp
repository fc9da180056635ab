#pragma once

#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace sandbox::domain {

/**
 * @brief Результат однократной обработки документа экстрактором
 */
struct ProcessingResult {
    std::string content;
    int pageCount = 0;
    int wordCount = 0;
    std::string error;      ///< Пусто при успешном извлечении
    Timestamp processedAt;

    bool succeeded() const { return error.empty(); }
};

/**
 * @brief Загруженный в сессию документ
 */
struct Document {
    std::string id;
    std::string sessionId;
    std::string filename;
    std::string storagePath;
    int64_t sizeBytes = 0;
    std::string fileType;   ///< Расширение с точкой: ".txt", ".pdf", ".docx"
    Timestamp uploadedAt;
    std::optional<ProcessingResult> processing;

    bool isProcessed() const { return processing.has_value(); }
};

} // namespace sandbox::domain
