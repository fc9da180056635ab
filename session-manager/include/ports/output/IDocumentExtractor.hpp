#pragma once

#include "domain/Document.hpp"
#include <string>

namespace sandbox::ports::output {

/**
 * @brief Извлечение текста из загруженного файла
 *
 * Ошибка извлечения возвращается в ProcessingResult::error, а не исключением.
 */
class IDocumentExtractor {
public:
    virtual ~IDocumentExtractor() = default;

    virtual domain::ProcessingResult extract(const std::string& path, const std::string& fileType) = 0;
};

} // namespace sandbox::ports::output
