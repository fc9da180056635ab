#pragma once

#include "ports/output/IDocumentExtractor.hpp"
#include <fstream>
#include <sstream>

namespace sandbox::adapters::secondary {

/**
 * @brief Извлечение текста из .txt
 *
 * Для остальных типов возвращает результат с ошибкой "unsupported";
 * разбор PDF и DOCX вне рамок менеджера сессий.
 * Страница .txt условно равна 3000 символам.
 */
class PlainTextExtractor : public ports::output::IDocumentExtractor {
public:
    domain::ProcessingResult extract(const std::string& path, const std::string& fileType) override {
        domain::ProcessingResult result;
        result.processedAt = domain::Timestamp::now();

        if (fileType != ".txt") {
            result.error = "Unsupported file type for text extraction: " + fileType;
            return result;
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            result.error = "Cannot open file: " + path;
            return result;
        }

        std::ostringstream content;
        content << in.rdbuf();
        result.content = content.str();
        result.wordCount = countWords(result.content);
        result.pageCount = result.content.empty()
            ? 0
            : static_cast<int>((result.content.size() + CHARS_PER_PAGE - 1) / CHARS_PER_PAGE);
        return result;
    }

private:
    static constexpr size_t CHARS_PER_PAGE = 3000;

    static int countWords(const std::string& text) {
        std::istringstream ss(text);
        std::string word;
        int count = 0;
        while (ss >> word) {
            ++count;
        }
        return count;
    }
};

} // namespace sandbox::adapters::secondary
