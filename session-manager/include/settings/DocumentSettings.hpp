#pragma once

#include <cstdint>
#include <cstdlib>
#include <set>
#include <string>

namespace sandbox::settings {

/**
 * @brief Настройки загрузки документов
 *
 * - UPLOAD_DIR (/tmp/sandbox/uploads)
 * - MAX_FILE_SIZE_MB (100)
 */
class DocumentSettings {
public:
    DocumentSettings() {
        uploadDir_ = getEnvOrDefault("UPLOAD_DIR", "/tmp/sandbox/uploads");
        maxFileSizeMb_ = std::stoi(getEnvOrDefault("MAX_FILE_SIZE_MB", "100"));
    }

    const std::string& getUploadDir() const { return uploadDir_; }
    int getMaxFileSizeMb() const { return maxFileSizeMb_; }
    int64_t getMaxFileSizeBytes() const { return static_cast<int64_t>(maxFileSizeMb_) * 1024 * 1024; }

    const std::set<std::string>& getAllowedTypes() const {
        static const std::set<std::string> allowed = {".pdf", ".txt", ".docx"};
        return allowed;
    }

    // ========================================================================
    // TEST HELPERS
    // ========================================================================

    void setUploadDir(const std::string& dir) { uploadDir_ = dir; }
    void setMaxFileSizeMb(int mb) { maxFileSizeMb_ = mb; }

private:
    std::string uploadDir_;
    int maxFileSizeMb_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace sandbox::settings
