#pragma once

#include <cstdlib>
#include <string>

namespace sandbox::settings {

/**
 * @brief Настройки LLM-сервиса (Ollama)
 *
 * - OLLAMA_BASE_URL (http://localhost:11434)
 * - LLM_MODEL (llama3:8b)
 * - LLM_TEMPERATURE (0.7)
 * - LLM_MAX_TOKENS (4096)
 * - LLM_TIMEOUT_SECONDS (30)
 */
class LlmSettings {
public:
    LlmSettings() {
        baseUrl_ = getEnvOrDefault("OLLAMA_BASE_URL", "http://localhost:11434");
        model_ = getEnvOrDefault("LLM_MODEL", "llama3:8b");
        temperature_ = std::stod(getEnvOrDefault("LLM_TEMPERATURE", "0.7"));
        maxTokens_ = std::stoi(getEnvOrDefault("LLM_MAX_TOKENS", "4096"));
        timeoutSeconds_ = std::stoi(getEnvOrDefault("LLM_TIMEOUT_SECONDS", "30"));
    }

    const std::string& getBaseUrl() const { return baseUrl_; }
    const std::string& getModel() const { return model_; }
    double getTemperature() const { return temperature_; }
    int getMaxTokens() const { return maxTokens_; }
    int getTimeoutSeconds() const { return timeoutSeconds_; }

private:
    std::string baseUrl_;
    std::string model_;
    double temperature_;
    int maxTokens_;
    int timeoutSeconds_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace sandbox::settings
