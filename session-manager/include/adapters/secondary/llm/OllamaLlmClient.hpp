#pragma once

#include "ports/output/ILlmClient.hpp"
#include "ports/output/IHttpClient.hpp"
#include "settings/LlmSettings.hpp"
#include <memory>

namespace sandbox::adapters::secondary {

/**
 * @brief Клиент Ollama: POST /api/chat без стриминга
 *
 * Запрос:
 * {"model": "...", "messages": [{"role": "user", "content": "..."}],
 *  "stream": false, "options": {"temperature": 0.7, "num_predict": 4096}}
 *
 * Ответ: {"message": {"role": "assistant", "content": "..."}, ...}
 */
class OllamaLlmClient : public ports::output::ILlmClient {
public:
    OllamaLlmClient(
        std::shared_ptr<ports::output::IHttpClient> httpClient,
        std::shared_ptr<settings::LlmSettings> settings
    );

    std::string chat(
        const std::vector<domain::ChatTurn>& turns,
        const std::string& model,
        const domain::LlmOptions& options
    ) override;

private:
    std::shared_ptr<ports::output::IHttpClient> httpClient_;
    std::shared_ptr<settings::LlmSettings> settings_;
    std::string host_;
    int port_;
};

} // namespace sandbox::adapters::secondary
