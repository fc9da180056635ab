#pragma once

#include "domain/ChatTurn.hpp"
#include <string>
#include <vector>

namespace sandbox::ports::output {

/**
 * @brief Клиент LLM-сервиса
 *
 * Output Port. Получает всю историю разговора, возвращает текст ответа.
 *
 * @throws domain::LlmUnavailableException при ошибке соединения или HTTP-статусе
 * @throws domain::LlmTimeoutException если сервис не ответил вовремя
 */
class ILlmClient {
public:
    virtual ~ILlmClient() = default;

    virtual std::string chat(
        const std::vector<domain::ChatTurn>& turns,
        const std::string& model,
        const domain::LlmOptions& options
    ) = 0;
};

} // namespace sandbox::ports::output
