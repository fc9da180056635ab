#pragma once

#include "enums/MessageRole.hpp"
#include <string>

namespace sandbox::domain {

/**
 * @brief Одна реплика истории, передаваемая LLM
 */
struct ChatTurn {
    MessageRole role = MessageRole::USER;
    std::string content;
};

struct LlmOptions {
    double temperature = 0.7;
    int maxTokens = 4096;
};

} // namespace sandbox::domain
