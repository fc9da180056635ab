#pragma once

#include <string>
#include <stdexcept>

namespace sandbox::domain {

/**
 * @brief Автор сообщения в разговоре
 */
enum class MessageRole {
    USER,       ///< Сообщение исследователя
    ASSISTANT   ///< Ответ LLM
};

inline std::string toString(MessageRole role) {
    switch (role) {
        case MessageRole::USER:      return "user";
        case MessageRole::ASSISTANT: return "assistant";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline MessageRole messageRoleFromString(const std::string& str) {
    if (str == "user")      return MessageRole::USER;
    if (str == "assistant") return MessageRole::ASSISTANT;
    throw std::invalid_argument("Unknown MessageRole: " + str);
}

} // namespace sandbox::domain
