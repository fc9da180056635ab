#pragma once

#include "Timestamp.hpp"
#include "enums/MessageRole.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sandbox::domain {

/**
 * @brief Сообщение разговора
 *
 * documentContents хранит снимок подготовленного текста документов
 * на момент отправки: удаление документа не меняет историю.
 */
struct Message {
    int64_t sequence = 0;   ///< Монотонный идентификатор внутри хранилища
    MessageRole role = MessageRole::USER;
    std::string content;
    Timestamp timestamp;
    std::vector<std::string> documentIds;
    std::map<std::string, std::string> documentContents;    ///< documentId -> текст
};

/**
 * @brief Разговор внутри сессии
 */
struct Conversation {
    std::string id;
    std::string sessionId;
    Timestamp createdAt;
    Timestamp updatedAt;
    std::vector<Message> messages;  ///< По возрастанию sequence
};

} // namespace sandbox::domain
