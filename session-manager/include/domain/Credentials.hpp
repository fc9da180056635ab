#pragma once

#include "Timestamp.hpp"
#include <string>

namespace sandbox::domain {

/**
 * @brief Сгенерированные учётные данные сессии
 *
 * password в открытом виде показывается администратору один раз
 * и нигде не сохраняется; в дескриптор пишется только passwordHash.
 */
struct GeneratedCredentials {
    std::string sessionId;
    std::string username;
    std::string password;
    std::string passwordHash;
};

} // namespace sandbox::domain
