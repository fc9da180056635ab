#pragma once

#include "Timestamp.hpp"
#include <string>

namespace sandbox::domain {

/**
 * @brief Claims токена сессии
 */
struct TokenClaims {
    std::string subject;    ///< username
    std::string sessionId;
    Timestamp expiresAt;
};

} // namespace sandbox::domain
