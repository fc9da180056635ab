#pragma once

#include "domain/TokenClaims.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace sandbox::ports::output {

/**
 * @brief Выпуск и проверка токенов сессии
 *
 * Output Port. Криптография токенов вне рамок менеджера сессий.
 *
 * Реализации:
 * - FakeJwtAdapter
 */
class ITokenProvider {
public:
    virtual ~ITokenProvider() = default;

    /**
     * @param subject username (claim sub)
     * @param sessionId claim session_id
     * @param lifetime Время жизни токена
     */
    virtual std::string issue(
        const std::string& subject,
        const std::string& sessionId,
        std::chrono::seconds lifetime
    ) = 0;

    /**
     * @return Claims или nullopt если токен битый, истёк или отозван
     */
    virtual std::optional<domain::TokenClaims> verify(const std::string& token) = 0;

    virtual void revoke(const std::string& token) = 0;
};

} // namespace sandbox::ports::output
