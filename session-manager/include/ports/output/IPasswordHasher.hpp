#pragma once

#include <string>

namespace sandbox::ports::output {

/**
 * @brief Хэширование паролей
 *
 * Реализации:
 * - SodiumPasswordHasher (Argon2id)
 */
class IPasswordHasher {
public:
    virtual ~IPasswordHasher() = default;

    virtual std::string hash(const std::string& password) = 0;

    virtual bool verify(const std::string& password, const std::string& hash) = 0;
};

} // namespace sandbox::ports::output
