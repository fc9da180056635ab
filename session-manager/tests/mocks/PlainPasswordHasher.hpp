#pragma once

#include "ports/output/IPasswordHasher.hpp"

namespace sandbox::tests::mocks {

/**
 * @brief Обратимый "хэш" для тестов, где Argon2 только замедляет
 */
class PlainPasswordHasher : public ports::output::IPasswordHasher {
public:
    std::string hash(const std::string& password) override {
        return "plain$" + password;
    }

    bool verify(const std::string& password, const std::string& hash) override {
        return hash == "plain$" + password;
    }
};

} // namespace sandbox::tests::mocks
