#pragma once

#include "domain/Credentials.hpp"
#include "ports/output/IPasswordHasher.hpp"
#include "utils/SecureRandom.hpp"
#include <memory>

namespace sandbox::application {

/**
 * @brief Генерация учётных данных исследователя
 *
 * username: researcher_<8 hex>
 * password: 16 символов из букв, цифр и !@#$%^&*
 * Открытый пароль возвращается один раз, дальше живёт только хэш.
 */
class CredentialProvisioner {
public:
    static constexpr size_t PASSWORD_LENGTH = 16;

    explicit CredentialProvisioner(std::shared_ptr<ports::output::IPasswordHasher> hasher)
        : hasher_(std::move(hasher))
    {}

    domain::GeneratedCredentials generate() {
        domain::GeneratedCredentials credentials;
        credentials.username = "researcher_" + utils::SecureRandom::hex(4);
        credentials.password = utils::SecureRandom::fromAlphabet(passwordAlphabet(), PASSWORD_LENGTH);
        credentials.passwordHash = hasher_->hash(credentials.password);
        return credentials;
    }

    /**
     * @brief SECRET_KEY для .env runtime-пары
     */
    std::string generateSecretKey() const {
        return utils::SecureRandom::hex(32);
    }

    static const std::string& passwordAlphabet() {
        static const std::string alphabet =
            "abcdefghijklmnopqrstuvwxyz"
            "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
            "0123456789"
            "!@#$%^&*";
        return alphabet;
    }

private:
    std::shared_ptr<ports::output::IPasswordHasher> hasher_;
};

} // namespace sandbox::application
