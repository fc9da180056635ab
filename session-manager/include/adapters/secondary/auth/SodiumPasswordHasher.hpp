#pragma once

#include "ports/output/IPasswordHasher.hpp"
#include "utils/SecureRandom.hpp"

#include <sodium.h>
#include <stdexcept>

namespace sandbox::adapters::secondary {

/**
 * @brief Хэши паролей Argon2id (crypto_pwhash_str)
 *
 * Строка хэша самодостаточна: соль и параметры лежат внутри "$argon2id$...".
 */
class SodiumPasswordHasher : public ports::output::IPasswordHasher {
public:
    SodiumPasswordHasher() {
        utils::SecureRandom::ensureInitialized();
    }

    std::string hash(const std::string& password) override {
        char out[crypto_pwhash_STRBYTES];
        if (crypto_pwhash_str(out, password.data(), password.size(),
                              crypto_pwhash_OPSLIMIT_INTERACTIVE,
                              crypto_pwhash_MEMLIMIT_INTERACTIVE) != 0) {
            throw std::runtime_error("Password hashing failed: out of memory");
        }
        return std::string(out);
    }

    bool verify(const std::string& password, const std::string& hash) override {
        if (hash.empty() || hash.size() >= crypto_pwhash_STRBYTES) {
            return false;
        }
        return crypto_pwhash_str_verify(hash.c_str(), password.data(), password.size()) == 0;
    }
};

} // namespace sandbox::adapters::secondary
