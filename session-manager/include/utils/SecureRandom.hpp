#pragma once

#include <sodium.h>

#include <array>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandbox::utils {

/**
 * @brief Криптографически стойкий генератор на libsodium
 *
 * Используется для идентификаторов сессий, учётных данных и SECRET_KEY.
 *
 * @note Thread-safe: randombytes_* безопасны при вызове из нескольких потоков
 */
class SecureRandom {
public:
    /**
     * @brief Инициализировать libsodium (повторные вызовы безопасны)
     * @throws std::runtime_error если библиотеку не удалось инициализировать
     */
    static void ensureInitialized() {
        if (sodium_init() < 0) {
            throw std::runtime_error("libsodium initialization failed");
        }
    }

    /**
     * @brief Случайные байты в виде lowercase hex
     * @param bytes Количество байт (длина строки будет 2 * bytes)
     */
    static std::string hex(size_t bytes) {
        ensureInitialized();
        std::vector<unsigned char> buffer(bytes);
        randombytes_buf(buffer.data(), buffer.size());

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (unsigned char b : buffer) {
            ss << std::setw(2) << static_cast<int>(b);
        }
        sodium_memzero(buffer.data(), buffer.size());
        return ss.str();
    }

    /**
     * @brief Равномерное число в [0, upperBound)
     */
    static uint32_t uniform(uint32_t upperBound) {
        ensureInitialized();
        return randombytes_uniform(upperBound);
    }

    /**
     * @brief Строка из символов алфавита, каждый выбран равномерно
     */
    static std::string fromAlphabet(const std::string& alphabet, size_t length) {
        if (alphabet.empty()) {
            throw std::invalid_argument("alphabet must not be empty");
        }
        std::string result;
        result.reserve(length);
        for (size_t i = 0; i < length; ++i) {
            result.push_back(alphabet[uniform(static_cast<uint32_t>(alphabet.size()))]);
        }
        return result;
    }

    /**
     * @brief Идентификатор сессии: 32 случайных байта, 64 hex-символа
     *
     * Только [0-9a-f], поэтому годится в имена контейнеров и compose-проектов.
     */
    static std::string sessionId() {
        return hex(32);
    }
};

} // namespace sandbox::utils
