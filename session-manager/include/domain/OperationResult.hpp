#pragma once

#include "enums/ErrorKind.hpp"
#include <string>

namespace sandbox::domain {

/**
 * @brief Результат управляющей операции над сессией
 *
 * При ошибке message содержит причину (stderr внешней команды и т.п.).
 */
struct OperationResult {
    bool success = false;
    ErrorKind errorKind = ErrorKind::NONE;
    std::string message;

    static OperationResult ok(const std::string& message = "") {
        return {true, ErrorKind::NONE, message};
    }

    static OperationResult fail(ErrorKind kind, const std::string& message) {
        return {false, kind, message};
    }

    bool isRetryable() const {
        return !success && domain::isRetryable(errorKind);
    }
};

} // namespace sandbox::domain
