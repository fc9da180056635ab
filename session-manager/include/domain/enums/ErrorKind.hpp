#pragma once

#include <string>

namespace sandbox::domain {

/**
 * @brief Классы ошибок менеджера сессий
 */
enum class ErrorKind {
    NONE,
    NOT_FOUND,              ///< Сессия/разговор/документ/дескриптор отсутствует или чужой
    EXPIRED,                ///< TTL истёк
    RESOURCE_CONFLICT,      ///< Коллизия порта/подсети при bind, можно повторить с новой аллокацией
    ORCHESTRATION_FAILURE,  ///< Внешняя команда вернула ненулевой код
    UNREACHABLE,            ///< Health-проба не достучалась (значение статуса, не исключение)
    INVALID_REQUEST         ///< Некорректные аргументы операции
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                  return "none";
        case ErrorKind::NOT_FOUND:             return "not_found";
        case ErrorKind::EXPIRED:               return "expired";
        case ErrorKind::RESOURCE_CONFLICT:     return "resource_conflict";
        case ErrorKind::ORCHESTRATION_FAILURE: return "orchestration_failure";
        case ErrorKind::UNREACHABLE:           return "unreachable";
        case ErrorKind::INVALID_REQUEST:       return "invalid_request";
    }
    return "unknown";
}

/**
 * @brief Можно ли повторить операцию с новой аллокацией ресурсов
 */
inline bool isRetryable(ErrorKind kind) {
    return kind == ErrorKind::RESOURCE_CONFLICT;
}

} // namespace sandbox::domain
