#pragma once

#include "enums/ErrorKind.hpp"
#include <stdexcept>
#include <string>

namespace sandbox::domain {

/**
 * @brief Базовое исключение менеджера сессий
 */
class SandboxException : public std::runtime_error {
public:
    SandboxException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Объект не найден или принадлежит другой сессии
 *
 * Чужой объект и отсутствующий объект неразличимы для вызывающего.
 */
class NotFoundException : public SandboxException {
public:
    explicit NotFoundException(const std::string& message)
        : SandboxException(ErrorKind::NOT_FOUND, message) {}
};

class ExpiredException : public SandboxException {
public:
    explicit ExpiredException(const std::string& message)
        : SandboxException(ErrorKind::EXPIRED, message) {}
};

/**
 * @brief Не удалось выделить порт/подсеть или runtime не смог их занять
 */
class ResourceConflictException : public SandboxException {
public:
    explicit ResourceConflictException(const std::string& message)
        : SandboxException(ErrorKind::RESOURCE_CONFLICT, message) {}
};

/**
 * @brief Внешняя команда оркестрации завершилась с ошибкой
 */
class OrchestrationException : public SandboxException {
public:
    OrchestrationException(const std::string& message, std::string diagnostics)
        : SandboxException(ErrorKind::ORCHESTRATION_FAILURE, message)
        , diagnostics_(std::move(diagnostics)) {}

    const std::string& diagnostics() const { return diagnostics_; }

private:
    std::string diagnostics_;
};

/**
 * @brief LLM-сервис недоступен (ошибка соединения или HTTP-статус)
 */
class LlmUnavailableException : public std::runtime_error {
public:
    explicit LlmUnavailableException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief LLM-сервис не ответил за отведённое время
 */
class LlmTimeoutException : public std::runtime_error {
public:
    explicit LlmTimeoutException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace sandbox::domain
