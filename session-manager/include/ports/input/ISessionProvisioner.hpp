#pragma once

#include "domain/Credentials.hpp"
#include "domain/ResourceAllocation.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/ErrorKind.hpp"
#include <string>
#include <vector>

namespace sandbox::ports::input {

/**
 * @brief Результат создания одной сессии
 *
 * credentials.password виден только здесь и нигде не сохраняется.
 */
struct ProvisionResult {
    bool success = false;
    domain::GeneratedCredentials credentials;
    domain::ResourceAllocation allocation;
    domain::Timestamp expiresAt;
    bool runtimeStarted = false;
    int attempts = 0;
    domain::ErrorKind errorKind = domain::ErrorKind::NONE;
    std::string message;
};

/**
 * @brief Выдача новых сессий администратором
 */
class ISessionProvisioner {
public:
    virtual ~ISessionProvisioner() = default;

    virtual ProvisionResult provision(bool startRuntime) = 0;

    /**
     * @brief Создать несколько сессий; сбой одной не прерывает остальные
     */
    virtual std::vector<ProvisionResult> provisionBatch(int count, bool startRuntime) = 0;
};

} // namespace sandbox::ports::input
