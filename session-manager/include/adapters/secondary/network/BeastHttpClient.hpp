#pragma once

#include "ports/output/IHttpClient.hpp"

namespace sandbox::adapters::secondary {

/**
 * @brief HTTP-клиент на Boost.Beast
 *
 * Одно соединение на запрос, таймаут покрывает resolve, connect, write и read.
 */
class BeastHttpClient : public ports::output::IHttpClient {
public:
    BeastHttpClient() = default;

    ports::output::HttpResponse send(
        const ports::output::HttpRequest& request,
        std::chrono::seconds timeout
    ) override;
};

} // namespace sandbox::adapters::secondary
