#pragma once

#include "ports/output/IHealthProbe.hpp"
#include "ports/output/IHttpClient.hpp"
#include <memory>

namespace sandbox::adapters::secondary {

/**
 * @brief Проба GET http://localhost:<port><path>
 *
 * Доступен = ответ 2xx. Таймаут и ошибка соединения дают reachable=false
 * с причиной в detail.
 */
class HttpHealthProbe : public ports::output::IHealthProbe {
public:
    explicit HttpHealthProbe(std::shared_ptr<ports::output::IHttpClient> httpClient)
        : httpClient_(std::move(httpClient))
    {}

    ports::output::HealthProbeResult probe(int port, const std::string& path, std::chrono::seconds timeout) override {
        ports::output::HealthProbeResult result;

        ports::output::HttpRequest request;
        request.method = "GET";
        request.host = "localhost";
        request.port = port;
        request.target = path;

        try {
            auto response = httpClient_->send(request, timeout);
            result.statusCode = response.status;
            result.reachable = response.isSuccess();
            result.detail = "HTTP " + std::to_string(response.status);
        } catch (const ports::output::HttpTimeoutError& e) {
            result.reachable = false;
            result.detail = std::string("timeout: ") + e.what();
        } catch (const std::exception& e) {
            result.reachable = false;
            result.detail = e.what();
        }

        return result;
    }

private:
    std::shared_ptr<ports::output::IHttpClient> httpClient_;
};

} // namespace sandbox::adapters::secondary
