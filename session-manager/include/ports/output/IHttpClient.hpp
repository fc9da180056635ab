#pragma once

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>

namespace sandbox::ports::output {

struct HttpRequest {
    std::string method = "GET";
    std::string host;
    int port = 80;
    std::string target = "/";
    std::string body;
    std::map<std::string, std::string> headers;
};

struct HttpResponse {
    int status = 0;
    std::string body;

    bool isSuccess() const { return status >= 200 && status < 300; }
};

/**
 * @brief Истёк таймаут HTTP-запроса
 */
class HttpTimeoutError : public std::runtime_error {
public:
    explicit HttpTimeoutError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Синхронный HTTP/1.1 клиент
 *
 * @throws HttpTimeoutError если запрос не уложился в таймаут
 * @throws std::runtime_error при ошибке соединения
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse send(const HttpRequest& request, std::chrono::seconds timeout) = 0;
};

} // namespace sandbox::ports::output
