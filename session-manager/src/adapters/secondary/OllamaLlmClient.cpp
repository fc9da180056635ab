#include "adapters/secondary/llm/OllamaLlmClient.hpp"
#include "domain/Errors.hpp"

#include <nlohmann/json.hpp>
#include <iostream>

namespace sandbox::adapters::secondary {

OllamaLlmClient::OllamaLlmClient(
    std::shared_ptr<ports::output::IHttpClient> httpClient,
    std::shared_ptr<settings::LlmSettings> settings)
    : httpClient_(std::move(httpClient))
    , settings_(std::move(settings))
    , host_("localhost")
    , port_(11434)
{
    // http://host:port[/]
    std::string url = settings_->getBaseUrl();
    auto scheme = url.find("://");
    if (scheme != std::string::npos) {
        url = url.substr(scheme + 3);
    }
    auto slash = url.find('/');
    if (slash != std::string::npos) {
        url = url.substr(0, slash);
    }
    auto colon = url.rfind(':');
    if (colon != std::string::npos) {
        host_ = url.substr(0, colon);
        port_ = std::stoi(url.substr(colon + 1));
    } else if (!url.empty()) {
        host_ = url;
        port_ = 80;
    }

    std::cout << "[OllamaLlmClient] Created, target: " << host_ << ":" << port_ << std::endl;
}

std::string OllamaLlmClient::chat(
    const std::vector<domain::ChatTurn>& turns,
    const std::string& model,
    const domain::LlmOptions& options)
{
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& turn : turns) {
        messages.push_back({
            {"role", domain::toString(turn.role)},
            {"content", turn.content}
        });
    }

    nlohmann::json body = {
        {"model", model},
        {"messages", messages},
        {"stream", false},
        {"options", {
            {"temperature", options.temperature},
            {"num_predict", options.maxTokens}
        }}
    };

    ports::output::HttpRequest request;
    request.method = "POST";
    request.host = host_;
    request.port = port_;
    request.target = "/api/chat";
    request.body = body.dump();
    request.headers = {{"Content-Type", "application/json"}};

    ports::output::HttpResponse response;
    try {
        response = httpClient_->send(request, std::chrono::seconds(settings_->getTimeoutSeconds()));
    } catch (const ports::output::HttpTimeoutError& e) {
        std::cerr << "[OllamaLlmClient] Timeout: " << e.what() << std::endl;
        throw domain::LlmTimeoutException("LLM service timed out");
    } catch (const std::exception& e) {
        std::cerr << "[OllamaLlmClient] Error: " << e.what() << std::endl;
        throw domain::LlmUnavailableException(std::string("LLM service unavailable: ") + e.what());
    }

    if (!response.isSuccess()) {
        throw domain::LlmUnavailableException(
            "LLM service unavailable: HTTP " + std::to_string(response.status));
    }

    try {
        auto json = nlohmann::json::parse(response.body);
        return json.at("message").at("content").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw domain::LlmUnavailableException(std::string("LLM service returned malformed response: ") + e.what());
    }
}

} // namespace sandbox::adapters::secondary
