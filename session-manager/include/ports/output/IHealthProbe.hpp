#pragma once

#include <chrono>
#include <string>

namespace sandbox::ports::output {

struct HealthProbeResult {
    bool reachable = false;
    int statusCode = 0;
    std::string detail;
};

/**
 * @brief HTTP-проба health-эндпоинта backend
 *
 * Недостижимость возвращается как значение, исключения наружу не выходят.
 */
class IHealthProbe {
public:
    virtual ~IHealthProbe() = default;

    virtual HealthProbeResult probe(int port, const std::string& path, std::chrono::seconds timeout) = 0;
};

} // namespace sandbox::ports::output
