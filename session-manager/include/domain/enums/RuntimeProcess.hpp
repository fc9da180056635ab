#pragma once

#include <string>
#include <optional>

namespace sandbox::domain {

/**
 * @brief Процесс из runtime-пары сессии
 */
enum class RuntimeProcess {
    BACKEND,
    FRONTEND
};

inline std::string toString(RuntimeProcess process) {
    switch (process) {
        case RuntimeProcess::BACKEND:  return "backend";
        case RuntimeProcess::FRONTEND: return "frontend";
    }
    return "backend";
}

inline std::optional<RuntimeProcess> runtimeProcessFromString(const std::string& str) {
    if (str == "backend")  return RuntimeProcess::BACKEND;
    if (str == "frontend") return RuntimeProcess::FRONTEND;
    return std::nullopt;
}

} // namespace sandbox::domain
