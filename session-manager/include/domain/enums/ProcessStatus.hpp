#pragma once

#include <string>

namespace sandbox::domain {

/**
 * @brief Состояние процесса (контейнера) runtime-пары
 */
enum class ProcessStatus {
    NOT_FOUND,  ///< Контейнер не существует
    RUNNING,    ///< Работает
    EXITED,     ///< Остановлен / завершился (а также created, paused, dead и т.п.)
    ERROR       ///< Не удалось узнать состояние
};

inline std::string toString(ProcessStatus status) {
    switch (status) {
        case ProcessStatus::NOT_FOUND: return "not_found";
        case ProcessStatus::RUNNING:   return "running";
        case ProcessStatus::EXITED:    return "exited";
        case ProcessStatus::ERROR:     return "error";
    }
    return "error";
}

/**
 * @brief Сопоставить State.Status из docker inspect
 */
inline ProcessStatus processStatusFromDocker(const std::string& state) {
    if (state == "running") return ProcessStatus::RUNNING;
    if (state.empty())      return ProcessStatus::ERROR;
    return ProcessStatus::EXITED;
}

} // namespace sandbox::domain
