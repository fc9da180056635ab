#pragma once

#include <cstdlib>
#include <string>

namespace sandbox::settings {

/**
 * @brief Настройки жизненного цикла сессий
 *
 * Переменные окружения:
 * - SESSION_TTL_HOURS: время жизни новой сессии в часах (72)
 * - RECONCILE_INTERVAL_SECONDS: период фоновой очистки (60)
 * - SANDBOX_SESSIONS_DIR: каталог дескрипторов (deployment/sessions)
 * - SESSION_ID: если задан, при старте загружается только эта сессия
 */
class SessionSettings {
public:
    SessionSettings() {
        ttlHours_ = std::stoi(getEnvOrDefault("SESSION_TTL_HOURS", "72"));
        reconcileIntervalSeconds_ = std::stoi(getEnvOrDefault("RECONCILE_INTERVAL_SECONDS", "60"));
        sessionsDir_ = getEnvOrDefault("SANDBOX_SESSIONS_DIR", "deployment/sessions");
        pinnedSessionId_ = getEnvOrDefault("SESSION_ID", "");
    }

    int getTtlHours() const { return ttlHours_; }
    int getReconcileIntervalSeconds() const { return reconcileIntervalSeconds_; }
    const std::string& getSessionsDir() const { return sessionsDir_; }
    const std::string& getPinnedSessionId() const { return pinnedSessionId_; }

    // ========================================================================
    // TEST HELPERS
    // ========================================================================

    void setTtlHours(int hours) { ttlHours_ = hours; }
    void setReconcileIntervalSeconds(int seconds) { reconcileIntervalSeconds_ = seconds; }
    void setSessionsDir(const std::string& dir) { sessionsDir_ = dir; }
    void setPinnedSessionId(const std::string& id) { pinnedSessionId_ = id; }

private:
    int ttlHours_;
    int reconcileIntervalSeconds_;
    std::string sessionsDir_;
    std::string pinnedSessionId_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace sandbox::settings
