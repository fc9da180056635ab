#pragma once

#include <cstdlib>
#include <string>

namespace sandbox::settings {

/**
 * @brief Настройки runtime-пары и выделения ресурсов
 *
 * Переменные окружения:
 * - SANDBOX_PROJECT_ROOT: рабочий каталог для docker-compose (.)
 * - COMPOSE_FILE: файл описания пары (docker-compose.yml)
 * - DOCKER_BIN / DOCKER_COMPOSE_BIN: исполняемые файлы (docker / docker-compose)
 * - CONTAINER_PREFIX: префикс имён контейнеров (research_sandbox)
 * - BACKEND_PORT_BASE / FRONTEND_PORT_BASE: начало поиска портов (8000 / 3000)
 * - PORT_PROBE_LIMIT: сколько портов проверять после базового (1000)
 * - SUBNET_MAX_ATTEMPTS: попыток на каждый пул подсетей (100)
 * - HEALTH_TIMEOUT_SECONDS: таймаут HTTP-пробы /health (5)
 * - RESTART_PAUSE_SECONDS: пауза между stop и start при restart (2)
 * - LOG_TAIL_LINES: сколько строк лога показывать (50)
 * - PROVISION_MAX_ATTEMPTS: попыток запуска при конфликте ресурсов (3)
 */
class RuntimeSettings {
public:
    RuntimeSettings() {
        projectRoot_ = getEnvOrDefault("SANDBOX_PROJECT_ROOT", ".");
        composeFile_ = getEnvOrDefault("COMPOSE_FILE", "docker-compose.yml");
        dockerBin_ = getEnvOrDefault("DOCKER_BIN", "docker");
        dockerComposeBin_ = getEnvOrDefault("DOCKER_COMPOSE_BIN", "docker-compose");
        containerPrefix_ = getEnvOrDefault("CONTAINER_PREFIX", "research_sandbox");
        backendPortBase_ = std::stoi(getEnvOrDefault("BACKEND_PORT_BASE", "8000"));
        frontendPortBase_ = std::stoi(getEnvOrDefault("FRONTEND_PORT_BASE", "3000"));
        portProbeLimit_ = std::stoi(getEnvOrDefault("PORT_PROBE_LIMIT", "1000"));
        subnetMaxAttempts_ = std::stoi(getEnvOrDefault("SUBNET_MAX_ATTEMPTS", "100"));
        healthTimeoutSeconds_ = std::stoi(getEnvOrDefault("HEALTH_TIMEOUT_SECONDS", "5"));
        restartPauseSeconds_ = std::stoi(getEnvOrDefault("RESTART_PAUSE_SECONDS", "2"));
        logTailLines_ = std::stoi(getEnvOrDefault("LOG_TAIL_LINES", "50"));
        provisionMaxAttempts_ = std::stoi(getEnvOrDefault("PROVISION_MAX_ATTEMPTS", "3"));
    }

    const std::string& getProjectRoot() const { return projectRoot_; }
    const std::string& getComposeFile() const { return composeFile_; }
    const std::string& getDockerBin() const { return dockerBin_; }
    const std::string& getDockerComposeBin() const { return dockerComposeBin_; }
    const std::string& getContainerPrefix() const { return containerPrefix_; }
    int getBackendPortBase() const { return backendPortBase_; }
    int getFrontendPortBase() const { return frontendPortBase_; }
    int getPortProbeLimit() const { return portProbeLimit_; }
    int getSubnetMaxAttempts() const { return subnetMaxAttempts_; }
    int getHealthTimeoutSeconds() const { return healthTimeoutSeconds_; }
    int getRestartPauseSeconds() const { return restartPauseSeconds_; }
    int getLogTailLines() const { return logTailLines_; }
    int getProvisionMaxAttempts() const { return provisionMaxAttempts_; }

    // ========================================================================
    // TEST HELPERS
    // ========================================================================

    void setProjectRoot(const std::string& root) { projectRoot_ = root; }
    void setComposeFile(const std::string& file) { composeFile_ = file; }
    void setDockerBin(const std::string& bin) { dockerBin_ = bin; }
    void setDockerComposeBin(const std::string& bin) { dockerComposeBin_ = bin; }
    void setContainerPrefix(const std::string& prefix) { containerPrefix_ = prefix; }
    void setBackendPortBase(int port) { backendPortBase_ = port; }
    void setFrontendPortBase(int port) { frontendPortBase_ = port; }
    void setPortProbeLimit(int limit) { portProbeLimit_ = limit; }
    void setSubnetMaxAttempts(int attempts) { subnetMaxAttempts_ = attempts; }
    void setHealthTimeoutSeconds(int seconds) { healthTimeoutSeconds_ = seconds; }
    void setRestartPauseSeconds(int seconds) { restartPauseSeconds_ = seconds; }
    void setLogTailLines(int lines) { logTailLines_ = lines; }
    void setProvisionMaxAttempts(int attempts) { provisionMaxAttempts_ = attempts; }

private:
    std::string projectRoot_;
    std::string composeFile_;
    std::string dockerBin_;
    std::string dockerComposeBin_;
    std::string containerPrefix_;
    int backendPortBase_;
    int frontendPortBase_;
    int portProbeLimit_;
    int subnetMaxAttempts_;
    int healthTimeoutSeconds_;
    int restartPauseSeconds_;
    int logTailLines_;
    int provisionMaxAttempts_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace sandbox::settings
