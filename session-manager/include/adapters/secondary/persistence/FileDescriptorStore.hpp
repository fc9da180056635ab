#pragma once

#include "ports/output/IDescriptorStore.hpp"
#include "settings/SessionSettings.hpp"
#include "settings/RuntimeSettings.hpp"
#include <memory>
#include <mutex>

namespace sandbox::adapters::secondary {

/**
 * @brief Дескрипторы сессий в файловой системе
 *
 * Раскладка:
 * <SANDBOX_SESSIONS_DIR>/<session_id>/session.json
 * <SANDBOX_SESSIONS_DIR>/<session_id>/.env
 *
 * Файлы пишутся во временный файл рядом и переименовываются,
 * так что читатель никогда не видит половину JSON.
 * update() берёт flock на <session_id>/.lock: другие процессы
 * (sandbox-ctl, sandbox-cleanup) ждут, пока правка не будет записана.
 */
class FileDescriptorStore : public ports::output::IDescriptorStore {
public:
    FileDescriptorStore(
        std::shared_ptr<settings::SessionSettings> sessionSettings,
        std::shared_ptr<settings::RuntimeSettings> runtimeSettings
    );

    void save(const domain::SessionDescriptor& descriptor) override;
    std::optional<domain::SessionDescriptor> load(const std::string& sessionId) override;
    std::vector<domain::SessionDescriptor> loadAll() override;
    std::optional<domain::SessionDescriptor> update(const std::string& sessionId, const Mutator& mutator) override;
    bool exists(const std::string& sessionId) override;
    bool remove(const std::string& sessionId) override;
    void writeEnvFile(const domain::SessionDescriptor& descriptor, const std::string& secretKey) override;
    std::optional<std::string> envFilePath(const std::string& sessionId) override;
    std::string sessionDir(const std::string& sessionId) const override;

private:
    std::shared_ptr<settings::SessionSettings> sessionSettings_;
    std::shared_ptr<settings::RuntimeSettings> runtimeSettings_;
    std::mutex writeMutex_;

    void writeDescriptor(const domain::SessionDescriptor& descriptor);
    static void writeAtomically(const std::string& path, const std::string& content);
    static bool isSafeSessionId(const std::string& sessionId);
};

} // namespace sandbox::adapters::secondary
