#pragma once

#include "ports/output/IDescriptorStore.hpp"
#include "ports/output/ISessionRegistry.hpp"
#include "settings/SessionSettings.hpp"
#include <iostream>
#include <memory>

namespace sandbox::application {

/**
 * @brief Загрузка сессий из дескрипторов при старте сервиса
 *
 * Восстанавливаются только идентичность, учётные данные и время жизни.
 * Разговоры и документы эфемерны и после перезапуска пусты.
 * Если задан SESSION_ID, загружается только эта сессия.
 */
class SessionBootstrapper {
public:
    SessionBootstrapper(
        std::shared_ptr<ports::output::IDescriptorStore> descriptors,
        std::shared_ptr<ports::output::ISessionRegistry> registry,
        std::shared_ptr<settings::SessionSettings> settings
    ) : descriptors_(std::move(descriptors))
      , registry_(std::move(registry))
      , settings_(std::move(settings))
    {}

    /**
     * @return Количество загруженных сессий
     */
    size_t importAll() {
        const auto& pinned = settings_->getPinnedSessionId();
        auto now = domain::Timestamp::now();
        size_t imported = 0;

        for (const auto& descriptor : descriptors_->loadAll()) {
            if (!pinned.empty() && descriptor.sessionId != pinned) {
                continue;
            }
            if (descriptor.isExpired(now)) {
                std::cout << "[SessionBootstrapper] Skipping expired session " << descriptor.sessionId << std::endl;
                continue;
            }

            domain::Session session;
            session.sessionId = descriptor.sessionId;
            session.username = descriptor.username;
            session.passwordHash = descriptor.passwordHash;
            session.createdAt = descriptor.createdAt;
            session.ttl = std::chrono::hours(descriptor.ttlHours);
            session.expiresAt = domain::Timestamp(session.createdAt.value + session.ttl);
            session.active = descriptor.active;

            registry_->importSession(session);
            ++imported;
        }

        std::cout << "[SessionBootstrapper] Imported " << imported << " session(s)" << std::endl;
        return imported;
    }

private:
    std::shared_ptr<ports::output::IDescriptorStore> descriptors_;
    std::shared_ptr<ports::output::ISessionRegistry> registry_;
    std::shared_ptr<settings::SessionSettings> settings_;
};

} // namespace sandbox::application
