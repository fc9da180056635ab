#pragma once

#include "ports/output/ISessionRegistry.hpp"
#include "settings/SessionSettings.hpp"
#include "utils/SecureRandom.hpp"
#include <iostream>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace sandbox::adapters::secondary {

/**
 * @brief Реестр сессий в памяти процесса
 *
 * Один мьютекс на все операции. Наружу отдаются копии Session,
 * поэтому конкурентные читатели не видят промежуточных состояний.
 */
class InMemorySessionRegistry : public ports::output::ISessionRegistry {
public:
    explicit InMemorySessionRegistry(std::shared_ptr<settings::SessionSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[InMemorySessionRegistry] Created (TTL "
                  << settings_->getTtlHours() << "h)" << std::endl;
    }

    std::string create(const std::string& username, const std::string& passwordHash) override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string sessionId;
        do {
            sessionId = utils::SecureRandom::sessionId();
        } while (sessions_.count(sessionId) > 0);

        domain::Session session(
            sessionId, username, passwordHash,
            domain::Timestamp::now(),
            std::chrono::hours(settings_->getTtlHours())
        );
        sessions_[sessionId] = session;
        return sessionId;
    }

    void importSession(const domain::Session& session) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[session.sessionId] = session;
    }

    std::optional<domain::Session> get(const std::string& sessionId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<domain::Session> findByUsername(const std::string& username) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            if (session.username == username) {
                return session;
            }
        }
        return std::nullopt;
    }

    bool markInactive(const std::string& sessionId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) return false;
        it->second.active = false;
        return true;
    }

    bool markActive(const std::string& sessionId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) return false;
        it->second.active = true;
        return true;
    }

    std::optional<std::chrono::seconds> timeRemaining(const std::string& sessionId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) return std::nullopt;
        return it->second.timeRemaining();
    }

    bool remove(const std::string& sessionId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.erase(sessionId) > 0;
    }

    bool attachConversation(const std::string& sessionId, const std::string& conversationId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) return false;
        it->second.conversationIds.insert(conversationId);
        return true;
    }

    bool detachConversation(const std::string& sessionId, const std::string& conversationId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) return false;
        return it->second.conversationIds.erase(conversationId) > 0;
    }

    bool attachDocument(const std::string& sessionId, const std::string& documentId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) return false;
        it->second.documentIds.insert(documentId);
        return true;
    }

    bool detachDocument(const std::string& sessionId, const std::string& documentId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) return false;
        return it->second.documentIds.erase(documentId) > 0;
    }

    std::vector<std::string> listIds() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        ids.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            ids.push_back(id);
        }
        return ids;
    }

    std::vector<std::string> findExpired(const domain::Timestamp& now) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> expired;
        for (const auto& [id, session] : sessions_) {
            if (session.isExpired(now)) {
                expired.push_back(id);
            }
        }
        return expired;
    }

    size_t size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.clear();
    }

private:
    std::shared_ptr<settings::SessionSettings> settings_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::Session> sessions_;
};

} // namespace sandbox::adapters::secondary
