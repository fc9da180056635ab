#pragma once

#include "ports/output/IEphemeralStore.hpp"
#include "ports/output/ISessionRegistry.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace sandbox::application {

/**
 * @brief Фоновая очистка истёкших сессий в работающем сервисе
 *
 * Раз в интервал удаляет из реестра сессии с now - createdAt > ttl
 * и каскадно чистит их разговоры и документы.
 *
 * @example
 * ```cpp
 * ExpiryReconciler reconciler(registry, store);
 * reconciler.start(std::chrono::seconds(60));
 * // ... работа сервиса ...
 * reconciler.stop();   // дожидается окончания текущей записи
 * ```
 *
 * Thread-safe: да
 */
class ExpiryReconciler {
public:
    ExpiryReconciler(
        std::shared_ptr<ports::output::ISessionRegistry> registry,
        std::shared_ptr<ports::output::IEphemeralStore> store)
        : registry_(std::move(registry))
        , store_(std::move(store))
        , running_(false)
        , sweepCount_(0)
    {}

    ~ExpiryReconciler() {
        stop();
    }

    ExpiryReconciler(const ExpiryReconciler&) = delete;
    ExpiryReconciler& operator=(const ExpiryReconciler&) = delete;

    void start(std::chrono::seconds interval) {
        if (running_.exchange(true)) {
            return;
        }

        interval_ = interval;
        workerThread_ = std::thread([this]() {
            runLoop();
        });
        std::cout << "[ExpiryReconciler] Started, interval " << interval.count() << "s" << std::endl;
    }

    /**
     * @brief Кооперативная остановка: будит поток и ждёт его завершения
     */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(wakeMutex_);
            if (!running_.exchange(false)) {
                return;
            }
        }
        wake_.notify_all();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }
        std::cout << "[ExpiryReconciler] Stopped" << std::endl;
    }

    bool isRunning() const {
        return running_.load();
    }

    uint64_t sweepCount() const {
        return sweepCount_.load();
    }

    /**
     * @brief Один проход очистки
     * @return Количество удалённых сессий
     */
    size_t sweep(const domain::Timestamp& now = domain::Timestamp::now()) {
        size_t removed = 0;

        for (const auto& sessionId : registry_->findExpired(now)) {
            try {
                size_t items = store_->clearSessionData(sessionId);
                if (registry_->remove(sessionId)) {
                    ++removed;
                    std::cout << "[ExpiryReconciler] Removed expired session " << sessionId
                              << " (" << items << " item(s))" << std::endl;
                }
            } catch (const std::exception& e) {
                std::cerr << "[ExpiryReconciler] Failed to remove " << sessionId << ": " << e.what() << std::endl;
            }
        }

        ++sweepCount_;
        return removed;
    }

private:
    std::shared_ptr<ports::output::ISessionRegistry> registry_;
    std::shared_ptr<ports::output::IEphemeralStore> store_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> sweepCount_;
    std::chrono::seconds interval_{60};
    std::thread workerThread_;

    std::mutex wakeMutex_;
    std::condition_variable wake_;

    void runLoop() {
        while (running_.load()) {
            sweep();

            std::unique_lock<std::mutex> lock(wakeMutex_);
            wake_.wait_for(lock, interval_, [this]() { return !running_.load(); });
        }
    }
};

} // namespace sandbox::application
