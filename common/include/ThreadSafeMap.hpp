#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include <utility>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасная hash-map с shared_ptr значениями
 *
 * Чтение под shared_lock, запись под unique_lock.
 * tryInsert() даёт атомарный "проверить и занять"; на нём построено
 * резервирование портов и подсетей внутри процесса.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    /**
     * @brief Вставить, только если ключа ещё нет
     * @return true если значение вставлено, false если ключ уже занят
     */
    bool tryInsert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.emplace(key, value).second;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    bool remove(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * @brief Удалить все элементы, удовлетворяющие предикату
     * @return Количество удалённых элементов
     */
    size_t removeIf(const std::function<bool(const K &, const V &)> &predicate)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = map_.begin(); it != map_.end();)
        {
            if (it->second && predicate(it->first, *it->second))
            {
                it = map_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    /**
     * @brief Снимок всех пар (копия, безопасна для итерации без блокировки)
     */
    std::vector<std::pair<K, std::shared_ptr<V>>> getAll() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return {map_.begin(), map_.end()};
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
