#pragma once

#include "domain/SessionDescriptor.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sandbox::ports::output {

/**
 * @brief Хранилище дескрипторов сессий на диске
 *
 * Output Port. Каталог на сессию: session.json и .env для runtime-пары.
 * Запись атомарна: читатель видит либо старую, либо новую версию файла.
 */
class IDescriptorStore {
public:
    /**
     * @brief Правка дескриптора на месте; false, если записывать нечего
     */
    using Mutator = std::function<bool(domain::SessionDescriptor&)>;

    virtual ~IDescriptorStore() = default;

    virtual void save(const domain::SessionDescriptor& descriptor) = 0;

    virtual std::optional<domain::SessionDescriptor> load(const std::string& sessionId) = 0;

    /**
     * @brief Все читаемые дескрипторы; битые файлы пропускаются с предупреждением
     */
    virtual std::vector<domain::SessionDescriptor> loadAll() = 0;

    /**
     * @brief Перечитать, изменить и записать дескриптор под блокировкой сессии
     *
     * Блокировка общая для всех процессов, работающих с каталогом сессий,
     * поэтому параллельные правки разных полей не теряют друг друга.
     * Mutator вызывается со свежей версией файла и должен быть быстрым.
     *
     * @return Дескриптор после правки; nullopt, если дескриптора нет
     */
    virtual std::optional<domain::SessionDescriptor> update(
        const std::string& sessionId,
        const Mutator& mutator
    ) = 0;

    virtual bool exists(const std::string& sessionId) = 0;

    /**
     * @brief Удалить каталог сессии целиком
     * @return false если каталога не было
     */
    virtual bool remove(const std::string& sessionId) = 0;

    /**
     * @brief Записать .env для docker-compose
     */
    virtual void writeEnvFile(const domain::SessionDescriptor& descriptor, const std::string& secretKey) = 0;

    virtual std::optional<std::string> envFilePath(const std::string& sessionId) = 0;

    virtual std::string sessionDir(const std::string& sessionId) const = 0;
};

} // namespace sandbox::ports::output
