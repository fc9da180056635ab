#pragma once

namespace sandbox::ports::output {

/**
 * @brief Проверка занятости локального TCP-порта
 */
class IPortProbe {
public:
    virtual ~IPortProbe() = default;

    /**
     * @return true если на 127.0.0.1:port кто-то принимает соединения
     */
    virtual bool isInUse(int port) = 0;
};

} // namespace sandbox::ports::output
