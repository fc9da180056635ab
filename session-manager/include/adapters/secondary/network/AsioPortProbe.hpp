#pragma once

#include "ports/output/IPortProbe.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace sandbox::adapters::secondary {

/**
 * @brief Порт занят, если на 127.0.0.1:port удаётся установить TCP-соединение
 */
class AsioPortProbe : public ports::output::IPortProbe {
public:
    AsioPortProbe() = default;

    bool isInUse(int port) override {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::socket socket(ioc);
        boost::asio::ip::tcp::endpoint endpoint(
            boost::asio::ip::make_address("127.0.0.1"),
            static_cast<unsigned short>(port)
        );

        boost::system::error_code ec;
        socket.connect(endpoint, ec);
        if (ec) {
            return false;
        }

        socket.close(ec);
        return true;
    }
};

} // namespace sandbox::adapters::secondary
