/**
 * @file PortProbe.cpp
 * @brief TCP connect probe implementation
 *
 * One io_context per probe: async_connect is raced against run_for(timeout),
 * and a probe that has not completed is cancelled by closing the socket.
 */

#include "PortProbe.hpp"
#include "../logging/Logger.hpp"
#include <boost/asio.hpp>

namespace ur_teleop {
namespace network {

using boost::asio::ip::tcp;

bool probePort(const std::string& ip, uint16_t port, std::chrono::milliseconds timeout) {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(ip, ec);
    if (ec) {
        LOG_DEBUG("probePort: invalid address '{}': {}", ip, ec.message());
        return false;
    }

    try {
        boost::asio::io_context ioContext;
        tcp::socket socket(ioContext);

        boost::system::error_code result = boost::asio::error::would_block;
        socket.async_connect(tcp::endpoint(address, port),
            [&result](const boost::system::error_code& connectEc) {
                result = connectEc;
            });

        ioContext.run_for(timeout);

        if (result == boost::asio::error::would_block) {
            // Timed out - cancel the pending connect and let the handler run
            boost::system::error_code closeEc;
            socket.close(closeEc);
            ioContext.restart();
            ioContext.run();
            LOG_TRACE("probePort: {}:{} timed out", ip, port);
            return false;
        }

        if (result) {
            LOG_TRACE("probePort: {}:{} -> {}", ip, port, result.message());
            return false;
        }

        boost::system::error_code closeEc;
        socket.shutdown(tcp::socket::shutdown_both, closeEc);
        socket.close(closeEc);
        return true;

    } catch (const std::exception& e) {
        LOG_WARN("probePort: {}:{} failed: {}", ip, port, e.what());
        return false;
    }
}

} // namespace network
} // namespace ur_teleop
