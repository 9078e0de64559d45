/**
 * @file socket_factory.cpp
 * @brief Discovery socket creation with port fallback.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#include "ubnt/net/socket_factory.hpp"
#include "ubnt/utils/logger.hpp"

namespace ubnt {
namespace net {

UdpSocket createSocket(uint16_t port) {
    UdpSocket socket;
    if (!socket.isValid()) {
        throw SocketError("Failed to create UDP socket", socket.getLastError());
    }

    if (!socket.bind(port)) {
        if (!isAddressInUse(socket.getLastError())) {
            throw SocketError("Failed to bind UDP port " + std::to_string(port),
                              socket.getLastError());
        }

        LOG_DEBUG("SocketFactory", "Port {} is not available, using an ephemeral port", port);
        if (!socket.bind(0)) {
            throw SocketError("Failed to bind ephemeral UDP port", socket.getLastError());
        }
    }

    if (!socket.setReuseAddress(true)) {
        throw SocketError("Failed to set SO_REUSEADDR", socket.getLastError());
    }
    if (!socket.setBroadcast(true)) {
        throw SocketError("Failed to set SO_BROADCAST", socket.getLastError());
    }
    if (!socket.setNonBlocking(true)) {
        throw SocketError("Failed to set non-blocking mode", socket.getLastError());
    }

    LOG_DEBUG("SocketFactory", "Discovery socket ready on port {}", socket.getLocalPort());
    return socket;
}

}  // namespace net
}  // namespace ubnt
