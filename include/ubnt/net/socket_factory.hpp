/**
 * @file socket_factory.hpp
 * @brief Creates the UDP socket used for one discovery scan.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#pragma once

#include "ubnt/net/export.hpp"
#include "ubnt/net/udp_socket.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ubnt {
namespace net {

/// Well-known UBNT discovery port, used for requests and responses.
constexpr uint16_t DISCOVERY_PORT = 10001;

/**
 * @class SocketError
 * @brief Fatal socket setup failure (anything other than "port in use").
 */
class UBNT_NET_API SocketError : public std::runtime_error {
public:
    SocketError(const std::string& what, int code)
        : std::runtime_error(what + " (error " + std::to_string(code) + ")")
        , code_(code)
    {}

    int code() const { return code_; }

private:
    int code_;
};

/**
 * @brief Create a bound, non-blocking, broadcast-capable UDP socket.
 *
 * Binds @p port first. When that port is already in use the socket is
 * bound to an OS-assigned port instead. Address reuse is switched on after
 * binding, so two sockets created here never share a port.
 *
 * @param port Preferred local port.
 * @return The bound socket; the caller owns it.
 * @throws SocketError if the socket cannot be created or bound, or an
 *         option cannot be applied.
 */
UBNT_NET_API UdpSocket createSocket(uint16_t port = DISCOVERY_PORT);

}  // namespace net
}  // namespace ubnt
