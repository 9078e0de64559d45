/**
 * @file udp_socket.hpp
 * @brief Cross-platform UDP socket for discovery traffic.
 *
 * RAII wrapper around a UDP socket with broadcast, address reuse,
 * non-blocking mode and timeout-based receive.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#pragma once

#include "ubnt/net/export.hpp"
#include "ubnt/net/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace ubnt {
namespace net {

/**
 * @struct SocketAddress
 * @brief IP address and port pair.
 */
struct UBNT_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
};

/**
 * @class UdpSocket
 * @brief RAII UDP socket wrapper.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * sock.bind(10001);
 * sock.setBroadcast(true);
 * sock.sendTo(SocketAddress("255.255.255.255", 10001), payload.data(), payload.size());
 *
 * std::vector<uint8_t> buffer(1500);
 * SocketAddress sender;
 * int received = sock.receiveFrom(buffer.data(), buffer.size(), 100, sender);
 * @endcode
 */
class UBNT_NET_API UdpSocket {
public:
    /**
     * @brief Create an unbound UDP socket.
     */
    UdpSocket();

    /**
     * @brief Destructor - closes the socket.
     */
    ~UdpSocket();

    // Non-copyable, but movable
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief Bind the socket to a local port.
     * @param port The port to bind to (0 for auto-assign).
     * @param address The local address to bind to (default: any).
     * @return True on success. On failure getLastError() holds the cause.
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /**
     * @brief Get the local port the socket is bound to (0 if unbound).
     */
    uint16_t getLocalPort() const;

    /**
     * @brief Enable address reuse (SO_REUSEADDR).
     */
    bool setReuseAddress(bool enable);

    /**
     * @brief Query SO_REUSEADDR.
     */
    bool isReuseAddress() const;

    /**
     * @brief Enable broadcast sending.
     */
    bool setBroadcast(bool enable);

    /**
     * @brief Switch the descriptor to non-blocking mode.
     */
    bool setNonBlocking(bool enable);

    /**
     * @brief Send data to an address.
     * @return Number of bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Receive data with timeout.
     * @param buffer Buffer to receive into.
     * @param bufferSize Size of the buffer.
     * @param timeoutMs Timeout in milliseconds (0 = poll, -1 = infinite).
     * @param sender Output: address of the sender.
     * @return Number of bytes received, 0 on timeout or empty datagram,
     *         -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    void close();

    /**
     * @brief Get the last socket error code.
     */
    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    void setLastError();
};

}  // namespace net
}  // namespace ubnt
