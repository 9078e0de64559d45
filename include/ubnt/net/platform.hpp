/**
 * @file platform.hpp
 * @brief Cross-platform socket type definitions and includes.
 *
 * Abstracts Windows Winsock2 and POSIX socket APIs into a common interface.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#pragma once

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <WinSock2.h>
    #include <WS2tcpip.h>

    #pragma comment(lib, "Ws2_32.lib")

    namespace ubnt {
    namespace net {
        using SocketHandle = SOCKET;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = INVALID_SOCKET;

        inline int getLastSocketError() { return WSAGetLastError(); }
        inline void closeSocket(SocketHandle s) { ::closesocket(s); }
        inline bool isAddressInUse(int error) { return error == WSAEADDRINUSE; }
        inline bool isWouldBlock(int error) { return error == WSAEWOULDBLOCK; }

        inline bool setSocketNonBlocking(SocketHandle s, bool enable) {
            u_long mode = enable ? 1 : 0;
            return ::ioctlsocket(s, FIONBIO, &mode) == 0;
        }

        inline bool initializeSockets() {
            WSADATA wsaData;
            return WSAStartup(MAKEWORD(2, 2), &wsaData) == 0;
        }

        inline void cleanupSockets() {
            WSACleanup();
        }
    }  // namespace net
    }  // namespace ubnt

#else
    #include <arpa/inet.h>
    #include <errno.h>
    #include <fcntl.h>
    #include <netinet/in.h>
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <unistd.h>

    namespace ubnt {
    namespace net {
        using SocketHandle = int;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

        inline int getLastSocketError() { return errno; }
        inline void closeSocket(SocketHandle s) { ::close(s); }
        inline bool isAddressInUse(int error) { return error == EADDRINUSE; }
        inline bool isWouldBlock(int error) { return error == EAGAIN || error == EWOULDBLOCK; }

        inline bool setSocketNonBlocking(SocketHandle s, bool enable) {
            int flags = ::fcntl(s, F_GETFL, 0);
            if (flags < 0) {
                return false;
            }
            flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
            return ::fcntl(s, F_SETFL, flags) == 0;
        }

        // No initialization needed on POSIX
        inline bool initializeSockets() { return true; }
        inline void cleanupSockets() {}
    }  // namespace net
    }  // namespace ubnt

#endif

namespace ubnt {
namespace net {

/**
 * @brief RAII helper for socket initialization.
 *
 * Create one instance at program startup to ensure
 * proper Winsock initialization on Windows.
 */
class SocketInitializer {
public:
    SocketInitializer() : initialized_(initializeSockets()) {}
    ~SocketInitializer() { if (initialized_) cleanupSockets(); }

    bool isInitialized() const { return initialized_; }

    SocketInitializer(const SocketInitializer&) = delete;
    SocketInitializer& operator=(const SocketInitializer&) = delete;

private:
    bool initialized_;
};

}  // namespace net
}  // namespace ubnt
