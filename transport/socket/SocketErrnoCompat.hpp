/**
 * \file SocketErrnoCompat.hpp
 * \brief Cross-platform helpers over the host BSD socket API.
 * \ingroup socket_backend
 * \details Hides the Winsock/POSIX differences the UDP backend runs into:
 *  closing a descriptor, fetching the last socket error, switching to
 *  non-blocking mode and recognising would-block results.
 */
#pragma once

#include <cerrno>
#include <cstring>
#include <system_error>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
#else
    #include <arpa/inet.h>
    #include <fcntl.h>
    #include <netdb.h>
    #include <netinet/in.h>
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <unistd.h>
#endif

namespace transport {

#ifdef _WIN32
using native_socket_t = SOCKET;
inline constexpr native_socket_t invalid_native_socket = INVALID_SOCKET;
#else
using native_socket_t = int;
inline constexpr native_socket_t invalid_native_socket = -1;
#endif

/** \brief Interpret and manipulate host socket error values. */
class SocketErrnoCompat {
public:
    /** \brief One-time socket library startup (Winsock); no-op elsewhere. */
    static void ensure_initialized() {
#ifdef _WIN32
        static const bool started = [] {
            WSADATA data;
            return ::WSAStartup(MAKEWORD(2, 2), &data) == 0;
        }();
        (void)started;
#endif
    }

    /** \brief Error code of the last failed socket call on this thread. */
    static int last_error() {
#ifdef _WIN32
        return ::WSAGetLastError();
#else
        return errno;
#endif
    }

    /** \brief Map a host socket error to a std::error_code. */
    static std::error_code to_error_code(int err) {
#ifdef _WIN32
        switch (err) {
            case WSAEWOULDBLOCK: return std::make_error_code(std::errc::operation_would_block);
            case WSAECONNREFUSED: return std::make_error_code(std::errc::connection_refused);
            case WSAECONNRESET: return std::make_error_code(std::errc::connection_reset);
            case WSAEADDRINUSE: return std::make_error_code(std::errc::address_in_use);
            case WSAEADDRNOTAVAIL: return std::make_error_code(std::errc::address_not_available);
            case WSAENOTSOCK: return std::make_error_code(std::errc::bad_file_descriptor);
            default: return std::error_code(err, std::system_category());
        }
#else
        return std::error_code(err, std::generic_category());
#endif
    }

    /** \brief Convenience: `to_error_code(last_error())`. */
    static std::error_code last_error_code() { return to_error_code(last_error()); }

    /** \brief Check whether an error value indicates a would-block condition. */
    static bool is_would_block_errno(int err) {
#ifdef _WIN32
        return err == WSAEWOULDBLOCK || err == WSAEINPROGRESS;
#else
        return err == EAGAIN || err == EWOULDBLOCK || err == EINPROGRESS;
#endif
    }

    /** \brief Put a descriptor into non-blocking mode. */
    static bool set_non_blocking(native_socket_t fd) {
#ifdef _WIN32
        u_long mode = 1;
        return ::ioctlsocket(fd, FIONBIO, &mode) == 0;
#else
        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags < 0) return false;
        return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
#endif
    }

    /** \brief Close a descriptor; returns false if the OS rejected it. */
    static bool close_socket(native_socket_t fd) {
#ifdef _WIN32
        return ::closesocket(fd) == 0;
#else
        return ::close(fd) == 0;
#endif
    }
};

} // namespace transport
