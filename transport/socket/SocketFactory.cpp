/**
 * \file SocketFactory.cpp
 * \brief Socket creation and multicast option sequence.
 * \ingroup socket_backend
 */
#include "SocketFactory.hpp"
#include "BindStrategy.hpp"
#include "IDatagramSocket.hpp"
#include <string>
#include "SocketErrnoCompat.hpp"
#include "native/UdpSocket.hpp"
#include "transport/TransportErrors.hpp"

namespace transport {

namespace {

/** \brief Owns a raw descriptor until released; closes it on unwinding. */
class PendingSocket {
public:
    explicit PendingSocket(native_socket_t fd) : fd_(fd) {}
    ~PendingSocket() {
        if (fd_ != invalid_native_socket) SocketErrnoCompat::close_socket(fd_);
    }
    PendingSocket(const PendingSocket&) = delete;
    PendingSocket& operator=(const PendingSocket&) = delete;

    native_socket_t get() const { return fd_; }
    native_socket_t release() {
        auto fd = fd_;
        fd_ = invalid_native_socket;
        return fd;
    }

private:
    native_socket_t fd_;
};

[[noreturn]] void throw_step(const std::string& step, const std::shared_ptr<Logger>& logger) {
    auto ec = SocketErrnoCompat::last_error_code();
    if (logger) logger->error("SocketFactory: " + step + " failed: " + ec.message());
    throw SocketError(ec, "multicast socket: " + step);
}

template <typename T>
void set_option(native_socket_t fd, int level, int name, const T& value, const std::string& step,
                const std::shared_ptr<Logger>& logger) {
    if (::setsockopt(fd, level, name, reinterpret_cast<const char*>(&value), sizeof(value)) != 0) {
        throw_step(step, logger);
    }
}

} // namespace

std::shared_ptr<IDatagramSocket> SocketFactory::create_multicast_socket(const std::string& own_interface_ip,
                                                                        const Address& group,
                                                                        std::shared_ptr<Logger> logger) {
    // Interface and group must be IPv4 literals; checked before any descriptor exists
    const Address own_interface(own_interface_ip, 0);
    if (!own_interface.is_literal()) {
        throw ConfigurationError("multicast interface is not an IPv4 literal: '" + own_interface_ip + "'");
    }
    if (!group.is_literal()) {
        throw ConfigurationError("multicast group is not an IPv4 literal: '" + group.host() + "'");
    }
    SocketErrnoCompat::ensure_initialized();

    PendingSocket sock(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
    if (sock.get() == invalid_native_socket) {
        throw_step("socket", logger);
    }
    const native_socket_t fd = sock.get();

    int reuse = 1;
    set_option(fd, SOL_SOCKET, SO_REUSEADDR, reuse, "SO_REUSEADDR", logger);
    if (!SocketErrnoCompat::set_non_blocking(fd)) {
        throw_step("set non-blocking", logger);
    }

    sockaddr_in iface{};
    own_interface.to_sockaddr(iface);
    set_option(fd, IPPROTO_IP, IP_MULTICAST_IF, iface.sin_addr, "IP_MULTICAST_IF", logger);

    sockaddr_in group_addr{};
    group.to_sockaddr(group_addr);
    ip_mreq membership{};
    membership.imr_multiaddr = group_addr.sin_addr;
    membership.imr_interface = iface.sin_addr;
    set_option(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, membership, "IP_ADD_MEMBERSHIP " + group.host(), logger);

#ifdef _WIN32
    DWORD ttl = multicast_ttl;
#else
    unsigned char ttl = static_cast<unsigned char>(multicast_ttl);
#endif
    set_option(fd, IPPROTO_IP, IP_MULTICAST_TTL, ttl, "IP_MULTICAST_TTL", logger);

    const auto strategy = select_bind_strategy(current_platform());
#ifdef SO_REUSEPORT
    if (strategy.reuse_port) {
        set_option(fd, SOL_SOCKET, SO_REUSEPORT, reuse, "SO_REUSEPORT", logger);
    }
#endif
    const Address bind_target = bind_address_for(strategy, group);
    sockaddr_in bind_addr{};
    bind_target.to_sockaddr(bind_addr);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) != 0) {
        throw_step("bind " + bind_target.to_string(), logger);
    }

    // ignore datagrams sent by this host; disables multiple routing instances per interface
#ifdef _WIN32
    DWORD loop = 0;
#else
    unsigned char loop = 0;
#endif
    set_option(fd, IPPROTO_IP, IP_MULTICAST_LOOP, loop, "IP_MULTICAST_LOOP", logger);

    if (logger) {
        logger->debug("SocketFactory: multicast socket joined " + group.to_string() + " on " + own_interface_ip +
                      ", bound " + bind_target.to_string() + " (" + to_string(current_platform()) + ")");
    }
    return std::make_shared<UdpSocket>(sock.release(), "udp-multicast", std::move(logger));
}

std::shared_ptr<IDatagramSocket> SocketFactory::create_unicast_socket(const Address& local,
                                                                      const Address& remote,
                                                                      std::shared_ptr<Logger> logger) {
    auto socket = std::make_shared<UdpSocket>(logger);
    std::error_code ec;
    if (!socket->open_unicast(local, remote, ec)) {
        throw SocketError(ec, "unicast socket " + local.to_string() + " -> " + remote.to_string());
    }
    return socket;
}

} // namespace transport
