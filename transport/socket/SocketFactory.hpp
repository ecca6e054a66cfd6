/**
 * \file SocketFactory.hpp
 * \brief Factory helpers for creating configured UDP sockets.
 * \ingroup socket_backend
 * \details Centralizes socket creation and option setup so the transport only
 * ever sees an \ref IDatagramSocket.
 * \see BindStrategy
 */
#pragma once

#include <memory>
#include <string>

#include "Address.hpp"
#include "logger.hpp"

struct IDatagramSocket;

namespace transport {

/** \brief Static factory for datagram sockets.
 *  \ingroup socket_backend
 *  \details Every failure throws \ref SocketError naming the failing step; a
 *  half-configured descriptor is closed before the exception leaves.
 */
class SocketFactory {
public:
    /** \brief Non-blocking socket joined to `group` on interface `own_interface_ip`.
     *  \details Option order: SO_REUSEADDR, non-blocking, IP_MULTICAST_IF,
     *  IP_ADD_MEMBERSHIP, IP_MULTICAST_TTL=2, platform bind (\ref select_bind_strategy),
     *  IP_MULTICAST_LOOP=0. Host names are rejected with \ref ConfigurationError
     *  for both the interface and the group.
     */
    static std::shared_ptr<IDatagramSocket> create_multicast_socket(const std::string& own_interface_ip,
                                                                    const Address& group,
                                                                    std::shared_ptr<Logger> logger);

    /** \brief Non-blocking socket bound to `local` and connected to `remote`.
     *  \details Host names are looked up here; a failed lookup throws \ref SocketError.
     */
    static std::shared_ptr<IDatagramSocket> create_unicast_socket(const Address& local,
                                                                  const Address& remote,
                                                                  std::shared_ptr<Logger> logger);

    /** \brief TTL applied to outgoing multicast datagrams. */
    static constexpr int multicast_ttl = 2;

private:
    // Static-only: prevent instantiation
    SocketFactory() = delete;
};

} // namespace transport
