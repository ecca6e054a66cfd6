/**
 * \file socket_groups.hpp
 * \brief Doxygen group definitions for the socket layer.
 * \details Centralizes group declarations so interfaces and backends can tag
 *  themselves with \ingroup socket_backend.
 */
#pragma once

/** \defgroup socket_backend Socket Backend
 *  \brief Datagram socket interface, host OS backend and socket factory.
 *  \details Contains \ref IDatagramSocket and \ref ISocketLifecycle, the
 *  \ref transport::Address value type, the platform bind rules used for KNX
 *  routing multicast (\ref transport::select_bind_strategy) and the native
 *  UdpSocket backend created by \ref transport::SocketFactory.
 */
