/**
 * \file ISocketLifecycle.hpp
 * \brief Common lifecycle and endpoint query interface for socket backends.
 * \ingroup socket_backend
 * \details Provides handle, endpoint, and basic readiness queries. The UDP
 * endpoint depends on this for closure and endpoint reporting.
 */
#pragma once

#include <optional>
#include <string>
#include "Address.hpp"

/** \brief Base interface for common socket lifecycle and endpoint methods.
 *  \ingroup socket_backend
 */
struct ISocketLifecycle {
    virtual ~ISocketLifecycle() = default;

    /** \brief Close the underlying transport; subsequent operations invalid. */
    virtual void close() = 0;
    /** \brief True if underlying transport is currently open. */
    virtual bool is_open() const = 0;
    /** \brief Backend/native handle (or -1 if not applicable). */
    virtual long long get_handle() const = 0;
    /** \brief Locally bound address (getsockname), if any. */
    virtual std::optional<transport::Address> local_endpoint() const = 0;
    /** \brief Connected peer address (getpeername); absent when unconnected. */
    virtual std::optional<transport::Address> remote_endpoint() const = 0;
    /** \brief Transport/backend type identifier (e.g. udp, udp-multicast). */
    virtual std::string socket_type() const = 0;
};
