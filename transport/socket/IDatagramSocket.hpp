/**
 * \file IDatagramSocket.hpp
 * \brief Non-blocking datagram socket interface.
 * \ingroup socket_backend
 * \details `try_*` calls never block. They return true when the operation
 * completed (success or error, reported through `error`) and false when it
 * would block and should be retried by the caller's poller.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <system_error>
#include "ISocketLifecycle.hpp"
#include "socket_groups.hpp"

/** \brief Datagram (UDP) socket with non-blocking receive/send.
 *  \ingroup socket_backend
 */
struct IDatagramSocket : public virtual ISocketLifecycle {
    /** \brief Attempt to receive one datagram; `from` receives the sender on success. */
    virtual bool try_receive(void* buffer, size_t size, size_t& bytes_read,
                             std::optional<transport::Address>& from, std::error_code& error) = 0;
    /** \brief Attempt to send one datagram; `to` empty means the connected peer. */
    virtual bool try_send(const void* buffer, size_t size, const std::optional<transport::Address>& to,
                          size_t& bytes_written, std::error_code& error) = 0;
};
