/**
 * \file TransportErrors.hpp
 * \brief Exception types raised by the UDP transport.
 * \details Construction and `connect()` failures propagate to the caller; the
 * receive path never throws out of the transport (parse failures are logged
 * and dropped by the client).
 */
#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace transport {

/** \brief Malformed constructor arguments (e.g. an address that is not a valid host/port pair). */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

/** \brief OS-level failure while creating, configuring or binding a socket. */
class SocketError : public std::system_error {
public:
    SocketError(std::error_code ec, const std::string& what) : std::system_error(ec, what) {}
};

/** \brief Misuse of the transport lifecycle (e.g. connecting a stopped client). */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

/** \brief `send()` while the client is not connected; the client stays usable. */
class TransportNotConnectedError : public TransportError {
public:
    TransportNotConnectedError() : TransportError("Transport not connected") {}
};

} // namespace transport
