/**
 * \file Address.hpp
 * \brief IPv4 host/port pair used for bind targets, peers and multicast groups.
 * \ingroup socket_backend
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

struct sockaddr_in;

namespace transport {

/** \brief Immutable (host, port) pair.
 *  \ingroup socket_backend
 *  \details The host is a dotted IPv4 literal ("0.0.0.0" is the wildcard) or a
 *  host name that is looked up when a socket is opened. The port must be
 *  within 0..65535 (0 requests an ephemeral port).
 */
class Address {
public:
    /** \brief Validate and build; throws ConfigurationError for a malformed pair. */
    Address(std::string host, int port);

    /** \brief Parse "host:port"; throws ConfigurationError if malformed. */
    static Address parse(const std::string& text);

    /** \brief Build from a kernel socket address (getsockname/recvfrom results). */
    static Address from_sockaddr(const sockaddr_in& addr);

    const std::string& host() const noexcept { return host_; }
    uint16_t port() const noexcept { return port_; }

    /** \brief True when the host is an IPv4 literal rather than a name. */
    bool is_literal() const noexcept { return literal_; }

    /** \brief Literal form of this address.
     *  \details Literals return themselves; names are looked up (IPv4 only) and
     *  the first result is used. A failed lookup sets `error` and returns nullopt.
     */
    std::optional<Address> resolve(std::error_code& error) const;

    /** \brief True for 224.0.0.0/4 literals. */
    bool is_multicast() const noexcept;
    /** \brief True for the 0.0.0.0 literal. */
    bool is_wildcard() const noexcept;

    /** \brief Fill a kernel socket address; throws std::logic_error for an unresolved name. */
    void to_sockaddr(sockaddr_in& out) const;

    /** \brief "host:port" rendering. */
    std::string to_string() const;

    bool operator==(const Address& other) const noexcept {
        return port_ == other.port_ && host_ == other.host_;
    }
    bool operator!=(const Address& other) const noexcept { return !(*this == other); }

private:
    std::string host_;
    uint16_t port_{0};
    uint32_t ipv4_network_order_{0};
    bool literal_{false};
};

} // namespace transport
