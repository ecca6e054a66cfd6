/**
 * \file BindStrategy.hpp
 * \brief Platform-dependent bind rules for multicast sockets.
 * \ingroup socket_backend
 */
#pragma once

#include "Address.hpp"

namespace transport {

/** \brief Host platform families that bind multicast sockets differently. */
enum class Platform { Windows, MacOS, Other };

/** \brief Which local address a multicast socket binds to. */
enum class BindTarget {
    WildcardGroupPort,     ///< INADDR_ANY + group port
    GroupAddressGroupPort  ///< group address + group port
};

/** \brief Result of \ref select_bind_strategy. */
struct BindStrategy {
    bool reuse_port{false};  ///< set SO_REUSEPORT before binding
    BindTarget target{BindTarget::GroupAddressGroupPort};

    bool operator==(const BindStrategy&) const = default;
};

/** \brief Pure mapping from platform to bind strategy. */
BindStrategy select_bind_strategy(Platform platform) noexcept;

/** \brief Platform this binary was compiled for. */
Platform current_platform() noexcept;

/** \brief Concrete bind address for `group` under `strategy`. */
Address bind_address_for(const BindStrategy& strategy, const Address& group);

const char* to_string(Platform platform) noexcept;

} // namespace transport
