#pragma once

#include <optional>
#include <string>

namespace udp_client_opts {

/**
 * \brief Register UDP client options (addresses, multicast mode, I/O polling).
 *
 * Reads defaults from the "udp_client" JSON section. Safe to call multiple
 * times; registration is protected by an internal flag.
 */
void register_options();

std::optional<std::string> get_local_host();
std::optional<int> get_local_port();
std::optional<std::string> get_remote_host();
std::optional<int> get_remote_port();
std::optional<bool> get_multicast();
/** \brief Idle poll interval of the I/O context in milliseconds. */
std::optional<int> get_io_poll_interval_ms();

} // namespace udp_client_opts
