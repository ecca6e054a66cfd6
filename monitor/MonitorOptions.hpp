#pragma once

#include <optional>
#include <string>
#include <vector>

namespace monitor_opts {

/**
 * \brief Register monitor options (logging level, filters, one-shot send).
 *
 * Reads the "logging" and "monitor" JSON sections. This function is safe to
 * call multiple times; registration is protected by an internal flag.
 */
void register_options();

/** \brief Log level name for the stdout sink ("debug", "info", ...). */
std::string get_log_level();

/** \brief Service type filters as given (names or numbers); empty = all. */
std::vector<std::string> get_service_types();

/** \brief Hex encoded frame to send once after connecting, if any. */
std::optional<std::string> get_send_hex();

/** \brief Run time in seconds; 0 runs until interrupted. */
int get_duration_seconds();

} // namespace monitor_opts
