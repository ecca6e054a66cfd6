/**
 * \file LogChannels.hpp
 * \brief The three named loggers used by the UDP transport.
 */
#pragma once

#include "logger.hpp"
#include <memory>

namespace transport {

/** \brief Raw-socket, general and protocol-trace loggers.
 *  \details A null member disables that channel. All three usually share the
 *  sinks of one base logger (see \ref from).
 */
struct LogChannels {
    std::shared_ptr<Logger> raw_socket;  ///< datagram hex dumps
    std::shared_ptr<Logger> general;     ///< lifecycle, errors, unhandled frames
    std::shared_ptr<Logger> knx;         ///< Sending/Received frame traces

    static constexpr const char* kRawSocketName = "knxlink.raw_socket";
    static constexpr const char* kGeneralName = "knxlink.log";
    static constexpr const char* kKnxName = "knxlink.knx";

    /** \brief Derive the three channels from `base`; a null base disables all of them. */
    static LogChannels from(const std::shared_ptr<Logger>& base) {
        if (!base) return {};
        return LogChannels{base->child(kRawSocketName), base->child(kGeneralName), base->child(kKnxName)};
    }
};

} // namespace transport
