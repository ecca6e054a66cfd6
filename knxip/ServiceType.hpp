#ifndef KNXLINK_KNXIP_SERVICE_TYPE_HPP
#define KNXLINK_KNXIP_SERVICE_TYPE_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace KnxLink::KnxIp {

/** \brief KNXnet/IP service type identifiers (common header bytes 2..3, big endian). */
enum class ServiceType : uint16_t {
    SEARCH_REQUEST                = 0x0201,
    SEARCH_RESPONSE               = 0x0202,
    DESCRIPTION_REQUEST           = 0x0203,
    DESCRIPTION_RESPONSE          = 0x0204,
    CONNECT_REQUEST               = 0x0205,
    CONNECT_RESPONSE              = 0x0206,
    CONNECTIONSTATE_REQUEST       = 0x0207,
    CONNECTIONSTATE_RESPONSE      = 0x0208,
    DISCONNECT_REQUEST            = 0x0209,
    DISCONNECT_RESPONSE           = 0x020A,
    SEARCH_REQUEST_EXTENDED       = 0x020B,
    SEARCH_RESPONSE_EXTENDED      = 0x020C,
    DEVICE_CONFIGURATION_REQUEST  = 0x0310,
    DEVICE_CONFIGURATION_ACK      = 0x0311,
    TUNNELLING_REQUEST            = 0x0420,
    TUNNELLING_ACK                = 0x0421,
    TUNNELLING_FEATURE_GET        = 0x0422,
    TUNNELLING_FEATURE_RESPONSE   = 0x0423,
    TUNNELLING_FEATURE_SET        = 0x0424,
    TUNNELLING_FEATURE_INFO       = 0x0425,
    ROUTING_INDICATION            = 0x0530,
    ROUTING_LOST_MESSAGE          = 0x0531,
    ROUTING_BUSY                  = 0x0532,
    ROUTING_SYSTEM_BROADCAST      = 0x0533,
    REMOTE_DIAG_REQUEST           = 0x0740,
    REMOTE_DIAG_RESPONSE          = 0x0741,
    REMOTE_BASIC_CONF_REQUEST     = 0x0742,
    REMOTE_RESET_REQUEST          = 0x0743,
    SECURE_WRAPPER                = 0x0950,
    SESSION_REQUEST               = 0x0951,
    SESSION_RESPONSE              = 0x0952,
    SESSION_AUTHENTICATE          = 0x0953,
    SESSION_STATUS                = 0x0954,
    TIMER_NOTIFY                  = 0x0955
};

/** \brief True if `value` is one of the identifiers above. */
bool is_known_service_type(uint16_t value) noexcept;

/** \brief Symbolic name, e.g. "SEARCH_REQUEST"; "UNKNOWN" for unlisted values. */
const char* service_type_name(ServiceType type) noexcept;

/** \brief "SEARCH_REQUEST (0x0201)" style rendering for logs. */
std::string describe_service_type(ServiceType type);

/** \brief Parse a symbolic name ("ROUTING_INDICATION") or a numeric value ("0x0530", "1328").
 *  \return The service type, or empty if the text names no known identifier.
 */
std::optional<ServiceType> parse_service_type(const std::string& text);

constexpr uint16_t to_underlying(ServiceType type) noexcept { return static_cast<uint16_t>(type); }

} // namespace KnxLink::KnxIp

#endif // KNXLINK_KNXIP_SERVICE_TYPE_HPP
