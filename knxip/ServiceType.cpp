#include "ServiceType.hpp"

#include <cstdio>
#include <cstdlib>

namespace KnxLink::KnxIp {

namespace {

struct ServiceTypeEntry {
    ServiceType type;
    const char* name;
};

constexpr ServiceTypeEntry kServiceTypes[] = {
    {ServiceType::SEARCH_REQUEST, "SEARCH_REQUEST"},
    {ServiceType::SEARCH_RESPONSE, "SEARCH_RESPONSE"},
    {ServiceType::DESCRIPTION_REQUEST, "DESCRIPTION_REQUEST"},
    {ServiceType::DESCRIPTION_RESPONSE, "DESCRIPTION_RESPONSE"},
    {ServiceType::CONNECT_REQUEST, "CONNECT_REQUEST"},
    {ServiceType::CONNECT_RESPONSE, "CONNECT_RESPONSE"},
    {ServiceType::CONNECTIONSTATE_REQUEST, "CONNECTIONSTATE_REQUEST"},
    {ServiceType::CONNECTIONSTATE_RESPONSE, "CONNECTIONSTATE_RESPONSE"},
    {ServiceType::DISCONNECT_REQUEST, "DISCONNECT_REQUEST"},
    {ServiceType::DISCONNECT_RESPONSE, "DISCONNECT_RESPONSE"},
    {ServiceType::SEARCH_REQUEST_EXTENDED, "SEARCH_REQUEST_EXTENDED"},
    {ServiceType::SEARCH_RESPONSE_EXTENDED, "SEARCH_RESPONSE_EXTENDED"},
    {ServiceType::DEVICE_CONFIGURATION_REQUEST, "DEVICE_CONFIGURATION_REQUEST"},
    {ServiceType::DEVICE_CONFIGURATION_ACK, "DEVICE_CONFIGURATION_ACK"},
    {ServiceType::TUNNELLING_REQUEST, "TUNNELLING_REQUEST"},
    {ServiceType::TUNNELLING_ACK, "TUNNELLING_ACK"},
    {ServiceType::TUNNELLING_FEATURE_GET, "TUNNELLING_FEATURE_GET"},
    {ServiceType::TUNNELLING_FEATURE_RESPONSE, "TUNNELLING_FEATURE_RESPONSE"},
    {ServiceType::TUNNELLING_FEATURE_SET, "TUNNELLING_FEATURE_SET"},
    {ServiceType::TUNNELLING_FEATURE_INFO, "TUNNELLING_FEATURE_INFO"},
    {ServiceType::ROUTING_INDICATION, "ROUTING_INDICATION"},
    {ServiceType::ROUTING_LOST_MESSAGE, "ROUTING_LOST_MESSAGE"},
    {ServiceType::ROUTING_BUSY, "ROUTING_BUSY"},
    {ServiceType::ROUTING_SYSTEM_BROADCAST, "ROUTING_SYSTEM_BROADCAST"},
    {ServiceType::REMOTE_DIAG_REQUEST, "REMOTE_DIAG_REQUEST"},
    {ServiceType::REMOTE_DIAG_RESPONSE, "REMOTE_DIAG_RESPONSE"},
    {ServiceType::REMOTE_BASIC_CONF_REQUEST, "REMOTE_BASIC_CONF_REQUEST"},
    {ServiceType::REMOTE_RESET_REQUEST, "REMOTE_RESET_REQUEST"},
    {ServiceType::SECURE_WRAPPER, "SECURE_WRAPPER"},
    {ServiceType::SESSION_REQUEST, "SESSION_REQUEST"},
    {ServiceType::SESSION_RESPONSE, "SESSION_RESPONSE"},
    {ServiceType::SESSION_AUTHENTICATE, "SESSION_AUTHENTICATE"},
    {ServiceType::SESSION_STATUS, "SESSION_STATUS"},
    {ServiceType::TIMER_NOTIFY, "TIMER_NOTIFY"},
};

} // namespace

bool is_known_service_type(uint16_t value) noexcept {
    for (const auto& entry : kServiceTypes) {
        if (to_underlying(entry.type) == value) return true;
    }
    return false;
}

const char* service_type_name(ServiceType type) noexcept {
    for (const auto& entry : kServiceTypes) {
        if (entry.type == type) return entry.name;
    }
    return "UNKNOWN";
}

std::string describe_service_type(ServiceType type) {
    char hex[8];
    std::snprintf(hex, sizeof(hex), "0x%04X", to_underlying(type));
    return std::string(service_type_name(type)) + " (" + hex + ")";
}

std::optional<ServiceType> parse_service_type(const std::string& text) {
    if (text.empty()) return std::nullopt;
    for (const auto& entry : kServiceTypes) {
        if (text == entry.name) return entry.type;
    }
    char* end = nullptr;
    unsigned long value = std::strtoul(text.c_str(), &end, 0);
    if (end == nullptr || *end != '\0' || value > 0xFFFF || !is_known_service_type(static_cast<uint16_t>(value))) {
        return std::nullopt;
    }
    return static_cast<ServiceType>(value);
}

} // namespace KnxLink::KnxIp
