#include "BindStrategy.hpp"

namespace transport {

BindStrategy select_bind_strategy(Platform platform) noexcept {
    switch (platform) {
        case Platform::Windows:
            return BindStrategy{false, BindTarget::WildcardGroupPort};
        case Platform::MacOS:
            // several processes may share the routing port (gateway scans open many sockets)
            return BindStrategy{true, BindTarget::WildcardGroupPort};
        case Platform::Other:
        default:
            return BindStrategy{false, BindTarget::GroupAddressGroupPort};
    }
}

Platform current_platform() noexcept {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#else
    return Platform::Other;
#endif
}

Address bind_address_for(const BindStrategy& strategy, const Address& group) {
    if (strategy.target == BindTarget::WildcardGroupPort) {
        return Address("0.0.0.0", group.port());
    }
    return group;
}

const char* to_string(Platform platform) noexcept {
    switch (platform) {
        case Platform::Windows: return "windows";
        case Platform::MacOS: return "macos";
        case Platform::Other: return "other";
        default: return "unknown";
    }
}

} // namespace transport
