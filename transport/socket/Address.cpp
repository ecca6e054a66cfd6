#include "Address.hpp"
#include "SocketErrnoCompat.hpp"
#include "transport/TransportErrors.hpp"

#include <cstring>
#include <stdexcept>

namespace transport {

namespace {

/** getaddrinfo results are EAI_* values, not errno values. */
class ResolverCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "resolver"; }
    std::string message(int ev) const override { return ::gai_strerror(ev); }
};

const std::error_category& resolver_category() {
    static const ResolverCategory category;
    return category;
}

} // namespace

Address::Address(std::string host, int port)
    : host_(std::move(host)) {
    if (host_.empty()) {
        throw ConfigurationError("address host must not be empty");
    }
    if (port < 0 || port > 65535) {
        throw ConfigurationError("address port out of range: " + std::to_string(port));
    }
    in_addr parsed{};
    if (::inet_pton(AF_INET, host_.c_str(), &parsed) == 1) {
        ipv4_network_order_ = parsed.s_addr;
        literal_ = true;
    }
    port_ = static_cast<uint16_t>(port);
}

Address Address::parse(const std::string& text) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        throw ConfigurationError("expected host:port, got '" + text + "'");
    }
    const std::string port_text = text.substr(colon + 1);
    int port = 0;
    for (char c : port_text) {
        if (c < '0' || c > '9' || port > 65535) {
            throw ConfigurationError("invalid port in '" + text + "'");
        }
        port = port * 10 + (c - '0');
    }
    return Address(text.substr(0, colon), port);
}

Address Address::from_sockaddr(const sockaddr_in& addr) {
    char buf[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
    return Address(buf, ntohs(addr.sin_port));
}

std::optional<Address> Address::resolve(std::error_code& error) const {
    error = std::error_code{};
    if (literal_) {
        return *this;
    }
    SocketErrnoCompat::ensure_initialized();

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* results = nullptr;
    int rc = ::getaddrinfo(host_.c_str(), nullptr, &hints, &results);
    if (rc != 0 || results == nullptr) {
        error = std::error_code(rc != 0 ? rc : EAI_NONAME, resolver_category());
        return std::nullopt;
    }
    sockaddr_in found{};
    std::memcpy(&found, results->ai_addr, sizeof(found));
    ::freeaddrinfo(results);
    found.sin_port = htons(port_);
    return from_sockaddr(found);
}

bool Address::is_multicast() const noexcept {
    return literal_ && (ntohl(ipv4_network_order_) & 0xF0000000u) == 0xE0000000u;
}

bool Address::is_wildcard() const noexcept {
    return literal_ && ipv4_network_order_ == htonl(INADDR_ANY);
}

void Address::to_sockaddr(sockaddr_in& out) const {
    if (!literal_) {
        throw std::logic_error("address '" + host_ + "' must be resolved before use");
    }
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(port_);
    out.sin_addr.s_addr = ipv4_network_order_;
}

std::string Address::to_string() const {
    return host_ + ":" + std::to_string(port_);
}

} // namespace transport
