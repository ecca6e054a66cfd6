/**
 * @file test_socket_factory.cpp
 * @brief Bind strategy selection and the multicast socket option sequence.
 *
 * The multicast part needs a route for 224.0.0.0/4; hosts without one report
 * the test as skipped (exit code 77).
 */

#include "BindStrategy.hpp"
#include "IDatagramSocket.hpp"
#include "SocketErrnoCompat.hpp"
#include "SocketFactory.hpp"
#include "transport/TransportErrors.hpp"

#include <cassert>
#include <iostream>

using namespace transport;

namespace {

constexpr int kSkip = 77;

void test_bind_strategy() {
    std::cout << "\n=== Test 1: bind strategy per platform ===\n";
    auto win = select_bind_strategy(Platform::Windows);
    assert(!win.reuse_port && win.target == BindTarget::WildcardGroupPort);
    auto mac = select_bind_strategy(Platform::MacOS);
    assert(mac.reuse_port && mac.target == BindTarget::WildcardGroupPort);
    auto other = select_bind_strategy(Platform::Other);
    assert(!other.reuse_port && other.target == BindTarget::GroupAddressGroupPort);

    const Address group("224.0.23.12", 3671);
    assert(bind_address_for(win, group) == Address("0.0.0.0", 3671));
    assert(bind_address_for(mac, group) == Address("0.0.0.0", 3671));
    assert(bind_address_for(other, group) == group);

#if defined(_WIN32)
    assert(current_platform() == Platform::Windows);
#elif defined(__APPLE__)
    assert(current_platform() == Platform::MacOS);
#else
    assert(current_platform() == Platform::Other);
#endif
    std::cout << "  compiled for: " << to_string(current_platform()) << "\n";
}

void test_rejected_arguments() {
    std::cout << "\n=== Test 2: bad interface and group arguments ===\n";
    bool config_error = false;
    try {
        SocketFactory::create_multicast_socket("not-an-ip", Address("224.0.23.12", 3671), nullptr);
    } catch (const ConfigurationError&) {
        config_error = true;
    }
    assert(config_error);

    bool group_name_error = false;
    try {
        SocketFactory::create_multicast_socket("0.0.0.0", Address("knx-routing.invalid", 3671), nullptr);
    } catch (const ConfigurationError& e) {
        std::cout << "  " << e.what() << "\n";
        group_name_error = true;
    }
    assert(group_name_error);

    // TEST-NET-1 is not an interface of this host
    bool socket_error = false;
    try {
        SocketFactory::create_multicast_socket("192.0.2.1", Address("224.0.23.12", 3671), nullptr);
    } catch (const SocketError& e) {
        std::cout << "  " << e.what() << "\n";
        socket_error = e.code().value() != 0;
    }
    assert(socket_error);
}

int test_multicast_options() {
    std::cout << "\n=== Test 3: multicast socket options on 224.0.23.12:3671 ===\n";
    auto logger = std::make_shared<Logger>("knxlink.log");
    auto sink = std::make_shared<VectorSink>();
    sink->set_level(LogLevel::Debug);
    logger->add_sink(sink);

    std::shared_ptr<IDatagramSocket> socket;
    try {
        socket = SocketFactory::create_multicast_socket("0.0.0.0", Address("224.0.23.12", 3671), logger);
    } catch (const SocketError& e) {
        std::cout << "  SKIP: cannot join multicast group here: " << e.what() << "\n";
        return kSkip;
    }
    assert(socket->is_open());
    assert(socket->socket_type() == "udp-multicast");
    assert(sink->count_containing("multicast socket joined 224.0.23.12:3671") == 1);

    auto fd = static_cast<native_socket_t>(socket->get_handle());

    unsigned char ttl = 0;
    socklen_t len = sizeof(ttl);
    assert(::getsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, reinterpret_cast<char*>(&ttl), &len) == 0);
    assert(ttl == SocketFactory::multicast_ttl);

    unsigned char loop = 1;
    len = sizeof(loop);
    assert(::getsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, reinterpret_cast<char*>(&loop), &len) == 0);
    assert(loop == 0);

    auto local = socket->local_endpoint();
    assert(local && local->port() == 3671);
    assert(!socket->remote_endpoint());

    // Leaving succeeds only for a group that was joined
    ip_mreq membership{};
    ::inet_pton(AF_INET, "224.0.23.12", &membership.imr_multiaddr);
    membership.imr_interface.s_addr = htonl(INADDR_ANY);
    assert(::setsockopt(fd, IPPROTO_IP, IP_DROP_MEMBERSHIP, reinterpret_cast<const char*>(&membership), sizeof(membership)) == 0);
    assert(::setsockopt(fd, IPPROTO_IP, IP_DROP_MEMBERSHIP, reinterpret_cast<const char*>(&membership), sizeof(membership)) != 0);

    socket->close();
    assert(!socket->is_open());
    assert(socket->get_handle() == -1);
    return 0;
}

} // namespace

int main() {
    test_bind_strategy();
    test_rejected_arguments();
    int rc = test_multicast_options();
    if (rc == kSkip) return kSkip;
    std::cout << "\nAll SocketFactory tests passed!\n";
    return 0;
}
