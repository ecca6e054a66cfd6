/**
 * @file test_multicast_client.cpp
 * @brief KNX routing client on 224.0.23.12:3671: connect, filtered dispatch, send to group.
 *
 * Exits with 77 (skipped) when the host cannot join the group.
 */

#include "UdpClient.hpp"
#include "knxip/KnxIpCodec.hpp"
#include "transport/TransportErrors.hpp"

#include <cassert>
#include <iostream>
#include <vector>

using namespace transport;
using KnxLink::KnxIp::KnxIpCodec;
using KnxLink::KnxIp::KnxIpFrame;
using KnxLink::KnxIp::ServiceType;

int main() {
    std::cout << "\n=== Test 1: multicast client connects to the routing group ===\n";
    auto logger = std::make_shared<Logger>("test");
    auto sink = std::make_shared<VectorSink>();
    sink->set_level(LogLevel::Debug);
    logger->add_sink(sink);

    auto ctx = std::make_shared<IoContext>();
    auto client = UdpClient::create(Address("0.0.0.0", 0), Address("224.0.23.12", 3671), true,
                                    LogChannels::from(logger), ctx);
    std::vector<KnxIpFrame> received;
    client->register_callback([&](const KnxIpFrame& frame, UdpClient&) { received.push_back(frame); },
                              {ServiceType::SEARCH_REQUEST});
    try {
        client->connect();
    } catch (const SocketError& e) {
        std::cout << "  SKIP: cannot join multicast group here: " << e.what() << "\n";
        return 77;
    }
    assert(client->state() == TransportState::Connected);
    assert(client->is_multicast());
    auto local = client->get_local_address();
    assert(local && local->port() == 3671);
    assert(!client->get_remote_address()); // no peer on a multicast socket

    std::cout << "\n=== Test 2: filtered dispatch on the routing client ===\n";
    KnxIpCodec codec;
    client->on_raw_received(codec.encode(KnxIpFrame(ServiceType::SEARCH_REQUEST, {0x08, 0x01, 0xe0, 0x00, 0x17, 0x0c, 0x0e, 0x57})));
    assert(received.size() == 1);
    assert(received[0].service_type() == ServiceType::SEARCH_REQUEST);

    client->on_raw_received(codec.encode(KnxIpFrame(ServiceType::DESCRIPTION_REQUEST, {})));
    assert(received.size() == 1);
    assert(client->unhandled_count() == 1);
    assert(sink->count_containing("UNHANDLED: DESCRIPTION_REQUEST (0x0203)") == 1);

    std::cout << "\n=== Test 3: send addresses the group explicitly ===\n";
    client->send(KnxIpFrame(ServiceType::ROUTING_INDICATION, {0x29, 0x00, 0xbc, 0xd0, 0x11, 0x01, 0x08, 0x01, 0x01, 0x00, 0x81}));
    assert(sink->count_containing("[DEBUG][knxlink.knx] Sending: <KnxIpFrame ROUTING_INDICATION") == 1);
    assert(sink->count_containing("Send failed") == 0);

    client->stop();
    client->stop();
    assert(client->state() == TransportState::Closed);
    for (int i = 0; i < 10 && ctx->pending_count() > 0; ++i) ctx->poll_once();
    assert(ctx->pending_count() == 0);
    assert(sink->count_containing("Closing transport.") == 1);

    std::cout << "\nAll multicast client tests passed!\n";
    return 0;
}
