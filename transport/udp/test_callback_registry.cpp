/**
 * @file test_callback_registry.cpp
 * @brief Dispatch semantics of CallbackRegistry: matching, order, removal and isolation.
 */

#include "CallbackRegistry.hpp"
#include "UdpClient.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace transport;
using KnxLink::KnxIp::KnxIpFrame;
using KnxLink::KnxIp::ServiceType;

namespace {

struct Fixture {
    Fixture()
        : logger(std::make_shared<Logger>("knxlink.log")),
          sink(std::make_shared<VectorSink>()),
          ctx(std::make_shared<IoContext>()) {
        sink->set_level(LogLevel::Debug);
        logger->add_sink(sink);
        client = UdpClient::create(Address("127.0.0.1", 0), Address("127.0.0.1", 3671), false, {}, ctx);
    }

    std::shared_ptr<Logger> logger;
    std::shared_ptr<VectorSink> sink;
    std::shared_ptr<IoContext> ctx;
    std::shared_ptr<UdpClient> client;
};

KnxIpFrame frame_of(ServiceType type) {
    return KnxIpFrame(type, {});
}

void test_completeness_and_selectivity() {
    std::cout << "\n=== Test 1: every matching handler runs, non-matching never ===\n";
    Fixture f;
    CallbackRegistry registry(f.logger);
    int all = 0, search = 0, routing = 0;
    registry.register_callback([&](const KnxIpFrame&, UdpClient&) { ++all; });
    registry.register_callback([&](const KnxIpFrame&, UdpClient&) { ++search; },
                               {ServiceType::SEARCH_REQUEST, ServiceType::SEARCH_RESPONSE});
    registry.register_callback([&](const KnxIpFrame&, UdpClient&) { ++routing; }, {ServiceType::ROUTING_INDICATION});

    assert(registry.dispatch(frame_of(ServiceType::SEARCH_REQUEST), *f.client) == 2);
    assert(registry.dispatch(frame_of(ServiceType::SEARCH_RESPONSE), *f.client) == 2);
    assert(registry.dispatch(frame_of(ServiceType::ROUTING_INDICATION), *f.client) == 2);
    assert(all == 3 && search == 2 && routing == 1);
    assert(registry.unhandled_count() == 0);
}

void test_order_and_client_argument() {
    std::cout << "\n=== Test 2: handlers run in registration order with the receiving client ===\n";
    Fixture f;
    CallbackRegistry registry(f.logger);
    std::vector<int> order;
    for (int i = 0; i < 4; ++i) {
        registry.register_callback([&order, i, &f](const KnxIpFrame& frame, UdpClient& client) {
            assert(&client == f.client.get());
            assert(frame.service_type() == ServiceType::TUNNELLING_REQUEST);
            order.push_back(i);
        });
    }
    registry.dispatch(frame_of(ServiceType::TUNNELLING_REQUEST), *f.client);
    assert((order == std::vector<int>{0, 1, 2, 3}));
}

void test_unregister() {
    std::cout << "\n=== Test 3: unregistration removes exactly one handler ===\n";
    Fixture f;
    CallbackRegistry registry(f.logger);
    int a = 0, b = 0;
    auto ha = registry.register_callback([&](const KnxIpFrame&, UdpClient&) { ++a; });
    registry.register_callback([&](const KnxIpFrame&, UdpClient&) { ++b; });
    assert(registry.size() == 2);

    assert(registry.unregister_callback(ha));
    assert(registry.size() == 1);
    registry.dispatch(frame_of(ServiceType::ROUTING_INDICATION), *f.client);
    assert(a == 0 && b == 1);

    // removing twice, or a handle that was never registered, is a logged no-op
    assert(!registry.unregister_callback(ha));
    assert(!registry.unregister_callback(nullptr));
    auto stranger = std::make_shared<CallbackRegistration>(FrameHandler{}, std::set<ServiceType>{});
    assert(!registry.unregister_callback(stranger));
    assert(registry.size() == 1);
    assert(f.sink->count_containing("handle not registered") == 2);
}

void test_mutation_during_dispatch() {
    std::cout << "\n=== Test 4: mutation during dispatch uses a snapshot ===\n";
    Fixture f;
    CallbackRegistry registry(f.logger);
    int added_calls = 0, victim_calls = 0, first_calls = 0;
    CallbackHandle victim;

    registry.register_callback([&](const KnxIpFrame&, UdpClient&) {
        ++first_calls;
        if (first_calls == 1) {
            registry.register_callback([&](const KnxIpFrame&, UdpClient&) { ++added_calls; });
            registry.unregister_callback(victim);
        }
    });
    victim = registry.register_callback([&](const KnxIpFrame&, UdpClient&) { ++victim_calls; });

    // first pass: the new handler is not visible, the removed one is skipped
    assert(registry.dispatch(frame_of(ServiceType::ROUTING_INDICATION), *f.client) == 1);
    assert(added_calls == 0 && victim_calls == 0);

    // second pass sees the addition
    assert(registry.dispatch(frame_of(ServiceType::ROUTING_INDICATION), *f.client) == 2);
    assert(added_calls == 1 && victim_calls == 0 && first_calls == 2);
}

void test_handler_exception_isolated() {
    std::cout << "\n=== Test 5: a throwing handler does not stop dispatch ===\n";
    Fixture f;
    CallbackRegistry registry(f.logger);
    int after = 0;
    registry.register_callback([](const KnxIpFrame&, UdpClient&) { throw std::runtime_error("handler failed"); });
    registry.register_callback([&](const KnxIpFrame&, UdpClient&) { ++after; });
    assert(registry.dispatch(frame_of(ServiceType::SEARCH_REQUEST), *f.client) == 2);
    assert(after == 1);
    assert(f.sink->count_containing("[ERROR][knxlink.log] Callback for SEARCH_REQUEST (0x0201) threw: handler failed") == 1);
}

void test_unhandled_observation() {
    std::cout << "\n=== Test 6: unmatched frames are recorded, not errors ===\n";
    Fixture f;
    CallbackRegistry registry(f.logger);
    assert(registry.dispatch(frame_of(ServiceType::DESCRIPTION_REQUEST), *f.client) == 0);
    registry.register_callback([](const KnxIpFrame&, UdpClient&) {}, {ServiceType::SEARCH_REQUEST});
    assert(registry.dispatch(frame_of(ServiceType::DESCRIPTION_REQUEST), *f.client) == 0);
    assert(registry.unhandled_count() == 2);
    assert(f.sink->count_containing("[DEBUG][knxlink.log] UNHANDLED: DESCRIPTION_REQUEST (0x0203)") == 2);
    assert(f.sink->get_lines(0, SIZE_MAX, LogLevel::Warning).empty());
}

} // namespace

int main() {
    test_completeness_and_selectivity();
    test_order_and_client_argument();
    test_unregister();
    test_mutation_during_dispatch();
    test_handler_exception_isolated();
    test_unhandled_observation();
    std::cout << "\nAll CallbackRegistry tests passed!\n";
    return 0;
}
