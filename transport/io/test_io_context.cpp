/**
 * @file test_io_context.cpp
 * @brief IoContext posting, polling and threaded loop behaviour.
 */

#include "IoContext.hpp"
#include "logger.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using transport::IoContext;

namespace {

void test_post_and_poll() {
    std::cout << "\n=== Test 1: posted tasks run once, in order, on poll_once ===\n";
    IoContext ctx;
    std::vector<int> order;
    ctx.post([&] { order.push_back(1); });
    ctx.post([&] { order.push_back(2); });
    assert(ctx.pending_count() == 2);
    assert(ctx.poll_once() == 2);
    assert((order == std::vector<int>{1, 2}));
    assert(ctx.poll_once() == 0);
    assert(ctx.get_operations_processed(IoContext::PendingOpCategory::Task) == 2);
}

void test_pending_retry() {
    std::cout << "\n=== Test 2: unfinished operations are retried until complete ===\n";
    IoContext ctx;
    int attempts = 0;
    ctx.register_pending(IoContext::PendingOpCategory::Receive, [&] { return ++attempts == 3; });
    assert(ctx.poll_once() == 0);
    assert(ctx.poll_once() == 0);
    assert(ctx.poll_once() == 1);
    assert(attempts == 3);
    assert(ctx.pending_count() == 0);
    assert(ctx.get_operations_processed(IoContext::PendingOpCategory::Receive) == 1);
}

void test_exception_contained() {
    std::cout << "\n=== Test 3: a throwing operation is logged and dropped ===\n";
    auto logger = std::make_shared<Logger>("test");
    auto sink = std::make_shared<VectorSink>();
    sink->set_level(LogLevel::Debug);
    logger->add_sink(sink);

    IoContext ctx;
    ctx.set_logger(logger);
    bool later_ran = false;
    ctx.post([] { throw std::runtime_error("boom"); });
    ctx.post([&] { later_ran = true; });
    assert(ctx.poll_once() == 2);
    assert(later_ran);
    assert(sink->count_containing("boom") == 1);
}

void test_work_registered_during_pass() {
    std::cout << "\n=== Test 4: work registered by an operation runs on the next pass ===\n";
    IoContext ctx;
    int inner = 0;
    ctx.post([&] { ctx.post([&] { ++inner; }); });
    assert(ctx.poll_once() == 1);
    assert(inner == 0);
    assert(ctx.poll_once() == 1);
    assert(inner == 1);
}

void test_event_thread() {
    std::cout << "\n=== Test 5: event thread runs posted work and stops cleanly ===\n";
    IoContext ctx;
    ctx.set_poll_interval(std::chrono::milliseconds(1));
    ctx.start();
    assert(ctx.is_running());

    std::atomic<bool> ran{false};
    std::atomic<bool> on_loop_thread{false};
    ctx.post([&] {
        on_loop_thread = ctx.running_in_this_thread();
        ran = true;
    });
    for (int i = 0; i < 500 && !ran; ++i) std::this_thread::sleep_for(std::chrono::milliseconds(2));
    assert(ran);
    assert(on_loop_thread);
    assert(!ctx.running_in_this_thread());

    ctx.stop();
    assert(!ctx.is_running());
    ctx.stop(); // idempotent
    std::cout << "  " << ctx.format_statistics() << "\n";
}

void test_default_context_shared() {
    std::cout << "\n=== Test 6: default_context is shared while alive ===\n";
    auto a = transport::default_context();
    auto b = transport::default_context();
    assert(a == b);
    assert(a->is_running());
}

void test_released_context_retires() {
    std::cout << "\n=== Test 7: a started context released by its owner retires on its event thread ===\n";
    auto logger = std::make_shared<Logger>("test");
    auto sink = std::make_shared<VectorSink>();
    sink->set_level(LogLevel::Debug);
    logger->add_sink(sink);

    auto ctx = std::make_shared<IoContext>();
    ctx->set_logger(logger);
    ctx->set_poll_interval(std::chrono::milliseconds(1));
    ctx->start();

    std::atomic<bool> task_done{false};
    std::weak_ptr<IoContext> weak = ctx;
    ctx->post([&task_done] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        task_done = true;
    });
    ctx.reset(); // the event thread now holds the last reference

    for (int i = 0; i < 500 && !weak.expired(); ++i) std::this_thread::sleep_for(std::chrono::milliseconds(2));
    assert(task_done);
    assert(weak.expired());
    assert(sink->count_containing("event loop retiring") == 1);
    assert(sink->count_containing("IoContext main loop finished") == 1);
}

} // namespace

int main() {
    test_post_and_poll();
    test_pending_retry();
    test_exception_contained();
    test_work_registered_during_pass();
    test_event_thread();
    test_default_context_shared();
    test_released_context_retires();
    std::cout << "\nAll IoContext tests passed!\n";
    return 0;
}
