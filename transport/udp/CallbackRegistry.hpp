/**
 * \file CallbackRegistry.hpp
 * \brief Ordered (handler, service-type filter) registrations and frame dispatch.
 */
#pragma once

#include "knxip/KnxIpFrame.hpp"
#include "logger.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace transport {

class UdpClient;

/** \brief Frame consumer; receives the decoded frame and the client it arrived on. */
using FrameHandler = std::function<void(const KnxLink::KnxIp::KnxIpFrame&, UdpClient&)>;

/** \brief One registration. An empty filter matches every service type. */
struct CallbackRegistration {
    CallbackRegistration(FrameHandler h, std::set<KnxLink::KnxIp::ServiceType> types)
        : handler(std::move(h)), service_types(std::move(types)) {}

    bool has_service(KnxLink::KnxIp::ServiceType type) const {
        return service_types.empty() || service_types.count(type) > 0;
    }

    const FrameHandler handler;
    const std::set<KnxLink::KnxIp::ServiceType> service_types;
    std::atomic<bool> active{true};  ///< cleared on unregistration
};

/** \brief Handle returned by registration; compared by identity. */
using CallbackHandle = std::shared_ptr<CallbackRegistration>;

/**
 * \brief Registration list with in-order dispatch.
 * \details Thread-safe. `dispatch` iterates a snapshot taken at the start of
 * the pass, so registrations added by a handler take effect from the next
 * frame, while an unregistered entry is skipped immediately. Handlers run
 * without the registry lock held.
 */
class CallbackRegistry {
public:
    explicit CallbackRegistry(std::shared_ptr<Logger> logger = nullptr) : logger_(std::move(logger)) {}

    /** \brief Append a registration; returns its handle. */
    CallbackHandle register_callback(FrameHandler handler, std::set<KnxLink::KnxIp::ServiceType> service_types = {});

    /** \brief Remove `handle`. Unknown or already removed handles are ignored.
     *  \return true if a registration was removed.
     */
    bool unregister_callback(const CallbackHandle& handle);

    /** \brief Invoke every matching handler in registration order.
     *  \details A handler that throws a `std::exception` is logged and the pass
     *  continues with the next handler. Anything else a handler throws is not
     *  caught and propagates out of the dispatch.
     *  \return Number of handlers invoked.
     */
    size_t dispatch(const KnxLink::KnxIp::KnxIpFrame& frame, UdpClient& client);

    size_t size() const;
    /** \brief Frames for which no registration matched. */
    size_t unhandled_count() const noexcept { return unhandled_.load(std::memory_order_relaxed); }

private:
    std::shared_ptr<Logger> logger_;
    mutable std::mutex mutex_;
    std::vector<CallbackHandle> callbacks_;
    std::atomic<size_t> unhandled_{0};
};

} // namespace transport
