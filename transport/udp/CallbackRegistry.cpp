#include "CallbackRegistry.hpp"

#include <algorithm>
#include <exception>

namespace transport {

using KnxLink::KnxIp::KnxIpFrame;
using KnxLink::KnxIp::ServiceType;

CallbackHandle CallbackRegistry::register_callback(FrameHandler handler, std::set<ServiceType> service_types) {
    auto registration = std::make_shared<CallbackRegistration>(std::move(handler), std::move(service_types));
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(registration);
    return registration;
}

bool CallbackRegistry::unregister_callback(const CallbackHandle& handle) {
    if (!handle) return false;
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(callbacks_.begin(), callbacks_.end(), handle);
        if (it != callbacks_.end()) {
            (*it)->active = false;
            callbacks_.erase(it);
            removed = true;
        }
    }
    if (!removed && logger_) logger_->debug("unregister_callback: handle not registered");
    return removed;
}

size_t CallbackRegistry::dispatch(const KnxIpFrame& frame, UdpClient& client) {
    std::vector<CallbackHandle> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = callbacks_;
    }

    size_t invoked = 0;
    for (const auto& registration : snapshot) {
        if (!registration->active || !registration->has_service(frame.service_type())) continue;
        ++invoked;
        if (!registration->handler) continue;
        try {
            registration->handler(frame, client);
        } catch (const std::exception& e) {
            if (logger_) {
                logger_->error("Callback for " + KnxLink::KnxIp::describe_service_type(frame.service_type()) +
                               " threw: " + e.what());
            }
        }
    }

    if (invoked == 0) {
        unhandled_.fetch_add(1, std::memory_order_relaxed);
        if (logger_) logger_->debug("UNHANDLED: " + KnxLink::KnxIp::describe_service_type(frame.service_type()));
    }
    return invoked;
}

size_t CallbackRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return callbacks_.size();
}

} // namespace transport
