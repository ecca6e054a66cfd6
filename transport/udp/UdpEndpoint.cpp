/**
 * \file UdpEndpoint.cpp
 * \brief Receive poller and send path of \ref transport::UdpEndpoint.
 */
#include "UdpEndpoint.hpp"
#include "knxip/KnxIpFrame.hpp"
#include "transport/TransportErrors.hpp"

#include <stdexcept>

namespace transport {

UdpEndpoint::UdpEndpoint(std::shared_ptr<IDatagramSocket> socket, std::shared_ptr<IoContext> context,
                         std::optional<Address> destination, LogChannels logs)
    : socket_(std::move(socket)),
      context_(std::move(context)),
      destination_(std::move(destination)),
      logs_(std::move(logs)),
      buffer_(kMaxDatagramSize) {
    if (!socket_ || context_.expired()) {
        throw std::invalid_argument("UdpEndpoint requires a socket and an IoContext");
    }
}

UdpEndpoint::~UdpEndpoint() {
    if (socket_) socket_->close();
}

void UdpEndpoint::open(std::weak_ptr<IEndpointListener> listener) {
    if (opened_.exchange(true)) {
        throw std::logic_error("UdpEndpoint::open called twice");
    }
    auto context = context_.lock();
    if (!context) {
        throw std::logic_error("UdpEndpoint::open: IoContext is gone");
    }
    auto self = shared_from_this();
    context->post([self, listener]() {
        if (self->closing_) return;
        if (auto l = listener.lock()) l->on_connected();
    });
    context->register_pending(IoContext::PendingOpCategory::Receive, [self, listener]() {
        return self->poll_receive(listener);
    });
}

bool UdpEndpoint::poll_receive(const std::weak_ptr<IEndpointListener>& listener) {
    if (closing_) {
        finish(listener);
        return true;
    }

    for (size_t i = 0; i < kMaxDatagramsPerPass; ++i) {
        size_t bytes_read = 0;
        std::optional<Address> from;
        std::error_code ec;
        if (!socket_->try_receive(buffer_.data(), buffer_.size(), bytes_read, from, ec)) {
            return false; // nothing more this pass
        }
        if (closing_ || ec == std::errc::bad_file_descriptor) {
            finish(listener);
            return true;
        }

        auto l = listener.lock();
        if (!l) {
            // owner is gone; nobody can observe this endpoint any more
            close();
            finish(listener);
            return true;
        }
        if (ec) {
            if (logs_.general) logs_.general->warning("Error received: " + ec.message());
            l->on_error(ec);
            continue;
        }

        std::span<const uint8_t> raw(buffer_.data(), bytes_read);
        if (logs_.raw_socket) {
            logs_.raw_socket->debug("Received from " + (from ? from->to_string() : std::string("?")) + ": " +
                                    KnxLink::KnxIp::to_hex(raw));
        }
        l->on_bytes_received(raw, from);
    }
    return false;
}

void UdpEndpoint::finish(const std::weak_ptr<IEndpointListener>& listener) {
    if (closed_notified_) return;
    closed_notified_ = true;
    if (auto l = listener.lock()) l->on_closed();
}

void UdpEndpoint::write(std::span<const uint8_t> bytes) {
    if (closing_ || !socket_->is_open()) {
        throw SocketError(std::make_error_code(std::errc::bad_file_descriptor), "UdpEndpoint::write on closed socket");
    }
    size_t sent = 0;
    std::error_code ec;
    if (!socket_->try_send(bytes.data(), bytes.size(), destination_, sent, ec)) {
        if (logs_.general) logs_.general->warning("Send would block; datagram dropped");
        return;
    }
    if (ec) {
        if (ec == std::errc::bad_file_descriptor) {
            throw SocketError(ec, "UdpEndpoint::write on closed socket");
        }
        if (logs_.general) logs_.general->warning("Send failed: " + ec.message());
        return;
    }
    if (sent != bytes.size() && logs_.general) {
        logs_.general->warning("Short datagram send: " + std::to_string(sent) + "/" + std::to_string(bytes.size()));
    }
}

void UdpEndpoint::close() {
    if (closing_.exchange(true)) return;
    socket_->close();
    if (logs_.general) logs_.general->debug("UdpEndpoint closed");
}

bool UdpEndpoint::is_open() const {
    return !closing_ && socket_->is_open();
}

std::optional<Address> UdpEndpoint::local_address() const {
    if (closing_) return std::nullopt;
    return socket_->local_endpoint();
}

std::optional<Address> UdpEndpoint::remote_address() const {
    if (closing_) return std::nullopt;
    return socket_->remote_endpoint();
}

} // namespace transport
