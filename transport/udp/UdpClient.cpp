/**
 * \file UdpClient.cpp
 * \brief Connection lifecycle and receive path of \ref transport::UdpClient.
 */
#include "UdpClient.hpp"
#include "knxip/KnxIpCodec.hpp"
#include "transport/TransportErrors.hpp"
#include "transport/socket/SocketFactory.hpp"

#include <stdexcept>

namespace transport {

using KnxLink::KnxIp::CouldNotParseKnxIp;
using KnxLink::KnxIp::KnxIpFrame;
using KnxLink::KnxIp::ServiceType;

const char* to_string(TransportState state) noexcept {
    switch (state) {
        case TransportState::Unconnected: return "Unconnected";
        case TransportState::Connected: return "Connected";
        case TransportState::Closed: return "Closed";
        default: return "Unknown";
    }
}

UdpClient::UdpClient(Address local_addr, Address remote_addr, bool multicast, LogChannels logs,
                     std::shared_ptr<IoContext> context,
                     std::shared_ptr<const KnxLink::KnxIp::IFrameCodec> codec)
    : local_addr_(std::move(local_addr)),
      remote_addr_(std::move(remote_addr)),
      multicast_(multicast),
      logs_(std::move(logs)),
      context_(context ? std::move(context) : default_context()),
      codec_(codec ? std::move(codec) : std::make_shared<KnxLink::KnxIp::KnxIpCodec>()),
      registry_(logs_.general) {}

UdpClient::~UdpClient() {
    std::shared_ptr<UdpEndpoint> endpoint;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        endpoint = std::move(endpoint_);
    }
    if (endpoint) endpoint->close();
}

std::shared_ptr<UdpClient> UdpClient::create(Address local_addr, Address remote_addr, bool multicast,
                                             LogChannels logs, std::shared_ptr<IoContext> context,
                                             std::shared_ptr<const KnxLink::KnxIp::IFrameCodec> codec) {
    return std::make_shared<UdpClient>(std::move(local_addr), std::move(remote_addr), multicast, std::move(logs),
                                       std::move(context), std::move(codec));
}

std::shared_ptr<IDatagramSocket> UdpClient::open_socket() const {
    if (multicast_) {
        return SocketFactory::create_multicast_socket(local_addr_.host(), remote_addr_, logs_.general);
    }
    return SocketFactory::create_unicast_socket(local_addr_, remote_addr_, logs_.general);
}

void UdpClient::connect() {
    std::weak_ptr<UdpClient> self = weak_from_this();
    if (self.expired()) {
        throw std::logic_error("UdpClient must be owned by a std::shared_ptr (use UdpClient::create)");
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == TransportState::Connected) {
        if (logs_.general) logs_.general->debug("connect(): already connected");
        return;
    }
    if (state_ == TransportState::Closed) {
        throw TransportError("connect() on a stopped client; create a new instance");
    }

    // SocketError (ConfigurationError for a multicast host name) propagates with the state left Unconnected
    auto socket = open_socket();
    std::optional<Address> destination;
    if (multicast_) destination = remote_addr_;
    endpoint_ = std::make_shared<UdpEndpoint>(std::move(socket), context_, destination, logs_);
    endpoint_->open(std::weak_ptr<IEndpointListener>(self.lock()));
    state_ = TransportState::Connected;

    if (logs_.general) {
        logs_.general->debug(std::string(multicast_ ? "Multicast" : "Unicast") + " transport connected: " +
                             local_addr_.to_string() + " -> " + remote_addr_.to_string());
    }
}

void UdpClient::send(const KnxIpFrame& frame) {
    std::shared_ptr<UdpEndpoint> endpoint;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != TransportState::Connected || !endpoint_) {
            throw TransportNotConnectedError();
        }
        endpoint = endpoint_;
    }

    if (logs_.knx) logs_.knx->debug("Sending: " + frame.to_string());
    const auto bytes = codec_->encode(frame);
    try {
        endpoint->write(bytes);
    } catch (const SocketError&) {
        // lost a race with stop()
        if (state() != TransportState::Connected) throw TransportNotConnectedError();
        throw;
    }
}

void UdpClient::stop() {
    std::shared_ptr<UdpEndpoint> endpoint;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != TransportState::Connected) return;
        state_ = TransportState::Closed;
        endpoint = std::move(endpoint_);
    }
    if (endpoint) endpoint->close();
}

CallbackHandle UdpClient::register_callback(FrameHandler handler, std::set<ServiceType> service_types) {
    return registry_.register_callback(std::move(handler), std::move(service_types));
}

bool UdpClient::unregister_callback(const CallbackHandle& handle) {
    return registry_.unregister_callback(handle);
}

std::optional<Address> UdpClient::get_local_address() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != TransportState::Connected || !endpoint_) return std::nullopt;
    return endpoint_->local_address();
}

std::optional<Address> UdpClient::get_remote_address() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != TransportState::Connected || !endpoint_) return std::nullopt;
    return endpoint_->remote_address();
}

TransportState UdpClient::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void UdpClient::on_raw_received(std::span<const uint8_t> raw) {
    if (raw.empty()) return;

    KnxIpFrame frame;
    try {
        frame = codec_->decode(raw);
    } catch (const CouldNotParseKnxIp& e) {
        if (logs_.general) logs_.general->error(e.what());
        return;
    }
    if (logs_.knx) logs_.knx->debug("Received: " + frame.to_string());
    registry_.dispatch(frame, *this);
}

void UdpClient::on_connected() {
    if (logs_.general) logs_.general->debug("Transport ready on " + local_addr_.to_string());
}

void UdpClient::on_bytes_received(std::span<const uint8_t> raw, const std::optional<Address>&) {
    on_raw_received(raw);
}

void UdpClient::on_error(const std::error_code&) {
    // already logged by the endpoint; datagram transport keeps receiving
}

void UdpClient::on_closed() {
    if (logs_.general) logs_.general->info("Closing transport.");
}

} // namespace transport
