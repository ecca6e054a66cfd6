/**
 * \file UdpClient.hpp
 * \brief KNXnet/IP UDP client: socket lifecycle, framing and callback dispatch.
 * \details Typical use:
 * \code
 *   auto client = transport::UdpClient::create(Address("192.168.1.10", 0),
 *                                              Address("224.0.23.12", 3671), true,
 *                                              LogChannels::from(logger));
 *   client->register_callback(on_frame, {ServiceType::ROUTING_INDICATION});
 *   client->connect();
 *   client->send(frame);
 *   client->stop();
 * \endcode
 */
#pragma once

#include "CallbackRegistry.hpp"
#include "LogChannels.hpp"
#include "UdpEndpoint.hpp"
#include "knxip/IFrameCodec.hpp"
#include "transport/io/IoContext.hpp"
#include "transport/socket/Address.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>

namespace transport {

enum class TransportState { Unconnected, Connected, Closed };

const char* to_string(TransportState state) noexcept;

/**
 * \brief Orchestrates one UDP endpoint, the frame codec and a \ref CallbackRegistry.
 * \details Unconnected -> Connected on `connect()`, Connected -> Closed on
 * `stop()`; instances are single-use. Received frames are decoded and
 * dispatched on the thread driving the client's \ref IoContext. `send`,
 * `stop` and (un)registration may be called from any thread.
 *
 * Instances must be owned by a `std::shared_ptr` (use \ref create); the
 * endpoint reaches the client through a weak reference.
 */
class UdpClient : public IEndpointListener, public std::enable_shared_from_this<UdpClient> {
public:
    /**
     * \param local_addr Bind target (unicast) or own interface IP (multicast; port unused).
     * \param remote_addr Peer (unicast) or multicast group.
     * \param context Loop for receive and callbacks; defaults to \ref default_context().
     * \param codec Frame codec; defaults to \ref KnxLink::KnxIp::KnxIpCodec.
     */
    UdpClient(Address local_addr, Address remote_addr, bool multicast = false, LogChannels logs = {},
              std::shared_ptr<IoContext> context = nullptr,
              std::shared_ptr<const KnxLink::KnxIp::IFrameCodec> codec = nullptr);
    ~UdpClient() override;

    UdpClient(const UdpClient&) = delete;
    UdpClient& operator=(const UdpClient&) = delete;

    static std::shared_ptr<UdpClient> create(Address local_addr, Address remote_addr, bool multicast = false,
                                             LogChannels logs = {}, std::shared_ptr<IoContext> context = nullptr,
                                             std::shared_ptr<const KnxLink::KnxIp::IFrameCodec> codec = nullptr);

    /** \brief Open the socket and start receiving.
     *  \throws SocketError on OS or host lookup failure (state stays Unconnected).
     *  \throws ConfigurationError in multicast mode when a host is not an IPv4 literal.
     *  \throws TransportError if the client was stopped.
     */
    void connect();

    /** \brief Encode and send `frame`.
     *  \throws TransportNotConnectedError unless Connected.
     */
    void send(const KnxLink::KnxIp::KnxIpFrame& frame);

    /** \brief Close the endpoint; idempotent, no-op when never connected. */
    void stop();

    CallbackHandle register_callback(FrameHandler handler, std::set<KnxLink::KnxIp::ServiceType> service_types = {});
    bool unregister_callback(const CallbackHandle& handle);

    /** \brief Bound address of the live socket; empty unless Connected. */
    std::optional<Address> get_local_address() const;
    /** \brief Peer of the live socket; empty unless Connected and for multicast. */
    std::optional<Address> get_remote_address() const;

    /** \brief Receive path entry: decode `raw` and dispatch. Never throws on bad input. */
    void on_raw_received(std::span<const uint8_t> raw);

    TransportState state() const;
    bool is_multicast() const noexcept { return multicast_; }
    const Address& local_addr() const noexcept { return local_addr_; }
    const Address& remote_addr() const noexcept { return remote_addr_; }
    const std::shared_ptr<IoContext>& context() const noexcept { return context_; }
    size_t unhandled_count() const noexcept { return registry_.unhandled_count(); }

    // IEndpointListener
    void on_connected() override;
    void on_bytes_received(std::span<const uint8_t> raw, const std::optional<Address>& from) override;
    void on_error(const std::error_code& error) override;
    void on_closed() override;

private:
    std::shared_ptr<IDatagramSocket> open_socket() const;

    const Address local_addr_;
    const Address remote_addr_;
    const bool multicast_;
    LogChannels logs_;
    std::shared_ptr<IoContext> context_;
    std::shared_ptr<const KnxLink::KnxIp::IFrameCodec> codec_;
    CallbackRegistry registry_;

    mutable std::mutex state_mutex_;
    TransportState state_{TransportState::Unconnected};
    std::shared_ptr<UdpEndpoint> endpoint_;
};

} // namespace transport
