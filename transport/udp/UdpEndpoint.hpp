/**
 * \file UdpEndpoint.hpp
 * \brief Live send/receive channel of one UDP client.
 * \details Wraps an \ref IDatagramSocket and drives its receive side from an
 * \ref transport::IoContext poller. Owners observe it through \ref IEndpointListener;
 * the endpoint never parses what it receives.
 */
#pragma once

#include "LogChannels.hpp"
#include "transport/io/IoContext.hpp"
#include "transport/socket/Address.hpp"
#include "transport/socket/IDatagramSocket.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

namespace transport {

/** \brief Callbacks raised by a \ref UdpEndpoint on the I/O context thread. */
class IEndpointListener {
public:
    virtual ~IEndpointListener() = default;

    virtual void on_connected() = 0;
    /** \brief One datagram; `raw` is only valid for the duration of the call. */
    virtual void on_bytes_received(std::span<const uint8_t> raw, const std::optional<Address>& from) = 0;
    /** \brief Non-fatal receive error (e.g. ICMP port unreachable); receiving continues. */
    virtual void on_error(const std::error_code& error) = 0;
    /** \brief Emitted once after \ref UdpEndpoint::close; nothing follows it. */
    virtual void on_closed() = 0;
};

/** \brief OS-level UDP channel with a persistent receive poller.
 *  \details Lifetime: the poller registered by \ref open holds a strong
 *  reference to the endpoint until it observes \ref close, and only a weak one
 *  to the listener.
 */
class UdpEndpoint : public std::enable_shared_from_this<UdpEndpoint> {
public:
    /** \brief Upper bound of datagrams read per poller pass. */
    static constexpr size_t kMaxDatagramsPerPass = 32;
    /** \brief Receive buffer size (largest UDP payload). */
    static constexpr size_t kMaxDatagramSize = 65535;

    /**
     * \param socket Opened datagram socket; ownership is shared with the endpoint.
     * \param context Loop that runs the poller and every listener callback.
     * \param destination Explicit send target (multicast group); empty uses the connected peer.
     */
    UdpEndpoint(std::shared_ptr<IDatagramSocket> socket, std::shared_ptr<IoContext> context,
                std::optional<Address> destination, LogChannels logs);
    ~UdpEndpoint();

    UdpEndpoint(const UdpEndpoint&) = delete;
    UdpEndpoint& operator=(const UdpEndpoint&) = delete;

    /** \brief Post `on_connected` and register the receive poller. Call at most once. */
    void open(std::weak_ptr<IEndpointListener> listener);

    /** \brief Best-effort non-blocking send to the explicit destination or the connected peer.
     *  \throws SocketError if the socket is already closed.
     */
    void write(std::span<const uint8_t> bytes);

    /** \brief Close the socket; the poller then emits `on_closed` and retires. Idempotent. */
    void close();

    bool is_open() const;

    /** \brief Kernel view of the bound address (getsockname). */
    std::optional<Address> local_address() const;
    /** \brief Kernel view of the peer (getpeername); empty for multicast sockets. */
    std::optional<Address> remote_address() const;

private:
    /** \brief Receive poller body; returns true once the endpoint is closed. */
    bool poll_receive(const std::weak_ptr<IEndpointListener>& listener);
    void finish(const std::weak_ptr<IEndpointListener>& listener);

    std::shared_ptr<IDatagramSocket> socket_;
    std::weak_ptr<IoContext> context_;  // owned by the client
    std::optional<Address> destination_;
    LogChannels logs_;

    std::vector<uint8_t> buffer_;
    std::atomic<bool> opened_{false};
    std::atomic<bool> closing_{false};
    bool closed_notified_{false};  // poller thread only
};

} // namespace transport
