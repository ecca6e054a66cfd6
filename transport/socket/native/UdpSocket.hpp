/**
 * \file UdpSocket.hpp
 * \brief Host OS implementation of IDatagramSocket.
 * \ingroup socket_backend
 * \details Non-blocking IPv4 UDP socket over the BSD socket API. Either opened
 *  here for unicast use (bind + connect) or adopted from an already configured
 *  descriptor (see \ref transport::SocketFactory::create_multicast_socket).
 */
#pragma once

#include "transport/socket/IDatagramSocket.hpp"
#include "transport/socket/SocketErrnoCompat.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

// Forward declare Logger to avoid pulling in logger header here
class Logger;

/** \brief OS-backed datagram socket.
 *  \ingroup socket_backend
 */
class UdpSocket : public IDatagramSocket {
public:
    // === Construction & Lifecycle ===
    /** \brief Create an unopened socket; call \ref open_unicast to use it. */
    explicit UdpSocket(std::shared_ptr<Logger> logger = nullptr);

    /** \brief Take ownership of an already created and configured descriptor.
     *  \param existing_fd Descriptor in non-blocking mode.
     *  \param type Backend identifier reported by \ref socket_type.
     */
    UdpSocket(transport::native_socket_t existing_fd, std::string type, std::shared_ptr<Logger> logger = nullptr);

    /** \brief Destructor closes the descriptor if still open. */
    ~UdpSocket() override;

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    /** \brief Create, bind to `local` and connect to `remote`.
     *  \details Host names are resolved first; a failed lookup reports a resolver error.
     *  \param error Receives the OS error of the failing step.
     *  \return true on success; on failure the descriptor is closed.
     */
    bool open_unicast(const transport::Address& local, const transport::Address& remote, std::error_code& error);

    // === IDatagramSocket ===
    bool try_receive(void* buffer, size_t size, size_t& bytes_read,
                     std::optional<transport::Address>& from, std::error_code& error) override;
    bool try_send(const void* buffer, size_t size, const std::optional<transport::Address>& to,
                  size_t& bytes_written, std::error_code& error) override;

    // === ISocketLifecycle ===
    void close() override;
    bool is_open() const override;
    long long get_handle() const override;
    std::optional<transport::Address> local_endpoint() const override;
    std::optional<transport::Address> remote_endpoint() const override;
    std::string socket_type() const override { return type_; }

private:
    void fail_step(const char* step, std::error_code& error);

    transport::native_socket_t socket_fd_{transport::invalid_native_socket};
    mutable std::mutex socket_mtx_;
    std::string type_{"udp"};
    std::shared_ptr<Logger> logger_;
};
