#include "UdpSocket.hpp"
#include "logger.hpp"

using transport::Address;
using transport::SocketErrnoCompat;
using transport::invalid_native_socket;
using transport::native_socket_t;

UdpSocket::UdpSocket(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {}

UdpSocket::UdpSocket(native_socket_t existing_fd, std::string type, std::shared_ptr<Logger> logger)
    : socket_fd_(existing_fd), type_(std::move(type)), logger_(std::move(logger)) {}

UdpSocket::~UdpSocket() {
    close();
}

void UdpSocket::fail_step(const char* step, std::error_code& error) {
    error = SocketErrnoCompat::last_error_code();
    if (logger_) {
        logger_->error(std::string("UdpSocket: ") + step + " failed: " + error.message());
    }
    if (socket_fd_ != invalid_native_socket) {
        SocketErrnoCompat::close_socket(socket_fd_);
        socket_fd_ = invalid_native_socket;
    }
}

bool UdpSocket::open_unicast(const Address& local, const Address& remote, std::error_code& error) {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    if (socket_fd_ != invalid_native_socket) {
        error = std::make_error_code(std::errc::already_connected);
        return false;
    }
    SocketErrnoCompat::ensure_initialized();

    const auto local_resolved = local.resolve(error);
    if (!local_resolved) {
        if (logger_) logger_->error("UdpSocket: resolve " + local.host() + " failed: " + error.message());
        return false;
    }
    const auto remote_resolved = remote.resolve(error);
    if (!remote_resolved) {
        if (logger_) logger_->error("UdpSocket: resolve " + remote.host() + " failed: " + error.message());
        return false;
    }

    socket_fd_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_fd_ == invalid_native_socket) {
        fail_step("socket", error);
        return false;
    }
    if (!SocketErrnoCompat::set_non_blocking(socket_fd_)) {
        fail_step("set non-blocking", error);
        return false;
    }

    sockaddr_in addr{};
    local_resolved->to_sockaddr(addr);
    if (::bind(socket_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        fail_step(("bind " + local_resolved->to_string()).c_str(), error);
        return false;
    }

    // Datagram connect only fixes the default peer; it completes immediately.
    remote_resolved->to_sockaddr(addr);
    if (::connect(socket_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        fail_step(("connect " + remote_resolved->to_string()).c_str(), error);
        return false;
    }

    error = std::error_code{};
    if (logger_) logger_->debug("UdpSocket: bound " + local_resolved->to_string() + " -> " + remote_resolved->to_string());
    return true;
}

bool UdpSocket::try_receive(void* buffer, size_t size, size_t& bytes_read,
                            std::optional<Address>& from, std::error_code& error) {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    bytes_read = 0;
    if (socket_fd_ == invalid_native_socket) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return true;
    }

    sockaddr_in sender{};
    socklen_t sender_len = sizeof(sender);
    auto result = ::recvfrom(socket_fd_, static_cast<char*>(buffer), static_cast<int>(size), 0,
                             reinterpret_cast<sockaddr*>(&sender), &sender_len);
    if (result >= 0) {
        bytes_read = static_cast<size_t>(result);
        from = Address::from_sockaddr(sender);
        error = std::error_code{};
        return true;
    }

    int err = SocketErrnoCompat::last_error();
    if (SocketErrnoCompat::is_would_block_errno(err)) {
        return false; // Would block
    }
    error = SocketErrnoCompat::to_error_code(err);
    return true;
}

bool UdpSocket::try_send(const void* buffer, size_t size, const std::optional<Address>& to,
                         size_t& bytes_written, std::error_code& error) {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    bytes_written = 0;
    if (socket_fd_ == invalid_native_socket) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return true;
    }

    decltype(::send(socket_fd_, nullptr, 0, 0)) result;
    if (to) {
        sockaddr_in dest{};
        to->to_sockaddr(dest);
        result = ::sendto(socket_fd_, static_cast<const char*>(buffer), static_cast<int>(size), 0,
                          reinterpret_cast<const sockaddr*>(&dest), sizeof(dest));
    } else {
        result = ::send(socket_fd_, static_cast<const char*>(buffer), static_cast<int>(size), 0);
    }

    if (result >= 0) {
        bytes_written = static_cast<size_t>(result);
        error = std::error_code{};
        return true;
    }
    int err = SocketErrnoCompat::last_error();
    if (SocketErrnoCompat::is_would_block_errno(err)) {
        return false; // Would block
    }
    error = SocketErrnoCompat::to_error_code(err);
    return true;
}

void UdpSocket::close() {
    native_socket_t fd_to_close = invalid_native_socket;
    {
        std::lock_guard<std::mutex> lock(socket_mtx_);
        fd_to_close = socket_fd_;
        socket_fd_ = invalid_native_socket;  // Invalidate immediately under lock
    }
    if (fd_to_close != invalid_native_socket && !SocketErrnoCompat::close_socket(fd_to_close)) {
        if (logger_) {
            logger_->warning("UdpSocket::close: " + SocketErrnoCompat::last_error_code().message());
        }
    }
}

bool UdpSocket::is_open() const {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    return socket_fd_ != invalid_native_socket;
}

long long UdpSocket::get_handle() const {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    if (socket_fd_ == invalid_native_socket) return -1;
    return static_cast<long long>(socket_fd_);
}

std::optional<Address> UdpSocket::local_endpoint() const {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    if (socket_fd_ == invalid_native_socket) return std::nullopt;
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(socket_fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return std::nullopt;
    }
    return Address::from_sockaddr(addr);
}

std::optional<Address> UdpSocket::remote_endpoint() const {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    if (socket_fd_ == invalid_native_socket) return std::nullopt;
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    // Multicast sockets have no peer: getpeername fails with ENOTCONN
    if (::getpeername(socket_fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return std::nullopt;
    }
    return Address::from_sockaddr(addr);
}
