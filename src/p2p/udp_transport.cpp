#include "lanshare/p2p/udp_transport.h"
#include "lanshare/base/logger.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lanshare {

namespace {

bool make_address(const std::string& address, uint16_t port, sockaddr_in& out) {
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    return inet_pton(AF_INET, address.c_str(), &out.sin_addr) == 1;
}

} // anonymous namespace

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : fd_(other.fd_) {
    other.fd_ = -1;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

std::optional<UdpSocket> UdpSocket::bind(const std::string& address, uint16_t port,
                                         bool enable_broadcast, std::error_code& error) {
    sockaddr_in addr;
    if (!make_address(address, port, addr)) {
        error = make_error_code(ErrorCode::InvalidArgument);
        Logger::instance().error("Invalid bind address: {}", address);
        return std::nullopt;
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        error = std::error_code(errno, std::system_category());
        Logger::instance().error("Failed to create UDP socket: {}", strerror(errno));
        return std::nullopt;
    }
    UdpSocket sock(fd);

    int optval = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));
    if (enable_broadcast &&
        ::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &optval, sizeof(optval)) < 0) {
        Logger::instance().warning("Failed to enable SO_BROADCAST: {}", strerror(errno));
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = std::error_code(errno, std::system_category());
        Logger::instance().error("Failed to bind UDP socket to {}:{}: {}", address, port, strerror(errno));
        return std::nullopt;
    }

    error.clear();
    return std::optional<UdpSocket>(std::move(sock));
}

uint16_t UdpSocket::local_port() const {
    sockaddr_in addr;
    socklen_t len = sizeof(addr);
    if (fd_ < 0 || ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

std::error_code UdpSocket::send_to(const std::string& address, uint16_t port, const std::string& data) {
    if (fd_ < 0) {
        return make_error_code(ErrorCode::NotRunning);
    }
    sockaddr_in dest;
    if (!make_address(address, port, dest)) {
        return make_error_code(ErrorCode::InvalidArgument);
    }

    ssize_t sent = ::sendto(fd_, data.data(), data.size(), 0,
                            reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        return std::error_code(errno, std::system_category());
    }
    if (static_cast<size_t>(sent) != data.size()) {
        return make_error_code(ErrorCode::SendFailed);
    }
    return {};
}

ReceiveResult UdpSocket::receive(Datagram& out, int timeout_ms) {
    if (fd_ < 0) {
        return ReceiveResult::Error;
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int ready = ::poll(&pfd, 1, timeout_ms);
    if (ready == 0) {
        return ReceiveResult::Timeout;
    }
    if (ready < 0) {
        return errno == EINTR ? ReceiveResult::Timeout : ReceiveResult::Error;
    }

    out.data.resize(MAX_DATAGRAM_SIZE);
    sockaddr_in src;
    socklen_t src_len = sizeof(src);
    // MSG_TRUNC makes recvfrom report the real datagram length
    ssize_t len = ::recvfrom(fd_, out.data.data(), out.data.size(), MSG_TRUNC | MSG_DONTWAIT,
                             reinterpret_cast<sockaddr*>(&src), &src_len);
    if (len < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return ReceiveResult::Timeout;
        }
        return ReceiveResult::Error;
    }

    char addr_buf[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &src.sin_addr, addr_buf, sizeof(addr_buf));
    out.source_address = addr_buf;
    out.source_port = ntohs(src.sin_port);

    if (static_cast<size_t>(len) > MAX_DATAGRAM_SIZE) {
        out.data.clear();
        return ReceiveResult::Oversized;
    }
    out.data.resize(static_cast<size_t>(len));
    return ReceiveResult::Received;
}

void UdpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

UdpTransport::UdpTransport(std::string bind_address)
    : bind_address_(std::move(bind_address)) {}

UdpTransport::~UdpTransport() {
    close();
}

std::error_code UdpTransport::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (socket_) {
        return {};
    }
    std::error_code ec;
    socket_ = UdpSocket::bind(bind_address_, 0, true, ec);
    return ec;
}

void UdpTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    socket_.reset();
}

std::error_code UdpTransport::send_to(const std::string& address, uint16_t port, const std::string& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!socket_) {
        return make_error_code(ErrorCode::NotRunning);
    }
    return socket_->send_to(address, port, data);
}

std::error_code UdpTransport::broadcast(const std::string& broadcast_address, uint16_t port,
                                        const std::string& data) {
    return send_to(broadcast_address, port, data);
}

} // namespace lanshare
