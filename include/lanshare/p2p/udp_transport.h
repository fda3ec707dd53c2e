#ifndef LANSHARE_P2P_UDP_TRANSPORT_H
#define LANSHARE_P2P_UDP_TRANSPORT_H

#include "lanshare/base/error_code.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace lanshare {

// Largest datagram the receive side accepts
static constexpr size_t MAX_DATAGRAM_SIZE = 64 * 1024;

struct Datagram {
    std::string data;
    std::string source_address;
    uint16_t source_port = 0;
};

enum class ReceiveResult {
    Received,
    Timeout,
    Oversized,
    Error
};

// Owning wrapper around a UDP socket file descriptor
class UdpSocket {
public:
    UdpSocket() = default;
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    // Bind to address:port (port 0 = ephemeral). Returns nullopt and sets
    // error on failure.
    static std::optional<UdpSocket> bind(const std::string& address, uint16_t port,
                                         bool enable_broadcast, std::error_code& error);

    bool is_open() const { return fd_ >= 0; }
    uint16_t local_port() const;

    std::error_code send_to(const std::string& address, uint16_t port, const std::string& data);

    // Wait up to timeout_ms for one datagram
    ReceiveResult receive(Datagram& out, int timeout_ms);

    void close();

private:
    explicit UdpSocket(int fd) : fd_(fd) {}

    int fd_ = -1;
};

// Outbound datagram seam used by the broadcaster and send_text
class DatagramTransport {
public:
    virtual ~DatagramTransport() = default;

    virtual std::error_code send_to(const std::string& address, uint16_t port,
                                    const std::string& data) = 0;

    virtual std::error_code broadcast(const std::string& broadcast_address, uint16_t port,
                                      const std::string& data) = 0;
};

// Sends from one ephemeral socket with SO_BROADCAST enabled
class UdpTransport : public DatagramTransport {
public:
    explicit UdpTransport(std::string bind_address = "0.0.0.0");
    ~UdpTransport() override;

    std::error_code open();
    void close();

    std::error_code send_to(const std::string& address, uint16_t port,
                            const std::string& data) override;

    std::error_code broadcast(const std::string& broadcast_address, uint16_t port,
                              const std::string& data) override;

private:
    std::string bind_address_;
    std::mutex mutex_;
    std::optional<UdpSocket> socket_;
};

} // namespace lanshare

#endif // LANSHARE_P2P_UDP_TRANSPORT_H
