#ifndef LANSHARE_P2P_LISTENER_H
#define LANSHARE_P2P_LISTENER_H

#include "lanshare/p2p/message_bus.h"
#include "lanshare/p2p/peer_registry.h"
#include "lanshare/p2p/reassembly_table.h"
#include "lanshare/p2p/udp_transport.h"
#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace lanshare {

// What the listener did with one datagram
enum class DatagramDisposition {
    DecodeFailed,
    SelfDiscarded,
    PeerAdded,
    PeerRefreshed,
    ChunkBuffered,
    ChunkRejected,
    MessageDelivered
};

const char* to_string(DatagramDisposition disposition);

// Receives datagrams on the discovery port and routes them to the peer
// registry (announcements) or the reassembly table (chunks).
class Listener {
public:
    using PeerCallback = std::function<void(const Peer&)>;

    Listener(std::string own_identity, PeerRegistry& registry, ReassemblyTable& table, MessageBus& bus);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    void set_on_peer_discovered(PeerCallback callback) { on_peer_discovered_ = std::move(callback); }

    // Bind the receive socket. Port 0 picks an ephemeral port.
    std::error_code bind(const std::string& address, uint16_t port);
    uint16_t bound_port() const { return bound_port_; }

    // Start the receive thread. Requires a successful bind().
    bool start();

    // Stop the receive thread and close the socket. From the receive thread
    // itself it only ends the loop; the next stop() joins and closes.
    void stop();
    bool is_running() const { return running_.load(); }

    // Route one datagram as if it had arrived from source_address
    DatagramDisposition handle_datagram(std::string_view bytes,
                                        const std::string& source_address,
                                        Clock::time_point now = Clock::now());

    uint64_t datagrams_received() const { return datagrams_received_.load(); }
    uint64_t decode_failures() const { return decode_failures_.load(); }
    uint64_t messages_delivered() const { return messages_delivered_.load(); }

private:
    void receive_loop();
    DatagramDisposition on_announcement(const DiscoveryAnnouncement& announcement,
                                        const std::string& source_address,
                                        Clock::time_point now);
    DatagramDisposition on_chunk(const MessageChunk& chunk, Clock::time_point now);

    std::string own_identity_;
    PeerRegistry& registry_;
    ReassemblyTable& table_;
    MessageBus& bus_;
    PeerCallback on_peer_discovered_;

    std::optional<UdpSocket> socket_;
    uint16_t bound_port_ = 0;
    std::thread thread_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> datagrams_received_{0};
    std::atomic<uint64_t> decode_failures_{0};
    std::atomic<uint64_t> messages_delivered_{0};
};

} // namespace lanshare

#endif // LANSHARE_P2P_LISTENER_H
