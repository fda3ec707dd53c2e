#ifndef LANSHARE_P2P_DISCOVERY_SERVICE_H
#define LANSHARE_P2P_DISCOVERY_SERVICE_H

#include "lanshare/base/config.h"
#include "lanshare/base/error_code.h"
#include "lanshare/p2p/cleanup_sweeper.h"
#include "lanshare/p2p/listener.h"
#include "lanshare/p2p/message_bus.h"
#include "lanshare/p2p/peer_registry.h"
#include "lanshare/p2p/udp_transport.h"
#include <elio/elio.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace lanshare {

using PeerDiscoveredCallback = std::function<void(const Peer&)>;
using PeerLostCallback = std::function<void(const std::string& peer_id)>;

// Recipient selection for send_text
struct SendTarget {
    std::optional<std::string> peer_id;   // empty = every known peer

    static SendTarget all() { return SendTarget{}; }
    static SendTarget peer(std::string id) { return SendTarget{std::move(id)}; }
    bool is_all() const { return !peer_id.has_value(); }
};

struct SendReport {
    ErrorCode code = ErrorCode::Success;
    std::string message_id;
    size_t chunks = 0;
    size_t recipients = 0;
    size_t datagrams_sent = 0;
    size_t send_failures = 0;              // datagrams that hit a transient network error

    bool ok() const { return code == ErrorCode::Success; }
};

// Owns this instance's identity, the peer registry, the reassembly table and
// the lifecycle of the broadcaster, listener and cleanup sweeper.
class DiscoveryService {
public:
    // A null transport means a UDP socket opened by start()
    DiscoveryService(const NodeConfig& node, const DiscoveryConfig& discovery,
                     std::shared_ptr<DatagramTransport> transport = nullptr);
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    // Bind the listener and start all background tasks
    bool start();

    // Cancel the background tasks and release the socket. Blocks until every
    // loop has exited. Called from a subscriber or peer hook it returns at
    // once and the teardown finishes on a separate thread; a later stop(),
    // start() or the destructor waits for it.
    void stop();

    bool is_running() const;

    const std::string& own_identity() const;
    const std::string& hostname() const;

    // Port the listener is bound to, 0 before start()
    uint16_t bound_port() const;

    // Known peers sorted by peer_id
    PeerList list_peers() const;
    size_t peer_count() const;
    std::optional<Peer> get_peer(const std::string& peer_id) const;

    // Split, then unicast every chunk to each target. Never waits for replies.
    SendReport send_text(const std::string& payload, const SendTarget& target = SendTarget::all());

    // Completed inbound messages
    SubscriptionId subscribe(TextCallback callback);
    bool unsubscribe(SubscriptionId id);

    void set_on_peer_discovered(PeerDiscoveredCallback callback);
    void set_on_peer_lost(PeerLostCallback callback);

    // Manual peer addition (for testing and static setups)
    void add_peer(const std::string& peer_id, const std::string& address, uint16_t port,
                  const std::optional<std::string>& hostname = std::nullopt);
    bool remove_peer(const std::string& peer_id);

    // Partial messages currently buffered
    size_t pending_reassemblies() const;
    size_t buffered_bytes() const;

    // Run one cleanup pass immediately
    SweepReport sweep_now(Clock::time_point now = Clock::now());

    // Send one announcement immediately
    bool announce_now();

    uint64_t announcements_sent() const;

    Listener& listener();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lanshare

#endif // LANSHARE_P2P_DISCOVERY_SERVICE_H
