#ifndef LANSHARE_P2P_BROADCASTER_H
#define LANSHARE_P2P_BROADCASTER_H

#include "lanshare/base/periodic_task.h"
#include "lanshare/p2p/udp_transport.h"
#include "lanshare/protocol/wire_codec.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace lanshare {

struct BroadcasterOptions {
    std::string broadcast_address = "255.255.255.255";
    uint16_t port = 7878;
    std::chrono::milliseconds interval{5000};
};

// Periodically announces this node's presence to the broadcast address
class Broadcaster {
public:
    // Builds the announcement for the current tick
    using AnnouncementFactory = std::function<DiscoveryAnnouncement()>;

    Broadcaster(DatagramTransport& transport, BroadcasterOptions options, AnnouncementFactory factory);

    void start(elio::runtime::scheduler& scheduler);
    void stop();
    bool is_running() const { return task_.is_running(); }

    // Send one announcement now. Returns false if the send failed.
    bool tick();

    uint64_t ticks_sent() const { return ticks_sent_.load(); }
    uint64_t send_failures() const { return send_failures_.load(); }

private:
    DatagramTransport& transport_;
    BroadcasterOptions options_;
    AnnouncementFactory factory_;
    std::atomic<uint64_t> ticks_sent_{0};
    std::atomic<uint64_t> send_failures_{0};
    PeriodicTask task_;
};

} // namespace lanshare

#endif // LANSHARE_P2P_BROADCASTER_H
