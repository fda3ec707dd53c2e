#ifndef LANSHARE_P2P_CLEANUP_SWEEPER_H
#define LANSHARE_P2P_CLEANUP_SWEEPER_H

#include "lanshare/base/periodic_task.h"
#include "lanshare/p2p/peer_registry.h"
#include "lanshare/p2p/reassembly_table.h"
#include <chrono>
#include <functional>
#include <string>
#include <unordered_set>

namespace lanshare {

struct SweeperOptions {
    std::chrono::milliseconds interval{10000};
    std::chrono::milliseconds peer_timeout{30000};
    std::chrono::milliseconds reassembly_timeout{20000};
};

struct SweepReport {
    std::unordered_set<std::string> peers_removed;
    size_t entries_evicted = 0;
};

// Evicts stale peers and abandoned reassemblies
class CleanupSweeper {
public:
    using PeersLostCallback = std::function<void(const std::unordered_set<std::string>&)>;

    CleanupSweeper(PeerRegistry& registry, ReassemblyTable& table, SweeperOptions options);

    void set_on_peers_lost(PeersLostCallback callback) { on_peers_lost_ = std::move(callback); }

    void start(elio::runtime::scheduler& scheduler);
    void stop();
    bool is_running() const { return task_.is_running(); }

    SweepReport sweep(Clock::time_point now = Clock::now());


private:
    PeerRegistry& registry_;
    ReassemblyTable& table_;
    SweeperOptions options_;
    PeersLostCallback on_peers_lost_;
    PeriodicTask task_;
};

} // namespace lanshare

#endif // LANSHARE_P2P_CLEANUP_SWEEPER_H
