#include "lanshare/p2p/cleanup_sweeper.h"
#include "lanshare/base/logger.h"

namespace lanshare {

CleanupSweeper::CleanupSweeper(PeerRegistry& registry, ReassemblyTable& table, SweeperOptions options)
    : registry_(registry),
      table_(table),
      options_(options),
      task_("CleanupSweeper", options.interval, [this]() { sweep(); }) {}

void CleanupSweeper::start(elio::runtime::scheduler& scheduler) {
    task_.start(scheduler);
}

void CleanupSweeper::stop() {
    task_.stop();
}

SweepReport CleanupSweeper::sweep(Clock::time_point now) {
    SweepReport report;
    report.peers_removed = registry_.remove_stale(now, options_.peer_timeout);
    report.entries_evicted = table_.evict_expired(now, options_.reassembly_timeout);

    if (!report.peers_removed.empty() && on_peers_lost_) {
        try {
            on_peers_lost_(report.peers_removed);
        } catch (const std::exception& e) {
            Logger::instance().error("Peer-lost callback failed: {}", e.what());
        }
    }

    if (!report.peers_removed.empty() || report.entries_evicted > 0) {
        Logger::instance().debug("Sweep removed {} peers, evicted {} reassemblies",
                                 report.peers_removed.size(), report.entries_evicted);
    }
    return report;
}

} // namespace lanshare
