#include "lanshare/p2p/broadcaster.h"
#include "lanshare/base/logger.h"

namespace lanshare {

Broadcaster::Broadcaster(DatagramTransport& transport, BroadcasterOptions options, AnnouncementFactory factory)
    : transport_(transport),
      options_(std::move(options)),
      factory_(std::move(factory)),
      task_("Broadcaster", options_.interval, [this]() { tick(); }) {}

void Broadcaster::start(elio::runtime::scheduler& scheduler) {
    Logger::instance().info("Broadcasting presence to {}:{} every {}ms",
                            options_.broadcast_address, options_.port, options_.interval.count());
    task_.start(scheduler);
}

void Broadcaster::stop() {
    task_.stop();
}

bool Broadcaster::tick() {
    DiscoveryAnnouncement announcement = factory_();
    std::string datagram = encode_message(announcement);

    auto ec = transport_.broadcast(options_.broadcast_address, options_.port, datagram);
    if (ec) {
        ++send_failures_;
        Logger::instance().warning("Discovery broadcast to {}:{} failed: {}",
                                   options_.broadcast_address, options_.port, ec.message());
        return false;
    }

    ++ticks_sent_;
    Logger::instance().debug("Broadcasted discovery for {} ({} bytes)", announcement.peer_id, datagram.size());
    return true;
}

} // namespace lanshare
