#include "lanshare/p2p/peer_registry.h"
#include "lanshare/base/logger.h"
#include <mutex>

namespace lanshare {

bool Peer::is_stale(Clock::time_point now, std::chrono::milliseconds timeout) const {
    return now - last_seen >= timeout;
}

bool PeerRegistry::upsert(const std::string& peer_id,
                          const std::string& address,
                          uint16_t port,
                          const std::optional<std::string>& hostname,
                          Clock::time_point now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        Peer peer;
        peer.peer_id = peer_id;
        peer.address = address;
        peer.port = port;
        peer.hostname = hostname;
        peer.last_seen = now;
        peers_.emplace(peer_id, std::move(peer));
        Logger::instance().info("New peer discovered: {} at {}:{}", peer_id, address, port);
        return true;
    }

    Peer& peer = it->second;
    if (peer.address != address || peer.port != port) {
        Logger::instance().info("Peer {} updated: {}:{} -> {}:{}",
                                peer_id, peer.address, peer.port, address, port);
        peer.address = address;
        peer.port = port;
    }
    peer.hostname = hostname;
    // A late-arriving older announcement must not move last_seen backwards
    if (now > peer.last_seen) {
        peer.last_seen = now;
    }
    return false;
}

std::unordered_set<std::string> PeerRegistry::remove_stale(Clock::time_point now,
                                                           std::chrono::milliseconds timeout) {
    std::unordered_set<std::string> removed;
    std::unique_lock<std::shared_mutex> lock(mutex_);

    for (auto it = peers_.begin(); it != peers_.end();) {
        if (it->second.is_stale(now, timeout)) {
            Logger::instance().warning("Removing stale peer: {} at {}:{}",
                                       it->first, it->second.address, it->second.port);
            removed.insert(it->first);
            it = peers_.erase(it);
        } else {
            ++it;
        }
    }

    if (!removed.empty()) {
        Logger::instance().info("Cleaned up {} stale peers", removed.size());
    }
    return removed;
}

bool PeerRegistry::remove(const std::string& peer_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return false;
    }
    Logger::instance().info("Peer removed: {} at {}:{}", peer_id, it->second.address, it->second.port);
    peers_.erase(it);
    return true;
}

std::optional<Peer> PeerRegistry::find(const std::string& peer_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

PeerList PeerRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    PeerList result;
    result.reserve(peers_.size());
    for (const auto& [id, peer] : peers_) {
        result.push_back(peer);
    }
    return result;
}

size_t PeerRegistry::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return peers_.size();
}

void PeerRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    peers_.clear();
}

} // namespace lanshare
