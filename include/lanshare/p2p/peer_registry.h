#ifndef LANSHARE_P2P_PEER_REGISTRY_H
#define LANSHARE_P2P_PEER_REGISTRY_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace lanshare {

using Clock = std::chrono::steady_clock;

struct Peer {
    std::string peer_id;
    std::string address;             // IPv4 source address of the latest announcement
    uint16_t port = 0;               // announced listening port
    std::optional<std::string> hostname;
    Clock::time_point last_seen;

    // True once now - last_seen reaches timeout
    bool is_stale(Clock::time_point now, std::chrono::milliseconds timeout) const;
};

using PeerList = std::vector<Peer>;

// Thread-safe map of known peers. Many concurrent readers, one writer.
class PeerRegistry {
public:
    PeerRegistry() = default;
    PeerRegistry(const PeerRegistry&) = delete;
    PeerRegistry& operator=(const PeerRegistry&) = delete;

    // Create or refresh. Address, port and hostname follow the latest
    // announcement. Returns true when the peer was not known before.
    bool upsert(const std::string& peer_id,
                const std::string& address,
                uint16_t port,
                const std::optional<std::string>& hostname,
                Clock::time_point now = Clock::now());

    // Remove every peer with now - last_seen >= timeout
    std::unordered_set<std::string> remove_stale(Clock::time_point now,
                                                 std::chrono::milliseconds timeout);

    bool remove(const std::string& peer_id);

    std::optional<Peer> find(const std::string& peer_id) const;

    // Point-in-time copy, safe to iterate while writers proceed
    PeerList snapshot() const;

    size_t count() const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Peer> peers_;
};

} // namespace lanshare

#endif // LANSHARE_P2P_PEER_REGISTRY_H
