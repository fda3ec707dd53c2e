#ifndef LANSHARE_P2P_REASSEMBLY_TABLE_H
#define LANSHARE_P2P_REASSEMBLY_TABLE_H

#include "lanshare/p2p/peer_registry.h"
#include "lanshare/protocol/wire_codec.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace lanshare {

enum class ChunkStatus {
    AcceptedIncomplete,
    AcceptedComplete,
    RejectedChecksum,
    RejectedDuplicate,
    RejectedInvalid
};

const char* to_string(ChunkStatus status);

struct ChunkOutcome {
    ChunkStatus status = ChunkStatus::RejectedInvalid;
    bool conflicting = false;       // duplicate index carried different bytes
    bool message_failed = false;    // whole-message checksum did not match
    std::string payload;            // set only for AcceptedComplete
    uint32_t received = 0;          // distinct indices held after this call
    uint32_t total = 0;
};

// Bounds applied to incoming chunks, 0 = unbounded
struct ReassemblyLimits {
    uint32_t max_chunks = 0;
    size_t max_message_size = 0;

    // Bounds for messages up to max_message_size split at MIN_CHUNK_SIZE or
    // more, whatever chunk size the sender picked
    static ReassemblyLimits for_message_size(size_t max_message_size);
};

// In-progress messages keyed by (sender, message_id).
//
// Calls for different keys only share a brief lookup on the key map; calls
// for the same key are serialized on the entry's own mutex. Lock order is
// entry -> map; nothing takes an entry lock while holding the map lock.
class ReassemblyTable {
public:
    explicit ReassemblyTable(ReassemblyLimits limits = {});
    ReassemblyTable(const ReassemblyTable&) = delete;
    ReassemblyTable& operator=(const ReassemblyTable&) = delete;

    ChunkOutcome accept_chunk(const std::string& sender,
                              const std::string& message_id,
                              uint32_t chunk_index,
                              uint32_t total_chunks,
                              const std::string& payload,
                              const std::string& checksum,
                              Clock::time_point now,
                              const std::optional<std::string>& message_checksum = std::nullopt);

    ChunkOutcome accept_chunk(const MessageChunk& chunk, Clock::time_point now);

    // Drop partial messages whose first chunk arrived timeout or more ago,
    // and forget completed message ids of the same age. Returns the number
    // of partial messages dropped.
    size_t evict_expired(Clock::time_point now, std::chrono::milliseconds timeout);

    // Partial messages currently buffered
    size_t size() const;

    // Payload bytes held by partial messages
    size_t buffered_bytes() const;

    void clear();

private:
    struct Key {
        std::string sender;
        std::string message_id;
        bool operator==(const Key& other) const {
            return sender == other.sender && message_id == other.message_id;
        }
    };

    struct KeyHash {
        size_t operator()(const Key& key) const {
            size_t h = std::hash<std::string>{}(key.sender);
            return h ^ (std::hash<std::string>{}(key.message_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
        }
    };

    struct Entry {
        std::mutex mutex;
        uint32_t total_chunks = 0;
        std::map<uint32_t, std::string> chunks;   // ordered by index
        std::optional<std::string> message_checksum;
        Clock::time_point first_seen;
        std::atomic<size_t> bytes{0};
        std::atomic<bool> closed{false};
    };

    // nullptr when the message was already completed
    std::shared_ptr<Entry> find_or_create(const Key& key, uint32_t total_chunks, Clock::time_point now);
    void retire(const Key& key, const std::shared_ptr<Entry>& entry, bool completed, Clock::time_point now);

    ReassemblyLimits limits_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<Key, std::shared_ptr<Entry>, KeyHash> entries_;
    std::unordered_map<Key, Clock::time_point, KeyHash> completed_;
};

} // namespace lanshare

#endif // LANSHARE_P2P_REASSEMBLY_TABLE_H
