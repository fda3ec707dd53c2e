#include "lanshare/p2p/reassembly_table.h"
#include "lanshare/base/logger.h"
#include <vector>

namespace lanshare {

const char* to_string(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::AcceptedIncomplete: return "accepted-incomplete";
        case ChunkStatus::AcceptedComplete: return "accepted-complete";
        case ChunkStatus::RejectedChecksum: return "rejected-checksum";
        case ChunkStatus::RejectedDuplicate: return "rejected-duplicate";
        case ChunkStatus::RejectedInvalid: return "rejected-invalid";
        default: return "unknown";
    }
}

ReassemblyLimits ReassemblyLimits::for_message_size(size_t max_message_size) {
    ReassemblyLimits limits;
    limits.max_message_size = max_message_size;
    if (max_message_size != 0) {
        limits.max_chunks = static_cast<uint32_t>(chunk_count_for(max_message_size, MIN_CHUNK_SIZE));
    }
    return limits;
}

ReassemblyTable::ReassemblyTable(ReassemblyLimits limits)
    : limits_(limits) {}

std::shared_ptr<ReassemblyTable::Entry> ReassemblyTable::find_or_create(
    const Key& key, uint32_t total_chunks, Clock::time_point now) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (completed_.count(key)) {
            return nullptr;
        }
        auto it = entries_.find(key);
        if (it != entries_.end() && !it->second->closed.load()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (completed_.count(key)) {
        return nullptr;
    }
    auto& slot = entries_[key];
    if (!slot || slot->closed.load()) {
        slot = std::make_shared<Entry>();
        slot->total_chunks = total_chunks;
        slot->first_seen = now;
    }
    return slot;
}

void ReassemblyTable::retire(const Key& key, const std::shared_ptr<Entry>& entry,
                             bool completed, Clock::time_point now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second == entry) {
        entries_.erase(it);
    }
    if (completed) {
        completed_[key] = now;
    }
}

ChunkOutcome ReassemblyTable::accept_chunk(const std::string& sender,
                                           const std::string& message_id,
                                           uint32_t chunk_index,
                                           uint32_t total_chunks,
                                           const std::string& payload,
                                           const std::string& checksum,
                                           Clock::time_point now,
                                           const std::optional<std::string>& message_checksum) {
    ChunkOutcome outcome;
    outcome.total = total_chunks;

    if (total_chunks == 0 || chunk_index >= total_chunks ||
        (limits_.max_chunks != 0 && total_chunks > limits_.max_chunks)) {
        Logger::instance().debug("Invalid chunk {}/{} of message {} from {}",
                                 chunk_index, total_chunks, message_id, sender);
        outcome.status = ChunkStatus::RejectedInvalid;
        return outcome;
    }

    if (compute_checksum(payload) != checksum) {
        Logger::instance().warning("Checksum mismatch on chunk {}/{} of message {} from {}",
                                   chunk_index, total_chunks, message_id, sender);
        outcome.status = ChunkStatus::RejectedChecksum;
        return outcome;
    }

    const Key key{sender, message_id};

    for (;;) {
        auto entry = find_or_create(key, total_chunks, now);
        if (!entry) {
            Logger::instance().debug("Late chunk {} for completed message {} from {}",
                                     chunk_index, message_id, sender);
            outcome.status = ChunkStatus::RejectedDuplicate;
            return outcome;
        }

        std::unique_lock<std::mutex> entry_lock(entry->mutex);
        if (entry->closed.load()) {
            // Completed, failed or evicted while we waited; look the key up again
            continue;
        }

        if (entry->total_chunks != total_chunks) {
            Logger::instance().warning("Message {} from {} announced {} chunks, chunk {} claims {}",
                                       message_id, sender, entry->total_chunks, chunk_index, total_chunks);
            outcome.status = ChunkStatus::RejectedInvalid;
            outcome.received = static_cast<uint32_t>(entry->chunks.size());
            return outcome;
        }

        auto existing = entry->chunks.find(chunk_index);
        if (existing != entry->chunks.end()) {
            outcome.status = ChunkStatus::RejectedDuplicate;
            outcome.received = static_cast<uint32_t>(entry->chunks.size());
            if (existing->second != payload) {
                outcome.conflicting = true;
                Logger::instance().warning("Protocol violation: chunk {} of message {} from {} "
                                           "resent with different content, keeping first copy",
                                           chunk_index, message_id, sender);
            }
            return outcome;
        }

        if (limits_.max_message_size != 0 &&
            entry->bytes + payload.size() > limits_.max_message_size) {
            Logger::instance().warning("Message {} from {} exceeds {} bytes, chunk {} dropped",
                                       message_id, sender, limits_.max_message_size, chunk_index);
            outcome.status = ChunkStatus::RejectedInvalid;
            outcome.received = static_cast<uint32_t>(entry->chunks.size());
            return outcome;
        }

        entry->chunks.emplace(chunk_index, payload);
        entry->bytes += payload.size();
        if (message_checksum && !entry->message_checksum) {
            entry->message_checksum = message_checksum;
        }
        outcome.received = static_cast<uint32_t>(entry->chunks.size());

        if (entry->chunks.size() < entry->total_chunks) {
            outcome.status = ChunkStatus::AcceptedIncomplete;
            return outcome;
        }

        std::string assembled;
        assembled.reserve(entry->bytes);
        for (const auto& [index, bytes] : entry->chunks) {
            assembled += bytes;
        }

        bool intact = !entry->message_checksum ||
                      compute_checksum(assembled) == *entry->message_checksum;

        entry->closed = true;
        entry->chunks.clear();
        entry->bytes = 0;
        retire(key, entry, intact, now);

        if (!intact) {
            Logger::instance().warning("Whole-message checksum mismatch for message {} from {}, discarded",
                                       message_id, sender);
            outcome.status = ChunkStatus::RejectedChecksum;
            outcome.message_failed = true;
            return outcome;
        }

        Logger::instance().debug("Reassembled message {} from {} ({} chunks, {} bytes)",
                                 message_id, sender, total_chunks, assembled.size());
        outcome.status = ChunkStatus::AcceptedComplete;
        outcome.payload = std::move(assembled);
        return outcome;
    }
}

ChunkOutcome ReassemblyTable::accept_chunk(const MessageChunk& chunk, Clock::time_point now) {
    return accept_chunk(chunk.peer_id, chunk.message_id, chunk.chunk_index, chunk.total_chunks,
                        chunk.payload, chunk.checksum, now, chunk.message_checksum);
}

size_t ReassemblyTable::evict_expired(Clock::time_point now, std::chrono::milliseconds timeout) {
    size_t evicted = 0;
    size_t freed = 0;
    std::unique_lock<std::shared_mutex> lock(mutex_);

    for (auto it = entries_.begin(); it != entries_.end();) {
        // first_seen is fixed at creation and bytes is atomic, no entry lock needed
        if (now - it->second->first_seen >= timeout) {
            it->second->closed = true;
            freed += it->second->bytes;
            Logger::instance().debug("Abandoning incomplete message {} from {}",
                                     it->first.message_id, it->first.sender);
            it = entries_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }

    for (auto it = completed_.begin(); it != completed_.end();) {
        if (now - it->second >= timeout) {
            it = completed_.erase(it);
        } else {
            ++it;
        }
    }

    if (evicted > 0) {
        Logger::instance().info("Evicted {} incomplete messages (~{} bytes)", evicted, freed);
    }
    return evicted;
}

size_t ReassemblyTable::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

size_t ReassemblyTable::buffered_bytes() const {
    std::vector<std::shared_ptr<Entry>> live;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        live.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            live.push_back(entry);
        }
    }

    size_t total = 0;
    for (const auto& entry : live) {
        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        if (!entry->closed.load()) {
            total += entry->bytes;
        }
    }
    return total;
}

void ReassemblyTable::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& [key, entry] : entries_) {
        entry->closed = true;
    }
    entries_.clear();
    completed_.clear();
}

} // namespace lanshare
