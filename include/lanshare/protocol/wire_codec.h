#ifndef LANSHARE_PROTOCOL_WIRE_CODEC_H
#define LANSHARE_PROTOCOL_WIRE_CODEC_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lanshare {

// Type tags of the two datagram kinds sharing the wire
inline constexpr const char* DISCOVERY_TYPE = "discovery";
inline constexpr const char* CHUNK_TYPE = "chunk";

// Smallest chunk size a sender may split with. Receivers derive their
// chunk-count bound from it.
inline constexpr size_t MIN_CHUNK_SIZE = 64;

// Presence broadcast. Fire-and-forget, never acknowledged.
struct DiscoveryAnnouncement {
    std::string peer_id;
    uint16_t port = 0;
    std::optional<std::string> hostname;
    uint64_t timestamp = 0;          // Unix epoch milliseconds
};

// One fragment of a text payload
struct MessageChunk {
    std::string peer_id;             // sender identity
    std::string message_id;
    uint32_t chunk_index = 0;
    uint32_t total_chunks = 0;
    std::string payload;             // raw bytes, base64 on the wire
    std::string checksum;            // SHA-256 hex of payload
    std::optional<std::string> message_checksum;  // SHA-256 hex of the whole message, final chunk only
    uint64_t timestamp = 0;
};

using WireMessage = std::variant<DiscoveryAnnouncement, MessageChunk>;

// Serialize to a single JSON datagram
std::string encode_message(const DiscoveryAnnouncement& announcement);
std::string encode_message(const MessageChunk& chunk);

// Parse a datagram. Returns nullopt for anything malformed: bad JSON, unknown
// type tag, missing or mistyped fields, bad base64, chunk_index >= total_chunks.
// When error is non-null it receives a short reason.
std::optional<WireMessage> decode_message(std::string_view datagram,
                                          std::string* error = nullptr);

// Split a payload into chunks of at most chunk_size bytes, each with its own
// checksum. The final chunk carries the whole-message checksum.
// An empty payload still produces one (empty) chunk.
std::vector<MessageChunk> split_message(const std::string& sender_id,
                                        const std::string& message_id,
                                        const std::string& payload,
                                        size_t chunk_size,
                                        uint64_t timestamp);

// Number of chunks split_message() produces for a payload size
size_t chunk_count_for(size_t payload_size, size_t chunk_size);

// Helpers
std::string compute_checksum(std::string_view data);
std::string base64_encode(std::string_view data);
std::optional<std::string> base64_decode(std::string_view encoded);
std::string generate_uuid();
uint64_t unix_time_ms();

} // namespace lanshare

#endif // LANSHARE_PROTOCOL_WIRE_CODEC_H
