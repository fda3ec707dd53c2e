#include "lanshare/protocol/wire_codec.h"
#include <elio/hash/sha256.hpp>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <chrono>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace lanshare {

namespace {

// Reject oversized identities before they reach the tables
constexpr size_t MAX_ID_LENGTH = 128;
constexpr size_t MAX_HOSTNAME_LENGTH = 255;

struct DecodeFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

const json& require(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw DecodeFailure(std::string("missing field '") + key + "'");
    }
    return *it;
}

std::string read_string(const json& obj, const char* key, size_t max_length) {
    const json& value = require(obj, key);
    if (!value.is_string()) {
        throw DecodeFailure(std::string("field '") + key + "' is not a string");
    }
    const auto& str = value.get_ref<const std::string&>();
    if (str.size() > max_length) {
        throw DecodeFailure(std::string("field '") + key + "' too long");
    }
    return str;
}

uint64_t read_unsigned(const json& obj, const char* key, uint64_t max_value) {
    const json& value = require(obj, key);
    if (!value.is_number_unsigned()) {
        throw DecodeFailure(std::string("field '") + key + "' is not an unsigned integer");
    }
    uint64_t v = value.get<uint64_t>();
    if (v > max_value) {
        throw DecodeFailure(std::string("field '") + key + "' out of range");
    }
    return v;
}

std::optional<std::string> read_optional_string(const json& obj, const char* key, size_t max_length) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    return read_string(obj, key, max_length);
}

DiscoveryAnnouncement decode_announcement(const json& obj) {
    DiscoveryAnnouncement msg;
    msg.peer_id = read_string(obj, "peer_id", MAX_ID_LENGTH);
    msg.port = static_cast<uint16_t>(read_unsigned(obj, "port", 65535));
    msg.hostname = read_optional_string(obj, "hostname", MAX_HOSTNAME_LENGTH);
    msg.timestamp = read_unsigned(obj, "timestamp", std::numeric_limits<uint64_t>::max());

    if (msg.peer_id.empty()) {
        throw DecodeFailure("empty peer_id");
    }
    if (msg.port == 0) {
        throw DecodeFailure("announced port is zero");
    }
    return msg;
}

MessageChunk decode_chunk(const json& obj) {
    MessageChunk chunk;
    chunk.peer_id = read_string(obj, "peer_id", MAX_ID_LENGTH);
    chunk.message_id = read_string(obj, "message_id", MAX_ID_LENGTH);
    chunk.chunk_index = static_cast<uint32_t>(
        read_unsigned(obj, "chunk_index", std::numeric_limits<uint32_t>::max()));
    chunk.total_chunks = static_cast<uint32_t>(
        read_unsigned(obj, "total_chunks", std::numeric_limits<uint32_t>::max()));
    chunk.checksum = read_string(obj, "checksum", 64);
    chunk.message_checksum = read_optional_string(obj, "message_checksum", 64);
    chunk.timestamp = read_unsigned(obj, "timestamp", std::numeric_limits<uint64_t>::max());

    if (chunk.peer_id.empty() || chunk.message_id.empty()) {
        throw DecodeFailure("empty peer_id or message_id");
    }
    if (chunk.total_chunks == 0 || chunk.chunk_index >= chunk.total_chunks) {
        throw DecodeFailure("chunk_index " + std::to_string(chunk.chunk_index) +
                            " not below total_chunks " + std::to_string(chunk.total_chunks));
    }

    const json& encoded = require(obj, "payload_b64");
    if (!encoded.is_string()) {
        throw DecodeFailure("field 'payload_b64' is not a string");
    }
    auto payload = base64_decode(encoded.get_ref<const std::string&>());
    if (!payload) {
        throw DecodeFailure("payload_b64 is not valid base64");
    }
    chunk.payload = std::move(*payload);
    return chunk;
}

} // anonymous namespace

std::string encode_message(const DiscoveryAnnouncement& announcement) {
    json j;
    j["type"] = DISCOVERY_TYPE;
    j["peer_id"] = announcement.peer_id;
    j["port"] = announcement.port;
    if (announcement.hostname) {
        j["hostname"] = *announcement.hostname;
    }
    j["timestamp"] = announcement.timestamp;
    return j.dump();
}

std::string encode_message(const MessageChunk& chunk) {
    json j;
    j["type"] = CHUNK_TYPE;
    j["peer_id"] = chunk.peer_id;
    j["message_id"] = chunk.message_id;
    j["chunk_index"] = chunk.chunk_index;
    j["total_chunks"] = chunk.total_chunks;
    j["payload_b64"] = base64_encode(chunk.payload);
    j["checksum"] = chunk.checksum;
    if (chunk.message_checksum) {
        j["message_checksum"] = *chunk.message_checksum;
    }
    j["timestamp"] = chunk.timestamp;
    return j.dump();
}

std::optional<WireMessage> decode_message(std::string_view datagram, std::string* error) {
    json root = json::parse(datagram.begin(), datagram.end(), nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        if (error) *error = "not a JSON object";
        return std::nullopt;
    }

    try {
        std::string type = read_string(root, "type", 16);
        if (type == DISCOVERY_TYPE) {
            return WireMessage{decode_announcement(root)};
        }
        if (type == CHUNK_TYPE) {
            return WireMessage{decode_chunk(root)};
        }
        if (error) *error = "unknown message type '" + type + "'";
    } catch (const DecodeFailure& e) {
        if (error) *error = e.what();
    } catch (const json::exception& e) {
        if (error) *error = e.what();
    }
    return std::nullopt;
}

size_t chunk_count_for(size_t payload_size, size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be non-zero");
    }
    if (payload_size <= chunk_size) {
        return 1;
    }
    return (payload_size + chunk_size - 1) / chunk_size;
}

std::vector<MessageChunk> split_message(const std::string& sender_id,
                                        const std::string& message_id,
                                        const std::string& payload,
                                        size_t chunk_size,
                                        uint64_t timestamp) {
    const size_t total = chunk_count_for(payload.size(), chunk_size);

    std::vector<MessageChunk> chunks;
    chunks.reserve(total);
    for (size_t i = 0; i < total; ++i) {
        MessageChunk chunk;
        chunk.peer_id = sender_id;
        chunk.message_id = message_id;
        chunk.chunk_index = static_cast<uint32_t>(i);
        chunk.total_chunks = static_cast<uint32_t>(total);
        chunk.payload = payload.substr(i * chunk_size, chunk_size);
        chunk.checksum = compute_checksum(chunk.payload);
        chunk.timestamp = timestamp;
        chunks.push_back(std::move(chunk));
    }
    chunks.back().message_checksum = compute_checksum(payload);
    return chunks;
}

std::string compute_checksum(std::string_view data) {
    auto digest = elio::hash::sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    return elio::hash::sha256_hex(digest);
}

std::string base64_encode(std::string_view data) {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::optional<std::string> base64_decode(std::string_view encoded) {
    if (encoded.empty()) {
        return std::string{};
    }
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }
    // '=' only as one or two trailing characters
    size_t padding = 0;
    auto first_pad = encoded.find('=');
    if (first_pad != std::string_view::npos) {
        padding = encoded.size() - first_pad;
        if (padding > 2 || encoded.find_first_not_of('=', first_pad) != std::string_view::npos) {
            return std::nullopt;
        }
    }
    std::string out(3 * (encoded.size() / 4), '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts '=' padding as zero bytes
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

std::string generate_uuid() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();

    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << (hi >> 32) << '-'
       << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
       << std::setw(4) << (hi & 0xFFFF) << '-'
       << std::setw(4) << (lo >> 48) << '-'
       << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

uint64_t unix_time_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace lanshare
