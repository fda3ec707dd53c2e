#include <catch2/catch_test_macros.hpp>
#include <string>
#include <variant>
#include "lanshare/protocol/wire_codec.h"
#include <nlohmann/json.hpp>

using namespace lanshare;

TEST_CASE("Discovery announcement encodes with type tag", "[codec][discovery]") {
    DiscoveryAnnouncement announcement;
    announcement.peer_id = "peer-a";
    announcement.port = 7878;
    announcement.hostname = "laptop";
    announcement.timestamp = 1700000000000ULL;

    auto j = nlohmann::json::parse(encode_message(announcement));
    REQUIRE(j["type"] == "discovery");
    REQUIRE(j["peer_id"] == "peer-a");
    REQUIRE(j["port"] == 7878);
    REQUIRE(j["hostname"] == "laptop");
    REQUIRE(j["timestamp"] == 1700000000000ULL);

    auto decoded = decode_message(encode_message(announcement));
    REQUIRE(decoded.has_value());
    auto* back = std::get_if<DiscoveryAnnouncement>(&*decoded);
    REQUIRE(back != nullptr);
    REQUIRE(back->peer_id == "peer-a");
    REQUIRE(back->hostname == std::optional<std::string>("laptop"));
}

TEST_CASE("Hostname is optional on the wire", "[codec][discovery]") {
    auto decoded = decode_message(R"({"type":"discovery","peer_id":"p","port":9,"timestamp":1})");
    REQUIRE(decoded.has_value());
    REQUIRE_FALSE(std::get<DiscoveryAnnouncement>(*decoded).hostname.has_value());
}

TEST_CASE("Chunk payload travels as base64", "[codec][chunk]") {
    std::string payload = "h\xC3\xA9llo\n\x01\x02";
    auto chunks = split_message("sender", "msg-1", payload, 1100, 42);
    REQUIRE(chunks.size() == 1);

    std::string datagram = encode_message(chunks[0]);
    auto j = nlohmann::json::parse(datagram);
    REQUIRE(j["type"] == "chunk");
    REQUIRE(j["payload_b64"] == base64_encode(payload));
    REQUIRE(j["checksum"] == compute_checksum(payload));
    REQUIRE(j.contains("message_checksum"));

    auto decoded = decode_message(datagram);
    REQUIRE(decoded.has_value());
    const auto& chunk = std::get<MessageChunk>(*decoded);
    REQUIRE(chunk.payload == payload);
    REQUIRE(chunk.chunk_index == 0);
    REQUIRE(chunk.total_chunks == 1);
}

TEST_CASE("Malformed datagrams are rejected with a reason", "[codec][decode]") {
    const char* bad[] = {
        "",
        "not json",
        "[1,2,3]",
        R"({"type":"hello","peer_id":"p"})",
        R"({"type":"discovery","port":7878,"timestamp":1})",
        R"({"type":"discovery","peer_id":"p","port":70000,"timestamp":1})",
        R"({"type":"discovery","peer_id":"p","port":0,"timestamp":1})",
        R"({"type":"discovery","peer_id":"p","port":-1,"timestamp":1})",
        R"({"type":"discovery","peer_id":"","port":1,"timestamp":1})",
        R"({"type":"chunk","peer_id":"p","message_id":"m","chunk_index":3,"total_chunks":3,"payload_b64":"","checksum":"x","timestamp":1})",
        R"({"type":"chunk","peer_id":"p","message_id":"m","chunk_index":0,"total_chunks":0,"payload_b64":"","checksum":"x","timestamp":1})",
        R"({"type":"chunk","peer_id":"p","message_id":"m","chunk_index":0,"total_chunks":1,"payload_b64":"@@@","checksum":"x","timestamp":1})",
        R"({"type":"chunk","peer_id":"p","message_id":"m","chunk_index":0,"total_chunks":1,"checksum":"x","timestamp":1})",
    };

    for (const char* datagram : bad) {
        INFO("datagram: " << datagram);
        std::string error;
        REQUIRE_FALSE(decode_message(datagram, &error).has_value());
        REQUIRE_FALSE(error.empty());
    }
}

TEST_CASE("Payload at the threshold is a single chunk", "[codec][split]") {
    REQUIRE(split_message("s", "m", std::string(1100, 'a'), 1100, 0).size() == 1);
    REQUIRE(split_message("s", "m", std::string(1, 'a'), 1100, 0).size() == 1);

    auto empty = split_message("s", "m", "", 1100, 0);
    REQUIRE(empty.size() == 1);
    REQUIRE(empty[0].total_chunks == 1);
    REQUIRE(empty[0].payload.empty());
}

TEST_CASE("3000 byte payload splits into two full chunks and a partial", "[codec][split]") {
    std::string payload(3000, 'x');
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>('a' + i % 26);
    }

    auto chunks = split_message("s", "m", payload, 1100, 0);
    REQUIRE(chunks.size() == 3);
    REQUIRE(chunks[0].payload.size() == 1100);
    REQUIRE(chunks[1].payload.size() == 1100);
    REQUIRE(chunks[2].payload.size() == 800);

    for (uint32_t i = 0; i < chunks.size(); ++i) {
        REQUIRE(chunks[i].chunk_index == i);
        REQUIRE(chunks[i].total_chunks == 3);
        REQUIRE(chunks[i].checksum == compute_checksum(chunks[i].payload));
    }
    REQUIRE_FALSE(chunks[0].message_checksum.has_value());
    REQUIRE(chunks[2].message_checksum == std::optional<std::string>(compute_checksum(payload)));
    REQUIRE(chunks[0].payload + chunks[1].payload + chunks[2].payload == payload);
}

TEST_CASE("Chunk count matches split size", "[codec][split]") {
    REQUIRE(chunk_count_for(0, 1100) == 1);
    REQUIRE(chunk_count_for(1101, 1100) == 2);
    REQUIRE(chunk_count_for(2200, 1100) == 2);
    REQUIRE(chunk_count_for(256 * 1024, 1100) == 239);
    REQUIRE_THROWS_AS(chunk_count_for(10, 0), std::invalid_argument);
}

TEST_CASE("Checksum is lower-case SHA-256 hex", "[codec][checksum]") {
    REQUIRE(compute_checksum("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(compute_checksum("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Base64 handles padding", "[codec][base64]") {
    REQUIRE(base64_encode("f") == "Zg==");
    REQUIRE(base64_encode("fo") == "Zm8=");
    REQUIRE(base64_encode("foo") == "Zm9v");
    REQUIRE(base64_decode("Zg==") == std::optional<std::string>("f"));
    REQUIRE(base64_decode("Zm8=") == std::optional<std::string>("fo"));
    REQUIRE(base64_decode("Zm9v") == std::optional<std::string>("foo"));
    REQUIRE_FALSE(base64_decode("Zm9").has_value());
}

TEST_CASE("Base64 padding only at the end", "[codec][base64]") {
    REQUIRE_FALSE(base64_decode("====").has_value());
    REQUIRE_FALSE(base64_decode("A===").has_value());
    REQUIRE_FALSE(base64_decode("=AAA").has_value());
    REQUIRE_FALSE(base64_decode("Zg=A").has_value());
    REQUIRE_FALSE(base64_decode("Zg==Zm9v").has_value());
    REQUIRE(base64_decode("Zm9vZg==") == std::optional<std::string>("foof"));
}

TEST_CASE("Generated identities are distinct UUIDv4 strings", "[codec][uuid]") {
    std::string a = generate_uuid();
    std::string b = generate_uuid();
    REQUIRE(a != b);
    REQUIRE(a.size() == 36);
    REQUIRE(a[8] == '-');
    REQUIRE(a[14] == '4');
    REQUIRE((a[19] == '8' || a[19] == '9' || a[19] == 'a' || a[19] == 'b'));
}
