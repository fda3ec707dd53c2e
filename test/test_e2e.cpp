#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "lanshare/p2p/discovery_service.h"
#include "lanshare/protocol/wire_codec.h"

using namespace lanshare;
using namespace std::chrono_literals;

namespace {

// Loopback node on an ephemeral port
struct LoopbackNode {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::pair<std::string, std::string>> inbox;
    // Declared last so it is destroyed before the state its subscriber uses
    std::unique_ptr<DiscoveryService> service;

    explicit LoopbackNode(const std::string& id) {
        NodeConfig node;
        node.peer_id = id;
        node.hostname = id + "-host";
        node.bind_address = "127.0.0.1";

        DiscoveryConfig discovery;
        discovery.port = 0;
        discovery.broadcast_address = "127.0.0.1";
        discovery.broadcast_interval_sec = 1;
        discovery.cleanup_interval_sec = 1;

        service = std::make_unique<DiscoveryService>(node, discovery);
        service->subscribe([this](const std::string& sender, const std::string& payload) {
            std::lock_guard<std::mutex> lock(mutex);
            inbox.emplace_back(sender, payload);
            cv.notify_all();
        });
    }

    ~LoopbackNode() {
        service->stop();
    }

    bool wait_for_messages(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&]() { return inbox.size() >= count; });
    }
};

bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return condition();
}

} // namespace

TEST_CASE("Announcement over loopback registers the sender", "[e2e][discovery]") {
    LoopbackNode b("node-b");
    REQUIRE(b.service->start());

    std::error_code ec;
    auto sender = UdpSocket::bind("127.0.0.1", 0, false, ec);
    REQUIRE(sender.has_value());

    DiscoveryAnnouncement announcement;
    announcement.peer_id = "node-a";
    announcement.port = 4242;
    announcement.hostname = "node-a-host";
    announcement.timestamp = unix_time_ms();
    REQUIRE_FALSE(static_cast<bool>(sender->send_to("127.0.0.1", b.service->bound_port(),
                                                    encode_message(announcement))));

    REQUIRE(wait_until([&]() { return b.service->peer_count() == 1; }, 2000ms));
    auto peer = b.service->get_peer("node-a");
    REQUIRE(peer.has_value());
    REQUIRE(peer->address == "127.0.0.1");
    REQUIRE(peer->port == 4242);

    // Garbage on the same socket does not stop the loop
    REQUIRE_FALSE(static_cast<bool>(sender->send_to("127.0.0.1", b.service->bound_port(), "{not json")));
    announcement.peer_id = "node-c";
    REQUIRE_FALSE(static_cast<bool>(sender->send_to("127.0.0.1", b.service->bound_port(),
                                                    encode_message(announcement))));
    REQUIRE(wait_until([&]() { return b.service->peer_count() == 2; }, 2000ms));
    REQUIRE(b.service->listener().decode_failures() >= 1);

    b.service->stop();
}

TEST_CASE("Text crosses between two nodes over UDP", "[e2e][transfer]") {
    LoopbackNode a("node-a");
    LoopbackNode b("node-b");
    REQUIRE(a.service->start());
    REQUIRE(b.service->start());

    a.service->add_peer("node-b", "127.0.0.1", b.service->bound_port());
    b.service->add_peer("node-a", "127.0.0.1", a.service->bound_port());

    SECTION("short message") {
        auto report = a.service->send_text("hello from a");
        REQUIRE(report.ok());
        REQUIRE(report.chunks == 1);
        REQUIRE(b.wait_for_messages(1, 3000ms));
        std::lock_guard<std::mutex> lock(b.mutex);
        REQUIRE(b.inbox[0].first == "node-a");
        REQUIRE(b.inbox[0].second == "hello from a");
    }

    SECTION("multi-chunk message in both directions") {
        std::string big_a(20000, 'A');
        std::string big_b(9000, 'B');
        for (size_t i = 0; i < big_a.size(); i += 97) {
            big_a[i] = static_cast<char>('a' + i % 26);
        }

        auto to_b = a.service->send_text(big_a, SendTarget::peer("node-b"));
        REQUIRE(to_b.ok());
        REQUIRE(to_b.chunks == 19);
        auto to_a = b.service->send_text(big_b);
        REQUIRE(to_a.ok());

        REQUIRE(b.wait_for_messages(1, 5000ms));
        REQUIRE(a.wait_for_messages(1, 5000ms));
        {
            std::lock_guard<std::mutex> lock(b.mutex);
            REQUIRE(b.inbox[0].second == big_a);
        }
        {
            std::lock_guard<std::mutex> lock(a.mutex);
            REQUIRE(a.inbox[0].second == big_b);
        }
        REQUIRE(b.service->pending_reassemblies() == 0);
    }

    a.service->stop();
    b.service->stop();
    REQUIRE_FALSE(a.service->is_running());
}
