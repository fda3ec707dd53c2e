#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>
#include "lanshare/base/periodic_task.h"
#include "lanshare/p2p/broadcaster.h"
#include "lanshare/p2p/cleanup_sweeper.h"
#include "lanshare/protocol/wire_codec.h"

using namespace lanshare;
using namespace std::chrono_literals;

namespace {

SweeperOptions default_options() {
    SweeperOptions options;
    options.interval = 10s;
    options.peer_timeout = 30s;
    options.reassembly_timeout = 20s;
    return options;
}

class CountingTransport : public DatagramTransport {
public:
    std::error_code send_to(const std::string&, uint16_t, const std::string&) override {
        return {};
    }

    std::error_code broadcast(const std::string& address, uint16_t port, const std::string& data) override {
        ++broadcasts;
        last_address = address;
        last_port = port;
        last_datagram = data;
        if (fail) {
            return make_error_code(ErrorCode::NetworkError);
        }
        return {};
    }

    std::atomic<int> broadcasts{0};
    std::atomic<bool> fail{false};
    std::string last_address;
    uint16_t last_port = 0;
    std::string last_datagram;
};

} // namespace

TEST_CASE("Peer silent for the timeout is swept, one re-announced at 29s stays", "[sweeper][peers]") {
    PeerRegistry registry;
    ReassemblyTable table;
    CleanupSweeper sweeper(registry, table, default_options());

    auto t0 = Clock::now();
    registry.upsert("silent", "10.0.0.1", 7878, std::nullopt, t0);
    registry.upsert("chatty", "10.0.0.2", 7878, std::nullopt, t0);
    registry.upsert("chatty", "10.0.0.2", 7878, std::nullopt, t0 + 29s);

    std::vector<std::string> lost;
    sweeper.set_on_peers_lost([&](const std::unordered_set<std::string>& ids) {
        lost.insert(lost.end(), ids.begin(), ids.end());
    });

    auto report = sweeper.sweep(t0 + 30s);
    REQUIRE(report.peers_removed.size() == 1);
    REQUIRE(report.peers_removed.count("silent") == 1);
    REQUIRE(lost == std::vector<std::string>{"silent"});
    REQUIRE(registry.count() == 1);
    REQUIRE(registry.find("chatty").has_value());
}

TEST_CASE("Abandoned reassemblies are evicted by the sweep", "[sweeper][reassembly]") {
    PeerRegistry registry;
    ReassemblyTable table;
    CleanupSweeper sweeper(registry, table, default_options());

    auto t0 = Clock::now();
    auto chunks = split_message("vanished", "half", std::string(3000, 'h'), 1100, 0);
    table.accept_chunk(chunks[0], t0);
    table.accept_chunk(chunks[1], t0);
    REQUIRE(table.size() == 1);
    REQUIRE(table.buffered_bytes() == 2200);

    REQUIRE(sweeper.sweep(t0 + 10s).entries_evicted == 0);
    auto report = sweeper.sweep(t0 + 20s);
    REQUIRE(report.entries_evicted == 1);
    REQUIRE(report.peers_removed.empty());
    REQUIRE(table.size() == 0);
    REQUIRE(table.buffered_bytes() == 0);
}

TEST_CASE("A throwing peer-lost hook does not break the sweep", "[sweeper][peers]") {
    PeerRegistry registry;
    ReassemblyTable table;
    CleanupSweeper sweeper(registry, table, default_options());
    sweeper.set_on_peers_lost([](const std::unordered_set<std::string>&) {
        throw std::runtime_error("hook failure");
    });

    auto t0 = Clock::now();
    registry.upsert("gone", "10.0.0.1", 7878, std::nullopt, t0);
    REQUIRE(sweeper.sweep(t0 + 31s).peers_removed.size() == 1);
    REQUIRE(registry.count() == 0);
}

TEST_CASE("Periodic task keeps ticking through failures and stops promptly", "[periodic]") {
    elio::runtime::scheduler scheduler(2);
    scheduler.start();

    std::atomic<int> calls{0};
    PeriodicTask task("test-task", 20ms, [&]() {
        if (++calls % 2 == 0) {
            throw std::runtime_error("every other run fails");
        }
    });

    task.start(scheduler);
    REQUIRE(task.is_running());
    std::this_thread::sleep_for(300ms);

    auto stop_begin = std::chrono::steady_clock::now();
    task.stop();
    auto stop_took = std::chrono::steady_clock::now() - stop_begin;

    REQUIRE_FALSE(task.is_running());
    REQUIRE(calls.load() >= 4);
    REQUIRE(task.runs() == static_cast<uint64_t>(calls.load()));
    REQUIRE(stop_took < 1s);

    int after_stop = calls.load();
    std::this_thread::sleep_for(100ms);
    REQUIRE(calls.load() == after_stop);

    scheduler.shutdown();
}

TEST_CASE("Overrunning runs skip slots instead of catching up", "[periodic]") {
    elio::runtime::scheduler scheduler(2);
    scheduler.start();

    std::atomic<int> calls{0};
    PeriodicTask task("slow-task", 20ms, [&]() {
        ++calls;
        std::this_thread::sleep_for(50ms);
    });

    task.start(scheduler);
    std::this_thread::sleep_for(300ms);
    task.stop();

    // 300ms of 50ms runs allows about six, never the fifteen slots a catch-up would run
    REQUIRE(calls.load() <= 7);
    REQUIRE(task.skipped_slots() >= static_cast<uint64_t>(calls.load() - 1));

    scheduler.shutdown();
}

TEST_CASE("Stop waits for a long run to finish", "[periodic]") {
    elio::runtime::scheduler scheduler(2);
    scheduler.start();

    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
    PeriodicTask task("long-run", 1s, [&]() {
        entered = true;
        std::this_thread::sleep_for(5500ms);
        finished = true;
    });

    task.start(scheduler);
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!entered.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(entered.load());

    task.stop();
    REQUIRE(finished.load());
    REQUIRE(task.runs() == 1);

    scheduler.shutdown();
}

TEST_CASE("A task can stop itself from its own run", "[periodic]") {
    elio::runtime::scheduler scheduler(2);
    scheduler.start();

    std::atomic<int> calls{0};
    std::atomic<bool> stop_returned{false};
    PeriodicTask* self = nullptr;
    PeriodicTask task("self-stop", 20ms, [&]() {
        ++calls;
        self->stop();
        stop_returned = true;
    });
    self = &task;

    task.start(scheduler);
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!stop_returned.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(stop_returned.load());
    REQUIRE_FALSE(task.is_running());

    task.stop();
    std::this_thread::sleep_for(100ms);
    REQUIRE(calls.load() == 1);

    scheduler.shutdown();
}

TEST_CASE("Periodic task rejects a zero interval", "[periodic]") {
    REQUIRE_THROWS_AS(PeriodicTask("bad", 0ms, []() {}), LanShareError);
}

TEST_CASE("Broadcaster announces identity and counts failures", "[broadcaster]") {
    CountingTransport transport;
    BroadcasterOptions options;
    options.broadcast_address = "255.255.255.255";
    options.port = 7878;
    options.interval = 5s;

    Broadcaster broadcaster(transport, options, []() {
        DiscoveryAnnouncement announcement;
        announcement.peer_id = "me";
        announcement.port = 7878;
        announcement.hostname = "box";
        announcement.timestamp = unix_time_ms();
        return announcement;
    });

    REQUIRE(broadcaster.tick());
    REQUIRE(broadcaster.ticks_sent() == 1);
    REQUIRE(transport.last_address == "255.255.255.255");
    REQUIRE(transport.last_port == 7878);

    auto decoded = decode_message(transport.last_datagram);
    REQUIRE(decoded.has_value());
    REQUIRE(std::get<DiscoveryAnnouncement>(*decoded).peer_id == "me");

    transport.fail = true;
    REQUIRE_FALSE(broadcaster.tick());
    REQUIRE(broadcaster.send_failures() == 1);
    REQUIRE(broadcaster.ticks_sent() == 1);
}

TEST_CASE("Broadcaster keeps its schedule after a failed send", "[broadcaster][periodic]") {
    elio::runtime::scheduler scheduler(2);
    scheduler.start();

    CountingTransport transport;
    transport.fail = true;
    BroadcasterOptions options;
    options.interval = 30ms;

    Broadcaster broadcaster(transport, options, []() {
        DiscoveryAnnouncement announcement;
        announcement.peer_id = "me";
        announcement.port = 7878;
        return announcement;
    });

    broadcaster.start(scheduler);
    std::this_thread::sleep_for(200ms);
    broadcaster.stop();

    REQUIRE(transport.broadcasts.load() >= 3);
    REQUIRE(broadcaster.send_failures() == static_cast<uint64_t>(transport.broadcasts.load()));
    REQUIRE(broadcaster.ticks_sent() == 0);

    scheduler.shutdown();
}
