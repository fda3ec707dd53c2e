#include "lanshare/p2p/discovery_service.h"
#include "lanshare/base/logger.h"
#include "lanshare/p2p/broadcaster.h"
#include "lanshare/p2p/reassembly_table.h"
#include "lanshare/protocol/wire_codec.h"
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <mutex>
#include <thread>
#include <unistd.h>

namespace lanshare {

namespace {

std::string detect_hostname() {
    for (const char* var : {"HOSTNAME", "COMPUTERNAME", "USER"}) {
        const char* value = std::getenv(var);
        if (value && *value) {
            return value;
        }
    }
    char buf[256] = {0};
    if (::gethostname(buf, sizeof(buf) - 1) == 0 && buf[0] != '\0') {
        return buf;
    }
    return "unknown";
}

std::chrono::milliseconds seconds_to_ms(uint32_t seconds) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(seconds));
}

// Depth of user callbacks running on this thread
thread_local int callback_depth = 0;

struct CallbackScope {
    CallbackScope() { ++callback_depth; }
    ~CallbackScope() { --callback_depth; }
    CallbackScope(const CallbackScope&) = delete;
    CallbackScope& operator=(const CallbackScope&) = delete;
};

} // anonymous namespace

struct DiscoveryService::Impl {
    NodeConfig node;
    DiscoveryConfig config;
    std::string identity;
    std::string hostname;

    std::shared_ptr<DatagramTransport> transport;
    std::shared_ptr<UdpTransport> owned_udp;   // set when we opened the socket ourselves

    PeerRegistry registry;
    ReassemblyTable table;
    MessageBus bus;

    std::unique_ptr<Listener> listener;
    std::unique_ptr<Broadcaster> broadcaster;
    std::unique_ptr<CleanupSweeper> sweeper;

    std::shared_ptr<elio::runtime::scheduler> scheduler;
    std::atomic<bool> running{false};
    std::mutex lifecycle_mutex;
    std::mutex deferred_mutex;
    std::thread deferred_stop;   // teardown requested from inside a callback

    std::mutex callback_mutex;
    PeerDiscoveredCallback on_peer_discovered;
    PeerLostCallback on_peer_lost;

    Impl(const NodeConfig& node_config, const DiscoveryConfig& discovery_config,
         std::shared_ptr<DatagramTransport> injected)
        : node(node_config),
          config(discovery_config),
          identity(node_config.peer_id.empty() ? generate_uuid() : node_config.peer_id),
          hostname(node_config.hostname.value_or(detect_hostname())),
          transport(std::move(injected)),
          table(ReassemblyLimits::for_message_size(discovery_config.max_message_size)) {
        if (config.single_packet_threshold < MIN_CHUNK_SIZE) {
            throw LanShareError(ErrorCode::ConfigError, "single_packet_threshold is below the minimum chunk size");
        }
        if (config.max_message_size < config.single_packet_threshold) {
            throw LanShareError(ErrorCode::ConfigError, "max_message_size is smaller than single_packet_threshold");
        }

        if (!transport) {
            owned_udp = std::make_shared<UdpTransport>(node.bind_address);
            transport = owned_udp;
        }

        listener = std::make_unique<Listener>(identity, registry, table, bus);
        listener->set_on_peer_discovered([this](const Peer& peer) { notify_discovered(peer); });

        BroadcasterOptions broadcast_options;
        broadcast_options.broadcast_address = config.broadcast_address;
        broadcast_options.port = config.port;
        broadcast_options.interval = seconds_to_ms(config.broadcast_interval_sec);
        broadcaster = std::make_unique<Broadcaster>(*transport, broadcast_options,
                                                    [this]() { return make_announcement(); });

        SweeperOptions sweep_options;
        sweep_options.interval = seconds_to_ms(config.cleanup_interval_sec);
        sweep_options.peer_timeout = seconds_to_ms(config.peer_timeout_sec);
        sweep_options.reassembly_timeout = seconds_to_ms(config.reassembly_timeout_sec);
        sweeper = std::make_unique<CleanupSweeper>(registry, table, sweep_options);
        sweeper->set_on_peers_lost([this](const std::unordered_set<std::string>& ids) {
            for (const auto& id : ids) {
                notify_lost(id);
            }
        });
    }

    DiscoveryAnnouncement make_announcement() const {
        DiscoveryAnnouncement announcement;
        announcement.peer_id = identity;
        // Announce the port we actually listen on (differs from config when it was 0)
        uint16_t bound = listener->bound_port();
        announcement.port = bound != 0 ? bound : config.port;
        announcement.hostname = hostname;
        announcement.timestamp = unix_time_ms();
        return announcement;
    }

    void notify_discovered(const Peer& peer) {
        PeerDiscoveredCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            callback = on_peer_discovered;
        }
        if (callback) {
            CallbackScope scope;
            callback(peer);
        }
    }

    void notify_lost(const std::string& peer_id) {
        PeerLostCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            callback = on_peer_lost;
        }
        if (callback) {
            CallbackScope scope;
            callback(peer_id);
        }
    }

    void join_deferred_stop() {
        std::thread pending;
        {
            std::lock_guard<std::mutex> lock(deferred_mutex);
            pending = std::move(deferred_stop);
        }
        if (pending.joinable()) {
            pending.join();
        }
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex);
        if (!running.exchange(false)) {
            return;
        }

        Logger::instance().info("Stopping discovery service");
        broadcaster->stop();
        sweeper->stop();
        listener->stop();

        if (scheduler) {
            scheduler->shutdown();
            scheduler.reset();
        }
        if (owned_udp) {
            owned_udp->close();
        }

        // Peers and partial messages do not survive a restart
        registry.clear();
        table.clear();
        Logger::instance().info("Discovery service stopped");
    }
};

DiscoveryService::DiscoveryService(const NodeConfig& node, const DiscoveryConfig& discovery,
                                   std::shared_ptr<DatagramTransport> transport)
    : impl_(std::make_unique<Impl>(node, discovery, std::move(transport))) {
    Logger::instance().info("Discovery service created, identity {} ({})", impl_->identity, impl_->hostname);
}

DiscoveryService::~DiscoveryService() {
    stop();
}

bool DiscoveryService::start() {
    impl_->join_deferred_stop();
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    if (impl_->running.load()) {
        Logger::instance().warning("Discovery service already running");
        return true;
    }

    if (impl_->owned_udp) {
        if (auto ec = impl_->owned_udp->open()) {
            Logger::instance().error("Failed to open send socket: {}", ec.message());
            return false;
        }
    }

    if (auto ec = impl_->listener->bind(impl_->node.bind_address, impl_->config.port)) {
        Logger::instance().error("Failed to bind discovery port {}: {}", impl_->config.port, ec.message());
        if (impl_->owned_udp) {
            impl_->owned_udp->close();
        }
        return false;
    }
    if (!impl_->listener->start()) {
        impl_->listener->stop();
        if (impl_->owned_udp) {
            impl_->owned_udp->close();
        }
        return false;
    }

    impl_->scheduler = std::make_shared<elio::runtime::scheduler>(2);
    impl_->scheduler->start();
    impl_->running = true;

    impl_->broadcaster->start(*impl_->scheduler);
    impl_->sweeper->start(*impl_->scheduler);

    Logger::instance().info("Discovery service started: identity {}, port {}",
                            impl_->identity, impl_->listener->bound_port());
    return true;
}

void DiscoveryService::stop() {
    if (callback_depth > 0) {
        // Teardown joins the receive thread and the scheduler workers that
        // run callbacks, so hand it to a thread of its own
        std::lock_guard<std::mutex> lock(impl_->deferred_mutex);
        if (impl_->running.load() && !impl_->deferred_stop.joinable()) {
            Logger::instance().info("Stop requested from a callback, completing it asynchronously");
            impl_->deferred_stop = std::thread([impl = impl_.get()]() { impl->shutdown(); });
        }
        return;
    }

    impl_->join_deferred_stop();
    impl_->shutdown();
}

bool DiscoveryService::is_running() const {
    return impl_->running.load();
}

const std::string& DiscoveryService::own_identity() const {
    return impl_->identity;
}

const std::string& DiscoveryService::hostname() const {
    return impl_->hostname;
}

uint16_t DiscoveryService::bound_port() const {
    return impl_->listener->bound_port();
}

PeerList DiscoveryService::list_peers() const {
    PeerList peers = impl_->registry.snapshot();
    std::sort(peers.begin(), peers.end(),
              [](const Peer& a, const Peer& b) { return a.peer_id < b.peer_id; });
    return peers;
}

size_t DiscoveryService::peer_count() const {
    return impl_->registry.count();
}

std::optional<Peer> DiscoveryService::get_peer(const std::string& peer_id) const {
    return impl_->registry.find(peer_id);
}

SendReport DiscoveryService::send_text(const std::string& payload, const SendTarget& target) {
    SendReport report;
    const auto& config = impl_->config;

    if (payload.size() > config.max_message_size) {
        Logger::instance().warning("Message of {} bytes exceeds the {} byte limit",
                                   payload.size(), config.max_message_size);
        report.code = ErrorCode::MessageTooLarge;
        return report;
    }

    PeerList recipients;
    if (target.is_all()) {
        recipients = impl_->registry.snapshot();
        if (recipients.empty()) {
            Logger::instance().warning("No peers available to send to");
            report.code = ErrorCode::NoPeersAvailable;
            return report;
        }
    } else {
        auto peer = impl_->registry.find(*target.peer_id);
        if (!peer) {
            Logger::instance().warning("Peer {} not found", *target.peer_id);
            report.code = ErrorCode::PeerNotFound;
            return report;
        }
        recipients.push_back(std::move(*peer));
    }

    report.message_id = generate_uuid();
    auto chunks = split_message(impl_->identity, report.message_id, payload,
                                config.single_packet_threshold, unix_time_ms());
    report.chunks = chunks.size();
    report.recipients = recipients.size();

    std::vector<std::string> datagrams;
    datagrams.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        datagrams.push_back(encode_message(chunk));
    }

    for (const auto& peer : recipients) {
        size_t failed_for_peer = 0;
        for (const auto& datagram : datagrams) {
            if (auto ec = impl_->transport->send_to(peer.address, peer.port, datagram)) {
                ++failed_for_peer;
                Logger::instance().debug("Send to {}:{} failed: {}", peer.address, peer.port, ec.message());
            } else {
                ++report.datagrams_sent;
            }
        }
        if (failed_for_peer > 0) {
            Logger::instance().warning("{} of {} chunks to peer {} failed",
                                       failed_for_peer, datagrams.size(), peer.peer_id);
        }
        report.send_failures += failed_for_peer;
    }

    if (report.datagrams_sent == 0) {
        report.code = ErrorCode::SendFailed;
        Logger::instance().error("Message {} could not be sent to any peer", report.message_id);
    } else {
        Logger::instance().info("Sent message {} ({} bytes, {} chunks) to {} peers",
                                report.message_id, payload.size(), report.chunks, report.recipients);
    }
    return report;
}

SubscriptionId DiscoveryService::subscribe(TextCallback callback) {
    return impl_->bus.subscribe(
        [callback = std::move(callback)](const std::string& sender, const std::string& payload) {
            CallbackScope scope;
            callback(sender, payload);
        });
}

bool DiscoveryService::unsubscribe(SubscriptionId id) {
    return impl_->bus.unsubscribe(id);
}

void DiscoveryService::set_on_peer_discovered(PeerDiscoveredCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->on_peer_discovered = std::move(callback);
}

void DiscoveryService::set_on_peer_lost(PeerLostCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->on_peer_lost = std::move(callback);
}

void DiscoveryService::add_peer(const std::string& peer_id, const std::string& address, uint16_t port,
                                const std::optional<std::string>& hostname) {
    if (peer_id == impl_->identity) {
        Logger::instance().warning("Refusing to add own identity as a peer");
        return;
    }
    if (impl_->registry.upsert(peer_id, address, port, hostname)) {
        if (auto peer = impl_->registry.find(peer_id)) {
            impl_->notify_discovered(*peer);
        }
    }
}

bool DiscoveryService::remove_peer(const std::string& peer_id) {
    return impl_->registry.remove(peer_id);
}

size_t DiscoveryService::pending_reassemblies() const {
    return impl_->table.size();
}

size_t DiscoveryService::buffered_bytes() const {
    return impl_->table.buffered_bytes();
}

SweepReport DiscoveryService::sweep_now(Clock::time_point now) {
    return impl_->sweeper->sweep(now);
}

bool DiscoveryService::announce_now() {
    return impl_->broadcaster->tick();
}

uint64_t DiscoveryService::announcements_sent() const {
    return impl_->broadcaster->ticks_sent();
}

Listener& DiscoveryService::listener() {
    return *impl_->listener;
}

} // namespace lanshare
