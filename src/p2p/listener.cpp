#include "lanshare/p2p/listener.h"
#include "lanshare/base/logger.h"
#include <cerrno>
#include <cstring>
#include <variant>

namespace lanshare {

namespace {

constexpr int POLL_TIMEOUT_MS = 100;

} // anonymous namespace

const char* to_string(DatagramDisposition disposition) {
    switch (disposition) {
        case DatagramDisposition::DecodeFailed: return "decode-failed";
        case DatagramDisposition::SelfDiscarded: return "self-discarded";
        case DatagramDisposition::PeerAdded: return "peer-added";
        case DatagramDisposition::PeerRefreshed: return "peer-refreshed";
        case DatagramDisposition::ChunkBuffered: return "chunk-buffered";
        case DatagramDisposition::ChunkRejected: return "chunk-rejected";
        case DatagramDisposition::MessageDelivered: return "message-delivered";
        default: return "unknown";
    }
}

Listener::Listener(std::string own_identity, PeerRegistry& registry, ReassemblyTable& table, MessageBus& bus)
    : own_identity_(std::move(own_identity)),
      registry_(registry),
      table_(table),
      bus_(bus) {}

Listener::~Listener() {
    stop();
}

std::error_code Listener::bind(const std::string& address, uint16_t port) {
    if (running_.load()) {
        return make_error_code(ErrorCode::InvalidArgument);
    }

    std::error_code ec;
    // SO_BROADCAST is not needed to receive broadcasts
    socket_ = UdpSocket::bind(address, port, false, ec);
    if (!socket_) {
        return ec ? ec : make_error_code(ErrorCode::BindFailed);
    }
    bound_port_ = socket_->local_port();
    Logger::instance().info("Listening for discovery and chunks on {}:{}", address, bound_port_);
    return {};
}

bool Listener::start() {
    if (!socket_ || !socket_->is_open()) {
        Logger::instance().error("Listener started without a bound socket");
        return false;
    }
    if (running_.exchange(true)) {
        Logger::instance().warning("Listener already running");
        return true;
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    thread_ = std::thread([this]() { receive_loop(); });
    return true;
}

void Listener::stop() {
    running_ = false;
    if (thread_.joinable() && thread_.get_id() == std::this_thread::get_id()) {
        // Called from a callback on the receive thread: the loop ends after this datagram
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (socket_) {
        socket_->close();
        socket_.reset();
    }
}

void Listener::receive_loop() {
    Logger::instance().debug("Receive loop started on port {}", bound_port_);
    Datagram datagram;

    while (running_.load()) {
        switch (socket_->receive(datagram, POLL_TIMEOUT_MS)) {
            case ReceiveResult::Timeout:
                continue;
            case ReceiveResult::Oversized:
                ++datagrams_received_;
                ++decode_failures_;
                Logger::instance().debug("Dropped oversized datagram from {}", datagram.source_address);
                continue;
            case ReceiveResult::Error:
                Logger::instance().warning("UDP receive failed: {}", strerror(errno));
                std::this_thread::sleep_for(std::chrono::milliseconds(POLL_TIMEOUT_MS));
                continue;
            case ReceiveResult::Received:
                break;
        }

        try {
            handle_datagram(datagram.data, datagram.source_address);
        } catch (const std::exception& e) {
            Logger::instance().error("Error handling datagram from {}: {}", datagram.source_address, e.what());
        }
    }

    Logger::instance().debug("Receive loop exited");
}

DatagramDisposition Listener::handle_datagram(std::string_view bytes,
                                              const std::string& source_address,
                                              Clock::time_point now) {
    ++datagrams_received_;

    std::string error;
    auto message = decode_message(bytes, &error);
    if (!message) {
        ++decode_failures_;
        Logger::instance().debug("Undecodable datagram from {}: {}", source_address, error);
        return DatagramDisposition::DecodeFailed;
    }

    if (auto* announcement = std::get_if<DiscoveryAnnouncement>(&*message)) {
        return on_announcement(*announcement, source_address, now);
    }
    return on_chunk(std::get<MessageChunk>(*message), now);
}

DatagramDisposition Listener::on_announcement(const DiscoveryAnnouncement& announcement,
                                              const std::string& source_address,
                                              Clock::time_point now) {
    if (announcement.peer_id == own_identity_) {
        return DatagramDisposition::SelfDiscarded;
    }

    bool added = registry_.upsert(announcement.peer_id, source_address, announcement.port,
                                  announcement.hostname, now);
    if (!added) {
        return DatagramDisposition::PeerRefreshed;
    }

    if (on_peer_discovered_) {
        if (auto peer = registry_.find(announcement.peer_id)) {
            on_peer_discovered_(*peer);
        }
    }
    return DatagramDisposition::PeerAdded;
}

DatagramDisposition Listener::on_chunk(const MessageChunk& chunk, Clock::time_point now) {
    if (chunk.peer_id == own_identity_) {
        return DatagramDisposition::SelfDiscarded;
    }

    ChunkOutcome outcome = table_.accept_chunk(chunk, now);
    switch (outcome.status) {
        case ChunkStatus::AcceptedIncomplete:
            return DatagramDisposition::ChunkBuffered;
        case ChunkStatus::AcceptedComplete:
            break;
        default:
            Logger::instance().debug("Chunk {}/{} of message {} from {}: {}",
                                     chunk.chunk_index, chunk.total_chunks, chunk.message_id,
                                     chunk.peer_id, to_string(outcome.status));
            return DatagramDisposition::ChunkRejected;
    }

    ++messages_delivered_;
    Logger::instance().info("Received message {} from {} ({} bytes)",
                            chunk.message_id, chunk.peer_id, outcome.payload.size());
    bus_.publish(chunk.peer_id, outcome.payload);
    return DatagramDisposition::MessageDelivered;
}

} // namespace lanshare
