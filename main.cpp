#include <iostream>
#include <memory>
#include <string>
#include <csignal>
#include <chrono>
#include <poll.h>
#include <unistd.h>

#include "lanshare/base/logger.h"
#include "lanshare/base/config.h"
#include "lanshare/p2p/discovery_service.h"

using namespace lanshare;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

// Signal handler for graceful shutdown
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

class LanShareApplication {
public:
    LanShareApplication() = default;
    ~LanShareApplication() {
        if (service_) {
            service_->stop();
        }
    }

    bool initialize(int argc, char* argv[]) {
        Config::instance().load_from_env();

        // Returns false for --help, --version or parse errors
        if (!Config::instance().parse_command_line(argc, argv)) {
            return false;
        }
        if (!Config::instance().validate()) {
            Logger::instance().error("Invalid configuration");
            return false;
        }

        Config::instance().print();

        const auto& config = Config::instance().get();
        service_ = std::make_unique<DiscoveryService>(config.node, config.discovery);

        service_->subscribe([](const std::string& sender, const std::string& payload) {
            std::cout << "[" << sender << "] " << payload << std::endl;
        });
        service_->set_on_peer_discovered([](const Peer& peer) {
            std::cout << "+ " << peer.hostname.value_or(peer.peer_id)
                      << " (" << peer.address << ":" << peer.port << ")" << std::endl;
        });
        service_->set_on_peer_lost([](const std::string& peer_id) {
            std::cout << "- " << peer_id << std::endl;
        });
        return true;
    }

    bool start() {
        if (!service_->start()) {
            Logger::instance().error("Failed to start discovery service");
            return false;
        }
        std::cout << "Identity " << service_->own_identity() << " (" << service_->hostname()
                  << "), UDP port " << service_->bound_port() << std::endl;
        std::cout << "Type a line to send it to every peer. /peers, /to <peer-id> <text>, /quit" << std::endl;
        return true;
    }

    void run() {
        std::string line;
        while (g_running) {
            pollfd pfd{};
            pfd.fd = STDIN_FILENO;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, 100) <= 0) {
                continue;
            }
            if (!std::getline(std::cin, line)) {
                break;
            }
            if (!handle_line(line)) {
                break;
            }
        }
        stop();
    }

    void stop() {
        if (service_) {
            service_->stop();
        }
    }

private:
    bool handle_line(const std::string& line) {
        if (line.empty()) {
            return true;
        }
        if (line == "/quit") {
            return false;
        }
        if (line == "/peers") {
            print_peers();
            return true;
        }
        if (line.rfind("/to ", 0) == 0) {
            auto space = line.find(' ', 4);
            if (space == std::string::npos) {
                std::cout << "usage: /to <peer-id> <text>" << std::endl;
                return true;
            }
            report(service_->send_text(line.substr(space + 1), SendTarget::peer(line.substr(4, space - 4))));
            return true;
        }
        report(service_->send_text(line, SendTarget::all()));
        return true;
    }

    void print_peers() const {
        auto peers = service_->list_peers();
        std::cout << peers.size() << " peer(s)" << std::endl;
        auto now = Clock::now();
        for (const auto& peer : peers) {
            auto age = std::chrono::duration_cast<std::chrono::seconds>(now - peer.last_seen).count();
            std::cout << "  " << peer.peer_id << "  " << peer.hostname.value_or("-") << "  "
                      << peer.address << ":" << peer.port << "  seen " << age << "s ago" << std::endl;
        }
    }

    static void report(const SendReport& result) {
        if (!result.ok()) {
            std::cout << "send failed: " << to_string(result.code) << std::endl;
        } else if (result.send_failures > 0) {
            std::cout << "sent with " << result.send_failures << " lost datagram(s)" << std::endl;
        }
    }

    std::unique_ptr<DiscoveryService> service_;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        LanShareApplication app;

        if (!app.initialize(argc, argv)) {
            return 1;
        }

        if (!app.start()) {
            std::cerr << "Failed to start application" << std::endl;
            return 1;
        }

        app.run();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
