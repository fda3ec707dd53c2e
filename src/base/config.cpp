#include "lanshare/base/config.h"
#include "lanshare/base/logger.h"
#include "lanshare/protocol/wire_codec.h"
#include "CLI/CLI.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace lanshare {

namespace {

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

// Simple INI-style parser for config files
bool parse_ini_file(const std::string& path, std::map<std::string, std::map<std::string, std::string>>& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section];
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            // Remove quotes
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
    return true;
}

// std::stoull accepts a leading '-' and wraps it, so refuse signs outright
unsigned long long parse_unsigned(const std::string& value, unsigned long long max_value) {
    if (value.find('-') != std::string::npos) {
        throw std::out_of_range("negative value: " + value);
    }
    unsigned long long v = std::stoull(value);
    if (v > max_value) {
        throw std::out_of_range("value out of range: " + value);
    }
    return v;
}

uint16_t parse_port(const std::string& value) {
    return static_cast<uint16_t>(parse_unsigned(value, std::numeric_limits<uint16_t>::max()));
}

uint32_t parse_u32(const std::string& value) {
    return static_cast<uint32_t>(parse_unsigned(value, std::numeric_limits<uint32_t>::max()));
}

size_t parse_size(const std::string& value) {
    return static_cast<size_t>(parse_unsigned(value, std::numeric_limits<size_t>::max()));
}

} // anonymous namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    config_ = GlobalConfig{};
    config_file_.clear();
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: {}", path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: {}", path);
        return false;
    }

    bool ok = false;
    try {
        if (std::filesystem::path(path).extension() == ".json") {
            ok = load_json(path);
        } else {
            ok = load_ini(path);
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid value in config file {}: {}", path, e.what());
        return false;
    }

    if (ok) {
        config_file_ = path;
        apply_logging();
        Logger::instance().info("Config loaded successfully from: {}", path);
    }
    return ok;
}

bool Config::load_ini(const std::string& path) {
    std::map<std::string, std::map<std::string, std::string>> sections;
    if (!parse_ini_file(path, sections)) {
        Logger::instance().error("Cannot open config file: {}", path);
        return false;
    }
    for (const auto& [name, values] : sections) {
        apply_section(name, values);
    }
    return true;
}

bool Config::load_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::instance().error("Cannot open config file: {}", path);
        return false;
    }

    json root = json::parse(file, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        Logger::instance().error("Config file is not a JSON object: {}", path);
        return false;
    }

    // Flatten {"section": {"key": value}} into the same shape the INI parser yields
    for (const auto& [section, body] : root.items()) {
        if (!body.is_object()) continue;
        std::map<std::string, std::string> values;
        for (const auto& [key, value] : body.items()) {
            values[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
        apply_section(section, values);
    }
    return true;
}

void Config::apply_section(const std::string& section,
                           const std::map<std::string, std::string>& s) {
    auto get = [&s](const char* key) -> const std::string* {
        auto it = s.find(key);
        return it == s.end() ? nullptr : &it->second;
    };

    if (section == "log") {
        if (auto v = get("level")) config_.log.level = *v;
        if (auto v = get("output")) config_.log.output = *v;
        if (auto v = get("file_path")) config_.log.file_path = *v;
    } else if (section == "node") {
        if (auto v = get("peer_id")) config_.node.peer_id = *v;
        if (auto v = get("hostname")) config_.node.hostname = *v;
        if (auto v = get("bind_address")) config_.node.bind_address = *v;
    } else if (section == "discovery") {
        auto& d = config_.discovery;
        if (auto v = get("port")) d.port = parse_port(*v);
        if (auto v = get("broadcast_address")) d.broadcast_address = *v;
        if (auto v = get("broadcast_interval_sec")) d.broadcast_interval_sec = parse_u32(*v);
        if (auto v = get("peer_timeout_sec")) d.peer_timeout_sec = parse_u32(*v);
        if (auto v = get("cleanup_interval_sec")) d.cleanup_interval_sec = parse_u32(*v);
        if (auto v = get("reassembly_timeout_sec")) d.reassembly_timeout_sec = parse_u32(*v);
        if (auto v = get("single_packet_threshold")) d.single_packet_threshold = parse_size(*v);
        if (auto v = get("max_message_size")) d.max_message_size = parse_size(*v);
    } else if (!section.empty()) {
        Logger::instance().warning("Ignoring unknown config section: {}", section);
    }
}

bool Config::load_from_env() {
    try {
        override_from_env();
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid LANSHARE_* environment value: {}", e.what());
        return false;
    }
    apply_logging();
    return true;
}

void Config::override_from_env() {
    // Node config
    if (const char* val = std::getenv("LANSHARE_PEER_ID")) {
        config_.node.peer_id = val;
    }
    if (const char* val = std::getenv("LANSHARE_HOSTNAME")) {
        config_.node.hostname = std::string(val);
    }
    if (const char* val = std::getenv("LANSHARE_BIND_ADDRESS")) {
        config_.node.bind_address = val;
    }

    // Log config
    if (const char* val = std::getenv("LANSHARE_LOG_LEVEL")) {
        config_.log.level = val;
    }

    // Discovery
    if (const char* val = std::getenv("LANSHARE_PORT")) {
        config_.discovery.port = parse_port(val);
    }
    if (const char* val = std::getenv("LANSHARE_BROADCAST_ADDRESS")) {
        config_.discovery.broadcast_address = val;
    }
    if (const char* val = std::getenv("LANSHARE_BROADCAST_INTERVAL")) {
        config_.discovery.broadcast_interval_sec = parse_u32(val);
    }
    if (const char* val = std::getenv("LANSHARE_PEER_TIMEOUT")) {
        config_.discovery.peer_timeout_sec = parse_u32(val);
    }
    if (const char* val = std::getenv("LANSHARE_CLEANUP_INTERVAL")) {
        config_.discovery.cleanup_interval_sec = parse_u32(val);
    }
    if (const char* val = std::getenv("LANSHARE_REASSEMBLY_TIMEOUT")) {
        config_.discovery.reassembly_timeout_sec = parse_u32(val);
    }
    if (const char* val = std::getenv("LANSHARE_CHUNK_SIZE")) {
        config_.discovery.single_packet_threshold = parse_size(val);
    }
    if (const char* val = std::getenv("LANSHARE_MAX_MESSAGE_SIZE")) {
        config_.discovery.max_message_size = parse_size(val);
    }
}

bool Config::parse_command_line(int argc, char* argv[]) {
    CLI::App app{"LanShare - zero-configuration LAN peer discovery and text sharing"};

    // Config file option
    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file (INI or JSON)");

    // Node options
    app.add_option("--peer-id", config_.node.peer_id, "Fixed peer identity (default: random UUID)");
    app.add_option("--hostname", config_.node.hostname, "Display name announced to peers");
    app.add_option("--bind-address", config_.node.bind_address, "Bind address");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Discovery options
    auto& d = config_.discovery;
    app.add_option("-p,--port", d.port, "UDP port for discovery and transport");
    app.add_option("--broadcast-address", d.broadcast_address, "Broadcast address for announcements");
    app.add_option("--broadcast-interval", d.broadcast_interval_sec, "Announcement interval (seconds)");
    app.add_option("--peer-timeout", d.peer_timeout_sec, "Peer staleness timeout (seconds)");
    app.add_option("--cleanup-interval", d.cleanup_interval_sec, "Cleanup sweep interval (seconds)");
    app.add_option("--reassembly-timeout", d.reassembly_timeout_sec, "Incomplete message timeout (seconds)");
    app.add_option("--chunk-size", d.single_packet_threshold, "Single-packet payload threshold (bytes)");
    app.add_option("--max-message-size", d.max_message_size, "Maximum message size (bytes)");

    app.set_version_flag("-v,--version", "0.1.0");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help and --version also land here, with exit code 0
        app.exit(e);
        return false;
    }

    if (!config_file.empty()) {
        if (!load_from_file(config_file)) {
            return false;
        }
        // Command line wins over the file: parse again on top of it
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            app.exit(e);
            return false;
        }
    }

    apply_logging();
    return true;
}

void Config::apply_logging() const {
    auto& logger = Logger::instance();
    if (!config_.log.level.empty()) {
        logger.set_level(parse_log_level(config_.log.level));
    }
    if (config_.log.output == "file" && !config_.log.file_path.empty()) {
        logger.set_file_output(config_.log.file_path);
    } else if (config_.log.output == "stdout") {
        logger.set_output(LogOutput::Stdout);
    } else if (config_.log.output == "stderr") {
        logger.set_output(LogOutput::Stderr);
    }
}

bool Config::validate() const {
    const auto& d = config_.discovery;
    if (d.broadcast_interval_sec == 0 || d.cleanup_interval_sec == 0) {
        Logger::instance().error("broadcast and cleanup intervals must be non-zero");
        return false;
    }
    if (d.peer_timeout_sec == 0 || d.reassembly_timeout_sec == 0) {
        Logger::instance().error("peer and reassembly timeouts must be non-zero");
        return false;
    }
    if (d.single_packet_threshold < MIN_CHUNK_SIZE) {
        Logger::instance().error("single_packet_threshold must be at least {} bytes", MIN_CHUNK_SIZE);
        return false;
    }
    if (d.max_message_size < d.single_packet_threshold) {
        Logger::instance().error("max_message_size ({}) is below single_packet_threshold ({})",
                                 d.max_message_size, d.single_packet_threshold);
        return false;
    }
    if (d.broadcast_address.empty()) {
        Logger::instance().error("broadcast_address is required");
        return false;
    }
    return true;
}

void Config::print() const {
    const auto& d = config_.discovery;
    auto& log = Logger::instance();
    log.info("=== Configuration ===");
    log.info("Peer ID: {}", config_.node.peer_id.empty() ? "<generated>" : config_.node.peer_id);
    log.info("Log Level: {}", config_.log.level);
    log.info("Port: {} (broadcast to {})", d.port, d.broadcast_address);
    log.info("Intervals: broadcast {}s, cleanup {}s", d.broadcast_interval_sec, d.cleanup_interval_sec);
    log.info("Timeouts: peer {}s, reassembly {}s", d.peer_timeout_sec, d.reassembly_timeout_sec);
    log.info("Chunking: {} bytes per chunk, {} bytes max", d.single_packet_threshold, d.max_message_size);
}

} // namespace lanshare
