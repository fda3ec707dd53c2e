#ifndef LANSHARE_BASE_CONFIG_H
#define LANSHARE_BASE_CONFIG_H

#include <string>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <map>

namespace lanshare {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stderr";  // stdout, stderr, file
    std::string file_path = "";
};

// Local instance configuration
struct NodeConfig {
    std::string peer_id;                      // empty = generate a UUID at startup
    std::optional<std::string> hostname;      // empty = taken from the environment
    std::string bind_address = "0.0.0.0";
};

// Discovery and chunk transport configuration
struct DiscoveryConfig {
    uint16_t port = 7878;                     // shared by announcements and chunks, 0 = ephemeral
    std::string broadcast_address = "255.255.255.255";
    uint32_t broadcast_interval_sec = 5;
    uint32_t peer_timeout_sec = 30;
    uint32_t cleanup_interval_sec = 10;
    uint32_t reassembly_timeout_sec = 20;
    size_t single_packet_threshold = 1100;    // bytes of payload per chunk
    size_t max_message_size = 256 * 1024;     // 256 KiB ceiling per message
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    NodeConfig node;
    DiscoveryConfig discovery;
};

class Config {
public:
    static Config& instance();

    // Load configuration from file (INI, or JSON for *.json)
    bool load_from_file(const std::string& path);

    // Load configuration from environment variables
    bool load_from_env();

    // Parse command line arguments and override config.
    // Returns false on --help/--version or a parse error.
    bool parse_command_line(int argc, char* argv[]);

    // Get configuration
    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    // Get config file path that was loaded
    const std::string& get_config_file() const { return config_file_; }

    // Restore defaults
    void reset();

    // Check that intervals and sizes are usable
    bool validate() const;

    // Print configuration (for debugging)
    void print() const;

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    bool load_ini(const std::string& path);
    bool load_json(const std::string& path);
    void apply_section(const std::string& section,
                       const std::map<std::string, std::string>& values);
    void override_from_env();
    void apply_logging() const;

    GlobalConfig config_;
    std::string config_file_;
};

} // namespace lanshare

#endif // LANSHARE_BASE_CONFIG_H
