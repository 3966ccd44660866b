#ifndef BULKXFER_BASE_CONFIG_H
#define BULKXFER_BASE_CONFIG_H

#include <string>
#include <cstdint>
#include <map>

namespace bulkxfer {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "console";  // console, file
    std::string file_path = "";
};

// Transfer geometry configuration
struct TransferConfig {
    uint32_t block_size = 32 * 1024;
    bool initially_complete = false;  // sender side re-offering a complete file
};

// Block storage configuration
struct StorageConfig {
    std::string type = "file";  // file, memory
    std::string path;
    bool truncate = true;       // resize the backing file to the transfer size
};

// Relay tool configuration
struct RelayConfig {
    std::string source_path;
    uint32_t worker_threads = 4;
    uint32_t relay_count = 1;   // transmitters re-reading every announced block
    uint32_t shuffle_seed = 0;  // 0 = random
    bool verify = true;
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    TransferConfig transfer;
    StorageConfig storage;
    RelayConfig relay;
};

class Config {
public:
    static Config& instance();

    // Load configuration from an INI-style file
    bool load_from_file(const std::string& path);

    // Load configuration from environment variables
    bool load_from_env();

    // Parse command line arguments and override config
    bool parse_command_line(int argc, char* argv[]);

    // Get configuration
    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    // Get config file path that was loaded
    const std::string& get_config_file() const { return config_file_; }

    // Restore defaults
    void reset();

    // Check if required fields are set
    bool validate() const;

    // Print configuration (for debugging)
    void print() const;

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    using Sections = std::map<std::string, std::map<std::string, std::string>>;

    void apply_sections(Sections& sections);
    void override_from_env();

    GlobalConfig config_;
    std::string config_file_;
};

} // namespace bulkxfer

#endif // BULKXFER_BASE_CONFIG_H
