#include "bulkxfer/base/config.h"
#include "bulkxfer/base/logger.h"
#include "CLI/CLI.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace bulkxfer {

namespace {

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

// std::stoul alone wraps values that do not fit 32 bits
uint32_t parse_uint32(const std::string& value) {
    if (value.find('-') != std::string::npos) {
        throw std::invalid_argument("negative value '" + value + "'");
    }
    unsigned long long parsed = std::stoull(value);
    if (parsed > std::numeric_limits<uint32_t>::max()) {
        throw std::out_of_range("value '" + value + "' exceeds 32 bits");
    }
    return static_cast<uint32_t>(parsed);
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
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

    Sections sections;
    if (!parse_ini_file(path, sections)) {
        Logger::instance().error("Failed to open config file: {}", path);
        return false;
    }

    try {
        apply_sections(sections);
    } catch (const std::exception& e) {
        // parse_uint32 reports malformed numbers by throwing
        Logger::instance().error("Invalid value in config file {}: {}", path, e.what());
        return false;
    }

    config_file_ = path;
    Logger::instance().info("Config loaded successfully from: {}", path);
    return true;
}

void Config::apply_sections(Sections& sections) {
    if (sections.count("log")) {
        auto& s = sections["log"];
        if (s.count("level")) {
            config_.log.level = s["level"];
            Logger::instance().set_level(parse_log_level(s["level"]));
        }
        if (s.count("output")) config_.log.output = s["output"];
        if (s.count("file_path")) config_.log.file_path = s["file_path"];
    }

    if (sections.count("transfer")) {
        auto& s = sections["transfer"];
        if (s.count("block_size")) config_.transfer.block_size = parse_uint32(s["block_size"]);
        if (s.count("initially_complete")) config_.transfer.initially_complete = parse_bool(s["initially_complete"]);
    }

    if (sections.count("storage")) {
        auto& s = sections["storage"];
        if (s.count("type")) config_.storage.type = s["type"];
        if (s.count("path")) config_.storage.path = s["path"];
        if (s.count("truncate")) config_.storage.truncate = parse_bool(s["truncate"]);
    }

    if (sections.count("relay")) {
        auto& s = sections["relay"];
        if (s.count("source_path")) config_.relay.source_path = s["source_path"];
        if (s.count("worker_threads")) config_.relay.worker_threads = parse_uint32(s["worker_threads"]);
        if (s.count("relay_count")) config_.relay.relay_count = parse_uint32(s["relay_count"]);
        if (s.count("shuffle_seed")) config_.relay.shuffle_seed = parse_uint32(s["shuffle_seed"]);
        if (s.count("verify")) config_.relay.verify = parse_bool(s["verify"]);
    }
}

bool Config::load_from_env() {
    Logger::instance().debug("Loading config from environment variables");

    try {
        override_from_env();
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid value in environment: {}", e.what());
        return false;
    }
    return true;
}

void Config::override_from_env() {
    // Log config
    if (const char* val = std::getenv("BULKXFER_LOG_LEVEL")) {
        config_.log.level = val;
    }
    if (const char* val = std::getenv("BULKXFER_LOG_FILE")) {
        config_.log.file_path = val;
        config_.log.output = "file";
    }

    // Transfer
    if (const char* val = std::getenv("BULKXFER_BLOCK_SIZE")) {
        config_.transfer.block_size = parse_uint32(val);
    }

    // Storage
    if (const char* val = std::getenv("BULKXFER_STORAGE_TYPE")) {
        config_.storage.type = val;
    }
    if (const char* val = std::getenv("BULKXFER_STORAGE_PATH")) {
        config_.storage.path = val;
    }

    // Relay
    if (const char* val = std::getenv("BULKXFER_WORKERS")) {
        config_.relay.worker_threads = parse_uint32(val);
    }
}

bool Config::parse_command_line(int argc, char* argv[]) {
    CLI::App app{"bulkxfer - out-of-order bulk block reception relay"};

    // Config file option
    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (console, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Transfer options
    app.add_option("-b,--block-size", config_.transfer.block_size, "Block size in bytes");
    app.add_flag("--initially-complete", config_.transfer.initially_complete,
                 "Treat the output as already holding every block");

    // Storage options
    app.add_option("--storage-type", config_.storage.type, "Storage type (file, memory)");
    app.add_option("-o,--output", config_.storage.path, "Output file receiving the blocks");
    app.add_flag("!--no-truncate", config_.storage.truncate, "Do not resize the output file");

    // Relay options
    app.add_option("-s,--source", config_.relay.source_path, "Source file to transfer");
    app.add_option("-w,--workers", config_.relay.worker_threads, "Number of delivering threads");
    app.add_option("-r,--relays", config_.relay.relay_count, "Number of relay transmitters");
    app.add_option("--seed", config_.relay.shuffle_seed, "Delivery order seed (0 = random)");
    app.add_flag("!--no-verify", config_.relay.verify, "Skip read-back verification");

    app.set_version_flag("-v,--version", "0.1.0");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Help and version requests carry exit code 0
        app.exit(e);
        return false;
    }

    // Priority is file, then environment, then command line, so both are reapplied after loading it
    if (!config_file.empty()) {
        if (!load_from_file(config_file)) {
            return false;
        }
        if (!load_from_env()) {
            return false;
        }
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            app.exit(e);
            return false;
        }
    }

    if (!config_.log.level.empty()) {
        Logger::instance().set_level(parse_log_level(config_.log.level));
    }
    if (config_.log.output == "file" && !config_.log.file_path.empty()) {
        Logger::instance().set_file_output(config_.log.file_path);
    }

    return true;
}

bool Config::validate() const {
    if (config_.transfer.block_size == 0) {
        Logger::instance().error("transfer.block_size must be greater than zero");
        return false;
    }
    if (config_.storage.type != "file" && config_.storage.type != "memory") {
        Logger::instance().error("storage.type must be 'file' or 'memory', got '{}'", config_.storage.type);
        return false;
    }
    if (config_.storage.type == "file" && config_.storage.path.empty()) {
        Logger::instance().error("storage.path is required for file storage");
        return false;
    }
    if (config_.relay.source_path.empty()) {
        Logger::instance().error("relay.source_path is required");
        return false;
    }
    if (config_.relay.worker_threads == 0) {
        Logger::instance().error("relay.worker_threads must be greater than zero");
        return false;
    }
    return true;
}

void Config::print() const {
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Log Level: {}", config_.log.level);
    Logger::instance().info("Block Size: {} bytes", config_.transfer.block_size);
    Logger::instance().info("Storage: {} {}", config_.storage.type, config_.storage.path);
    Logger::instance().info("Source: {}", config_.relay.source_path);
    Logger::instance().info("Workers: {}, Relays: {}", config_.relay.worker_threads, config_.relay.relay_count);
}

} // namespace bulkxfer
