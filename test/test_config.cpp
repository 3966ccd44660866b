#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include "bulkxfer/base/config.h"
#include "bulkxfer/base/logger.h"

using namespace bulkxfer;

namespace fs = std::filesystem;

namespace {

std::string write_config(const std::string& name, const std::string& contents) {
    std::string path = (fs::temp_directory_path() /
                        ("bulkxfer_config_" + std::to_string(::getpid()) + "_" + name)).string();
    std::ofstream out(path);
    out << contents;
    return path;
}

} // anonymous namespace

TEST_CASE("Default configuration", "[config]") {
    Config::instance().reset();
    const auto& config = Config::instance().get();

    REQUIRE(config.log.level == "info");
    REQUIRE(config.transfer.block_size == 32 * 1024);
    REQUIRE(config.transfer.initially_complete == false);
    REQUIRE(config.storage.type == "file");
    REQUIRE(config.relay.worker_threads == 4);
    REQUIRE(config.relay.relay_count == 1);
    REQUIRE(config.relay.verify == true);

    // Source and output are required
    REQUIRE_FALSE(Config::instance().validate());
}

TEST_CASE("Load INI configuration file", "[config][file]") {
    Config::instance().reset();
    std::string path = write_config("full.ini",
        "# bulk transfer relay\n"
        "[log]\n"
        "level = warning\n"
        "\n"
        "[transfer]\n"
        "block_size = 4096\n"
        "initially_complete = true\n"
        "\n"
        "[storage]\n"
        "type = file\n"
        "path = \"/tmp/out.bin\"\n"
        "truncate = false\n"
        "\n"
        "[relay]\n"
        "source_path = '/tmp/in.bin'\n"
        "worker_threads = 8\n"
        "relay_count = 3\n"
        "shuffle_seed = 42\n"
        "verify = no\n");

    REQUIRE(Config::instance().load_from_file(path));
    const auto& config = Config::instance().get();

    REQUIRE(Config::instance().get_config_file() == path);
    REQUIRE(config.log.level == "warning");
    REQUIRE(Logger::instance().get_level() == LogLevel::warning);
    REQUIRE(config.transfer.block_size == 4096);
    REQUIRE(config.transfer.initially_complete == true);
    REQUIRE(config.storage.path == "/tmp/out.bin");
    REQUIRE(config.storage.truncate == false);
    REQUIRE(config.relay.source_path == "/tmp/in.bin");
    REQUIRE(config.relay.worker_threads == 8);
    REQUIRE(config.relay.relay_count == 3);
    REQUIRE(config.relay.shuffle_seed == 42);
    REQUIRE(config.relay.verify == false);
    REQUIRE(Config::instance().validate());

    Logger::instance().set_level(LogLevel::info);
    fs::remove(path);
}

TEST_CASE("Malformed and missing config files", "[config][file][error]") {
    Config::instance().reset();

    REQUIRE_FALSE(Config::instance().load_from_file("/nonexistent/bulkxfer.ini"));

    std::string path = write_config("bad.ini", "[transfer]\nblock_size = lots\n");
    REQUIRE_FALSE(Config::instance().load_from_file(path));
    REQUIRE(Config::instance().get().transfer.block_size == 32 * 1024);
    fs::remove(path);
}

TEST_CASE("Environment overrides", "[config][env]") {
    Config::instance().reset();
    ::setenv("BULKXFER_BLOCK_SIZE", "1024", 1);
    ::setenv("BULKXFER_STORAGE_TYPE", "memory", 1);
    ::setenv("BULKXFER_WORKERS", "2", 1);

    REQUIRE(Config::instance().load_from_env());
    const auto& config = Config::instance().get();
    REQUIRE(config.transfer.block_size == 1024);
    REQUIRE(config.storage.type == "memory");
    REQUIRE(config.relay.worker_threads == 2);

    ::setenv("BULKXFER_BLOCK_SIZE", "huge", 1);
    REQUIRE_FALSE(Config::instance().load_from_env());

    ::unsetenv("BULKXFER_BLOCK_SIZE");
    ::unsetenv("BULKXFER_STORAGE_TYPE");
    ::unsetenv("BULKXFER_WORKERS");
    Config::instance().reset();
}

TEST_CASE("Values beyond 32 bits are rejected", "[config][file][env][error]") {
    Config::instance().reset();

    std::string path = write_config("wide.ini", "[transfer]\nblock_size = 4294967297\n");
    REQUIRE_FALSE(Config::instance().load_from_file(path));
    REQUIRE(Config::instance().get().transfer.block_size == 32 * 1024);
    fs::remove(path);

    path = write_config("negative.ini", "[relay]\nworker_threads = -1\n");
    REQUIRE_FALSE(Config::instance().load_from_file(path));
    REQUIRE(Config::instance().get().relay.worker_threads == 4);
    fs::remove(path);

    ::setenv("BULKXFER_WORKERS", "4294967296", 1);
    REQUIRE_FALSE(Config::instance().load_from_env());
    REQUIRE(Config::instance().get().relay.worker_threads == 4);
    ::unsetenv("BULKXFER_WORKERS");

    ::setenv("BULKXFER_BLOCK_SIZE", "4294967295", 1);
    REQUIRE(Config::instance().load_from_env());
    REQUIRE(Config::instance().get().transfer.block_size == 4294967295u);
    ::unsetenv("BULKXFER_BLOCK_SIZE");

    Config::instance().reset();
}

TEST_CASE("Environment beats the config file, command line beats both", "[config][env][file]") {
    Config::instance().reset();
    std::string path = write_config("layered.ini",
        "[transfer]\n"
        "block_size = 4096\n"
        "[relay]\n"
        "source_path = /tmp/in.bin\n"
        "worker_threads = 8\n"
        "relay_count = 3\n");
    ::setenv("BULKXFER_BLOCK_SIZE", "1024", 1);
    ::setenv("BULKXFER_WORKERS", "2", 1);

    REQUIRE(Config::instance().load_from_env());

    SECTION("environment over file") {
        const char* argv[] = {"bulkxfer", "-c", path.c_str(), "-o", "/tmp/out.bin"};
        int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));
        REQUIRE(Config::instance().parse_command_line(argc, const_cast<char**>(argv)));

        const auto& config = Config::instance().get();
        REQUIRE(config.transfer.block_size == 1024);
        REQUIRE(config.relay.worker_threads == 2);
        // Keys the environment leaves alone come from the file
        REQUIRE(config.relay.relay_count == 3);
        REQUIRE(config.relay.source_path == "/tmp/in.bin");
    }

    SECTION("command line over environment and file") {
        const char* argv[] = {"bulkxfer", "-c", path.c_str(), "-o", "/tmp/out.bin",
                              "--block-size", "2048"};
        int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));
        REQUIRE(Config::instance().parse_command_line(argc, const_cast<char**>(argv)));

        const auto& config = Config::instance().get();
        REQUIRE(config.transfer.block_size == 2048);
        REQUIRE(config.relay.worker_threads == 2);
    }

    ::unsetenv("BULKXFER_BLOCK_SIZE");
    ::unsetenv("BULKXFER_WORKERS");
    fs::remove(path);
    Config::instance().reset();
}

TEST_CASE("Command line parsing", "[config][cli]") {
    Config::instance().reset();
    const char* argv[] = {"bulkxfer", "--source", "/tmp/in.bin", "-o", "/tmp/out.bin",
                          "--block-size", "2048", "--workers", "6", "--no-verify"};
    int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));

    REQUIRE(Config::instance().parse_command_line(argc, const_cast<char**>(argv)));
    const auto& config = Config::instance().get();
    REQUIRE(config.relay.source_path == "/tmp/in.bin");
    REQUIRE(config.storage.path == "/tmp/out.bin");
    REQUIRE(config.transfer.block_size == 2048);
    REQUIRE(config.relay.worker_threads == 6);
    REQUIRE(config.relay.verify == false);
    REQUIRE(Config::instance().validate());

    Config::instance().reset();
}

TEST_CASE("Validation catches bad values", "[config][validate]") {
    Config::instance().reset();
    auto& config = Config::instance().get();
    config.relay.source_path = "/tmp/in.bin";
    config.storage.path = "/tmp/out.bin";
    REQUIRE(Config::instance().validate());

    config.transfer.block_size = 0;
    REQUIRE_FALSE(Config::instance().validate());
    config.transfer.block_size = 512;

    config.relay.worker_threads = 0;
    REQUIRE_FALSE(Config::instance().validate());
    config.relay.worker_threads = 1;

    config.storage.type = "tape";
    REQUIRE_FALSE(Config::instance().validate());

    config.storage.type = "memory";
    config.storage.path.clear();
    REQUIRE(Config::instance().validate());

    Config::instance().reset();
}
