#include <catch2/catch_test_macros.hpp>
#include "chunkfetch/config.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <random>

using namespace chunkfetch;

namespace {

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("chunkfetch_config_test_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace

TEST_CASE("Config defaults", "[config]") {
    Config config;

    REQUIRE(config.sessions.capacity == 5000);
    REQUIRE(config.memory.max_chunks == 65536);
    REQUIRE(config.memory.max_chunk_size == DEFAULT_MAX_CHUNK_SIZE);
    REQUIRE(!config.disk.enabled);
    REQUIRE(config.disk.sync_writes);
    REQUIRE(config.logging.level == "info");
    REQUIRE(config.validate().ok());
}

TEST_CASE("Config validation", "[config]") {
    Config config;

    SECTION("Zero session capacity") {
        config.sessions.capacity = 0;
        REQUIRE(config.validate().code() == ErrorCode::InvalidArgument);
    }

    SECTION("Zero memory chunks") {
        config.memory.max_chunks = 0;
        REQUIRE(!config.validate().ok());
    }

    SECTION("Zero chunk size") {
        config.disk.max_chunk_size = 0;
        REQUIRE(!config.validate().ok());
    }

    SECTION("Enabled disk store needs a path") {
        config.disk.enabled = true;
        config.disk.path.clear();
        REQUIRE(!config.validate().ok());
    }

    SECTION("Flush interval must be positive") {
        config.disk.flush_interval = std::chrono::milliseconds(0);
        REQUIRE(!config.validate().ok());
    }

    SECTION("Unknown log level") {
        config.logging.level = "verbose";
        auto status = config.validate();
        REQUIRE(!status.ok());
        REQUIRE(status.message().find("verbose") != std::string::npos);
    }
}

TEST_CASE("Config JSON", "[config]") {
    SECTION("Partial document keeps defaults") {
        auto config = Config::load_json(R"({
            "sessions": { "capacity": 64 },
            "logging": { "level": "debug" }
        })");

        REQUIRE(config.sessions.capacity == 64);
        REQUIRE(config.logging.level == "debug");
        REQUIRE(config.memory.max_chunks == 65536);
        REQUIRE(!config.disk.enabled);
    }

    SECTION("Nested keys with the same name stay apart") {
        auto config = Config::load_json(R"({
            "memory": { "max_chunks": 10, "max_chunk_size": 1024 },
            "disk": { "enabled": true, "path": "/tmp/cf", "max_chunk_size": 2048,
                      "sync_writes": false, "flush_interval_ms": 5 }
        })");

        REQUIRE(config.memory.max_chunks == 10);
        REQUIRE(config.memory.max_chunk_size == 1024);
        REQUIRE(config.disk.enabled);
        REQUIRE(config.disk.path.string() == "/tmp/cf");
        REQUIRE(config.disk.max_chunk_size == 2048);
        REQUIRE(!config.disk.sync_writes);
        REQUIRE(config.disk.flush_interval == std::chrono::milliseconds(5));
    }

    SECTION("to_json is read back unchanged") {
        Config config;
        config.sessions.capacity = 77;
        config.disk.enabled = true;
        config.disk.path = "/data/chunks";
        config.logging.pattern = "[%l] %v";

        auto loaded = Config::load_json(config.to_json());
        REQUIRE(loaded.sessions.capacity == 77);
        REQUIRE(loaded.disk.enabled);
        REQUIRE(loaded.disk.path.string() == "/data/chunks");
        REQUIRE(loaded.logging.pattern == "[%l] %v");
    }
}

TEST_CASE("Config files", "[config]") {
    TempDir tmp;

    SECTION("Save and load") {
        Config config;
        config.sessions.capacity = 12;
        auto path = tmp.path() / "chunkfetch.json";
        config.save(path);

        auto loaded = Config::load(path);
        REQUIRE(loaded.sessions.capacity == 12);
    }

    SECTION("Missing file throws") {
        REQUIRE_THROWS_AS(Config::load(tmp.path() / "missing.json"), std::runtime_error);
    }
}

TEST_CASE("Logging configuration", "[config]") {
    SECTION("Known level is applied") {
        LoggingConfig logging;
        logging.level = "warn";
        REQUIRE(configure_logging(logging).ok());
        REQUIRE(spdlog::get_level() == spdlog::level::warn);
    }

    SECTION("Unknown level is rejected") {
        LoggingConfig logging;
        logging.level = "loud";
        REQUIRE(configure_logging(logging).code() == ErrorCode::InvalidArgument);
    }

    spdlog::set_level(spdlog::level::info);
}
