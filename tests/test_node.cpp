#include <catch2/catch_test_macros.hpp>
#include "chunkfetch/chunkfetch.hpp"
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
                ("chunkfetch_node_test_" + std::to_string(rd()));
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

Config quiet_config() {
    Config config;
    config.logging.level = "off";
    return config;
}

}  // namespace

TEST_CASE("ChunkFetchNode startup", "[node]") {
    SECTION("Memory store by default") {
        ChunkFetchNode node(quiet_config(), nullptr);
        REQUIRE(!node.running());
        REQUIRE(node.start().ok());
        REQUIRE(node.running());

        auto chunk = make_content_chunk({1, 2});
        REQUIRE(node.coordinator().write(chunk).ok());
        REQUIRE(dynamic_cast<MemoryChunkStore*>(&node.coordinator().store()) != nullptr);
    }

    SECTION("Disk store when enabled") {
        TempDir tmp;
        auto config = quiet_config();
        config.disk.enabled = true;
        config.disk.path = tmp.path();

        ChunkFetchNode node(config, nullptr);
        REQUIRE(node.start().ok());
        REQUIRE(dynamic_cast<DiskChunkStore*>(&node.coordinator().store()) != nullptr);

        auto chunk = make_content_chunk({3, 4});
        auto written = node.coordinator().write(chunk);
        REQUIRE(written.ok());
        REQUIRE(written.wait(RequestContext::with_timeout(std::chrono::seconds(5))).ok());
        REQUIRE(std::filesystem::exists(tmp.path() / "chunks"));
    }

    SECTION("Invalid configuration is refused") {
        auto config = quiet_config();
        config.sessions.capacity = 0;
        ChunkFetchNode node(config, nullptr);
        REQUIRE(node.start().code() == ErrorCode::InvalidArgument);
        REQUIRE(!node.running());
    }

    SECTION("Started twice") {
        ChunkFetchNode node(quiet_config(), nullptr);
        REQUIRE(node.start().ok());
        REQUIRE(!node.start().ok());
    }

    spdlog::set_level(spdlog::level::info);
}

TEST_CASE("ChunkFetchNode stop", "[node]") {
    ChunkFetchNode node(quiet_config(), nullptr);
    REQUIRE(node.start().ok());
    auto chunk = make_content_chunk({5});
    node.coordinator().write(chunk);

    node.stop();
    node.stop();

    REQUIRE(!node.running());
    auto r = node.coordinator().read(RequestContext::background(), chunk->address());
    REQUIRE(r.status.code() == ErrorCode::StoreClosed);

    spdlog::set_level(spdlog::level::info);
}

TEST_CASE("Version", "[node]") {
    REQUIRE(std::string(Version::string()) == "0.1.0");
    REQUIRE(Version::major == 0);
}
