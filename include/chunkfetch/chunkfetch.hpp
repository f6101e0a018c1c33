#pragma once

// Main chunkfetch header - includes everything needed

#include "types.hpp"
#include "config.hpp"
#include "chunk.hpp"
#include "request.hpp"
#include "lru_cache.hpp"
#include "chunk_store.hpp"
#include "memory_store.hpp"
#include "disk_store.hpp"
#include "remote_fetch.hpp"
#include "fetch_session.hpp"
#include "session_table.hpp"
#include "fetch_coordinator.hpp"
#include <memory>

namespace chunkfetch {

// Builds the configured store and a coordinator over it
class ChunkFetchNode {
public:
    ChunkFetchNode(const Config& config, FetchFactory fetch_factory);
    ~ChunkFetchNode();

    ChunkFetchNode(const ChunkFetchNode&) = delete;
    ChunkFetchNode& operator=(const ChunkFetchNode&) = delete;

    // Apply logging settings, open the store and create the coordinator
    Status start();

    // Close the store; safe to call more than once
    void stop();

    bool running() const noexcept { return coordinator_ != nullptr && !stopped_; }

    // Valid after a successful start()
    FetchCoordinator& coordinator() { return *coordinator_; }

    const Config& config() const { return config_; }

private:
    Config config_;
    FetchFactory fetch_factory_;
    std::unique_ptr<FetchCoordinator> coordinator_;
    bool stopped_ = false;
};

// Version information
struct Version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;
    static const char* string() { return "0.1.0"; }
};

}  // namespace chunkfetch
