#pragma once

#include "types.hpp"
#include <string>
#include <filesystem>
#include <chrono>

namespace chunkfetch {

// In-flight fetch bookkeeping
struct SessionTableConfig {
    size_t capacity = DEFAULT_SESSION_TABLE_CAPACITY;  // Max tracked addresses
};

// In-memory chunk store configuration
struct MemoryStoreConfig {
    size_t max_chunks = 64 * 1024;  // Least recently used chunks are evicted beyond this
    size_t max_chunk_size = DEFAULT_MAX_CHUNK_SIZE;
};

// Disk chunk store configuration
struct DiskStoreConfig {
    bool enabled = false;
    std::filesystem::path path = "/var/lib/chunkfetch";
    bool sync_writes = true;  // Durability waits block until fsync
    std::chrono::milliseconds flush_interval{20};
    size_t max_chunk_size = DEFAULT_MAX_CHUNK_SIZE;
};

// Logging configuration (spdlog)
struct LoggingConfig {
    std::string level = "info";
    std::string pattern;  // Empty = spdlog default
};

// Main configuration
struct Config {
    SessionTableConfig sessions;
    MemoryStoreConfig memory;
    DiskStoreConfig disk;
    LoggingConfig logging;

    // Load from file
    static Config load(const std::filesystem::path& path);
    static Config load_json(const std::string& json);

    // Save to file
    void save(const std::filesystem::path& path) const;
    std::string to_json() const;

    // Validation
    Status validate() const;
};

// Apply level and pattern to the default spdlog logger
Status configure_logging(const LoggingConfig& config);

}  // namespace chunkfetch
