#pragma once

#include "chunk_store.hpp"
#include "config.hpp"
#include "lru_cache.hpp"
#include <atomic>
#include <mutex>

namespace chunkfetch {

// Memory-resident chunk store bounded by chunk count.
// Writes are durable as soon as put() returns; the durability wait it hands
// out is already satisfied.
class MemoryChunkStore : public IChunkStore {
public:
    explicit MemoryChunkStore(const MemoryStoreConfig& config = {});
    ~MemoryChunkStore() override;

    ChunkResult get(const Address& address) override;
    PutResult put(SharedChunk chunk) override;
    bool has(const Address& address) override;
    void close() override;

    Stats stats() const override;

    bool closed() const noexcept { return closed_.load(); }

private:
    MemoryStoreConfig config_;

    mutable std::mutex mutex_;
    LRUCache<Address, SharedChunk> chunks_;
    std::atomic<bool> closed_{false};

    // Statistics
    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> duplicate_writes_{0};
    std::atomic<uint64_t> bytes_written_{0};
    std::atomic<uint64_t> evictions_{0};
};

}  // namespace chunkfetch
