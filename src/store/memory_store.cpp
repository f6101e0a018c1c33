#include "chunkfetch/memory_store.hpp"
#include <spdlog/spdlog.h>

namespace chunkfetch {

MemoryChunkStore::MemoryChunkStore(const MemoryStoreConfig& config)
    : config_(config)
    , chunks_(config.max_chunks)
{}

MemoryChunkStore::~MemoryChunkStore() = default;

ChunkResult MemoryChunkStore::get(const Address& address) {
    if (closed_) {
        return ChunkResult::failed(Status::error(ErrorCode::StoreClosed, "memory store closed"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto* chunk = chunks_.get(address);
    if (!chunk) {
        misses_++;
        return ChunkResult::failed(Status::error(ErrorCode::NotFound));
    }
    hits_++;
    return ChunkResult::found(*chunk);
}

PutResult MemoryChunkStore::put(SharedChunk chunk) {
    if (!chunk) {
        return PutResult::failed(Status::error(ErrorCode::InvalidArgument, "Null chunk"));
    }
    if (chunk->size() > config_.max_chunk_size) {
        return PutResult::failed(Status::error(ErrorCode::ChunkTooLarge,
            "chunk " + chunk->address().to_hex() + " exceeds maximum size"));
    }
    if (closed_) {
        return PutResult::failed(Status::error(ErrorCode::StoreClosed, "memory store closed"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (chunks_.contains(chunk->address())) {
        duplicate_writes_++;
        return PutResult::present();
    }

    size_t size = chunk->size();
    Address address = chunk->address();
    auto evicted = chunks_.put(address, std::move(chunk));
    evictions_ += evicted.size();
    for (const auto& [old, _] : evicted) {
        spdlog::debug("memory store evicted chunk {}", old.to_hex());
    }

    writes_++;
    bytes_written_ += size;

    // Nothing further to wait for once the chunk is in memory
    return PutResult::written([](const RequestContext&) { return Status::make_ok(); });
}

bool MemoryChunkStore::has(const Address& address) {
    if (closed_) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.contains(address);
}

void MemoryChunkStore::close() {
    if (closed_.exchange(true)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_.clear();
}

IChunkStore::Stats MemoryChunkStore::stats() const {
    Stats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.writes = writes_.load();
    s.duplicate_writes = duplicate_writes_.load();
    s.bytes_written = bytes_written_.load();
    s.evictions = evictions_.load();
    s.capacity = config_.max_chunks;

    std::lock_guard<std::mutex> lock(mutex_);
    s.entry_count = chunks_.size();
    return s;
}

}  // namespace chunkfetch
