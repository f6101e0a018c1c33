#pragma once

#include "types.hpp"
#include "chunk.hpp"
#include "request.hpp"
#include <functional>

namespace chunkfetch {

// Blocks until a written chunk is durable or the caller's context ends
using DurabilityWait = std::function<Status(const RequestContext& ctx)>;

// Result of a store write
struct PutResult {
    Status status;
    bool already_present = false;  // Chunk was stored before this call
    DurabilityWait wait;           // Set for new writes only

    static PutResult present() {
        PutResult r;
        r.already_present = true;
        return r;
    }
    static PutResult written(DurabilityWait wait) {
        PutResult r;
        r.wait = std::move(wait);
        return r;
    }
    static PutResult failed(Status status) {
        PutResult r;
        r.status = std::move(status);
        return r;
    }

    bool ok() const noexcept { return status.ok(); }
};

// Durable local chunk store
class IChunkStore {
public:
    virtual ~IChunkStore() = default;

    // Miss is reported as NotFound; any other error is a store failure
    virtual ChunkResult get(const Address& address) = 0;

    virtual PutResult put(SharedChunk chunk) = 0;

    virtual bool has(const Address& address) = 0;

    virtual void close() = 0;

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t writes = 0;
        uint64_t duplicate_writes = 0;
        uint64_t bytes_written = 0;
        uint64_t evictions = 0;
        size_t entry_count = 0;
        size_t capacity = 0;
    };

    virtual Stats stats() const = 0;
};

}  // namespace chunkfetch
