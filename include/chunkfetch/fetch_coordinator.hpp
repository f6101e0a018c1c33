#pragma once

#include "types.hpp"
#include "chunk.hpp"
#include "chunk_store.hpp"
#include "config.hpp"
#include "fetch_session.hpp"
#include "remote_fetch.hpp"
#include "request.hpp"
#include "session_table.hpp"
#include <atomic>
#include <memory>
#include <mutex>

namespace chunkfetch {

// Result of FetchCoordinator::write
struct WriteResult {
    Status status;
    DurabilityWait wait;  // Empty when the chunk was already stored

    bool ok() const noexcept { return status.ok(); }
};

// Outcome of a probe: either the answer is already known (chunk available
// locally, or the store failed) or the caller may block on a fetch session.
//
// Move-only. A pending handle holds a registration on its session; dropping
// it without calling wait() gives that registration back.
class FetchHandle {
public:
    FetchHandle() = default;
    ~FetchHandle();

    FetchHandle(FetchHandle&& other) noexcept;
    FetchHandle& operator=(FetchHandle&& other) noexcept;
    FetchHandle(const FetchHandle&) = delete;
    FetchHandle& operator=(const FetchHandle&) = delete;

    static FetchHandle ready(SharedChunk chunk);
    static FetchHandle failed(Status status);
    static FetchHandle attached(SharedSession session);

    // True if wait() would block on a fetch session
    bool pending() const noexcept { return session_ != nullptr; }
    explicit operator bool() const noexcept { return pending(); }

    // Chunk already available without waiting, if any
    const SharedChunk& chunk() const noexcept { return result_.chunk; }

    // Block until the chunk arrives or ctx ends. Single use for pending
    // handles; later calls return the stored outcome.
    ChunkResult wait(const RequestContext& ctx);

private:
    void reset() noexcept;

    ChunkResult result_;
    SharedSession session_;
};

// Ties the local store, the in-flight session table and remote retrieval
// together.
//
// The store lookup plus session find-or-create in probe()/read() and the store
// write plus session delivery in write() run under one lock, so a chunk can
// never be written between "not found locally" and "session registered" and
// be missed by the waiters.
class FetchCoordinator {
public:
    FetchCoordinator(std::unique_ptr<IChunkStore> store,
                     FetchFactory fetch_factory,
                     const SessionTableConfig& config = {});
    ~FetchCoordinator();

    FetchCoordinator(const FetchCoordinator&) = delete;
    FetchCoordinator& operator=(const FetchCoordinator&) = delete;

    // Store a chunk and resolve any session waiting for it
    WriteResult write(SharedChunk chunk);

    // Return the chunk, blocking on a fetch session if it is not local yet
    ChunkResult read(const RequestContext& ctx, const Address& address);

    // Same lookup as read() without committing to wait
    FetchHandle probe(const Address& address);

    // Close the store. Outstanding waiters are governed by their own contexts.
    void shutdown();

    struct Stats {
        uint64_t local_hits = 0;
        uint64_t misses = 0;
        uint64_t store_errors = 0;
        uint64_t sessions_created = 0;
        uint64_t sessions_torn_down = 0;
        uint64_t deliveries = 0;
        uint64_t writes = 0;
        uint64_t duplicate_writes = 0;
        uint64_t failed_waits = 0;
        uint64_t table_evictions = 0;
        size_t active_sessions = 0;
        size_t peak_sessions = 0;
        size_t table_capacity = 0;
    };

    Stats stats() const;

    size_t session_count() const;
    SharedSession find_session(const Address& address) const;

    IChunkStore& store() { return *store_; }

private:
    // State shared with session teardown callbacks, which may outlive us
    struct Registry {
        explicit Registry(const SessionTableConfig& config) : table(config) {}

        mutable std::mutex mutex;
        SessionTable table;

        std::atomic<uint64_t> sessions_created{0};
        std::atomic<uint64_t> sessions_torn_down{0};
        size_t peak_sessions = 0;
    };

    // Caller must hold registry_->mutex
    SharedSession create_session(const Address& address);

    std::unique_ptr<IChunkStore> store_;
    FetchFactory fetch_factory_;
    std::shared_ptr<Registry> registry_;

    // Statistics
    std::atomic<uint64_t> local_hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> store_errors_{0};
    std::atomic<uint64_t> deliveries_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> duplicate_writes_{0};
    std::atomic<uint64_t> failed_waits_{0};
};

}  // namespace chunkfetch
