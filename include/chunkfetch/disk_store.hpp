#pragma once

#include "chunk_store.hpp"
#include "config.hpp"
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

namespace chunkfetch {

// File-per-chunk store.
//
// Layout: <path>/chunks/<first two hex digits>/<address hex>. Files are written
// under a temporary name and renamed into place, so a visible chunk file is
// always complete. With sync_writes enabled a background flusher fsyncs new
// files in batches; the durability wait returned by put() resolves once the
// chunk's batch has been flushed.
class DiskChunkStore : public IChunkStore {
public:
    explicit DiskChunkStore(const DiskStoreConfig& config);
    ~DiskChunkStore() override;

    DiskChunkStore(const DiskChunkStore&) = delete;
    DiskChunkStore& operator=(const DiskChunkStore&) = delete;

    // Create the directory layout and index chunks already on disk
    Status open();

    ChunkResult get(const Address& address) override;
    PutResult put(SharedChunk chunk) override;
    bool has(const Address& address) override;
    void close() override;

    Stats stats() const override;

    const std::filesystem::path& root() const noexcept { return config_.path; }
    std::filesystem::path chunk_path(const Address& address) const;

private:
    // Outcome of fsyncing one written file; guarded by FlushState::mutex
    struct FlushResult {
        bool done = false;
        Status status;
    };

    struct PendingFile {
        std::filesystem::path path;
        std::shared_ptr<FlushResult> result;
    };

    // Shared with outstanding durability waits so they stay valid after close
    struct FlushState {
        std::mutex mutex;
        std::condition_variable_any work_cv;
        std::condition_variable_any done_cv;
        std::vector<PendingFile> pending;
        bool stopped = false;
    };

    Status write_file(const std::filesystem::path& path, ByteView data);
    ChunkResult read_file(const Address& address, const std::filesystem::path& path);
    Status ensure_directory(const std::filesystem::path& path);
    Status load_index();

    std::shared_ptr<FlushResult> enqueue_flush(const std::filesystem::path& path);
    void flush_loop(std::stop_token stop);
    void flush_batch(std::vector<PendingFile> batch);

    static Status wait_flushed(const std::shared_ptr<FlushState>& state,
                               const std::shared_ptr<FlushResult>& result,
                               const RequestContext& ctx);

    DiskStoreConfig config_;
    std::atomic<bool> opened_{false};
    std::atomic<bool> closed_{false};

    // Addresses with a complete file on disk
    mutable std::mutex index_mutex_;
    std::unordered_set<Address> index_;

    std::shared_ptr<FlushState> flush_;
    std::jthread flusher_;

    // Statistics
    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> duplicate_writes_{0};
    std::atomic<uint64_t> bytes_written_{0};
};

}  // namespace chunkfetch
