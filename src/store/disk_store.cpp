#include "chunkfetch/disk_store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <set>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace chunkfetch {

namespace {

constexpr size_t kMaxFlushBatch = 256;
constexpr std::string_view kTempSuffix = ".tmp";

std::string errno_message(const std::string& what, const std::filesystem::path& path, int err) {
    return what + " " + path.string() + ": " + std::strerror(err);
}

Status fsync_path(const std::filesystem::path& path, int flags) {
    int fd = ::open(path.c_str(), flags | O_CLOEXEC);
    if (fd < 0) {
        return Status::error(ErrorCode::StorageError, errno_message("Failed to open", path, errno));
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return Status::error(ErrorCode::StorageError, errno_message("fsync failed for", path, err));
    }
    ::close(fd);
    return Status::make_ok();
}

}  // namespace

DiskChunkStore::DiskChunkStore(const DiskStoreConfig& config)
    : config_(config)
    , flush_(std::make_shared<FlushState>())
{}

DiskChunkStore::~DiskChunkStore() {
    close();
}

Status DiskChunkStore::open() {
    if (closed_) {
        return Status::error(ErrorCode::StoreClosed, "disk store closed");
    }
    if (opened_) {
        return Status::make_ok();
    }

    auto status = ensure_directory(config_.path / "chunks");
    if (!status) {
        return status;
    }

    // Create subdirectories for chunks (sharding by first 2 hex chars)
    for (int i = 0; i < 256; ++i) {
        char dir[3];
        snprintf(dir, sizeof(dir), "%02x", i);
        status = ensure_directory(config_.path / "chunks" / dir);
        if (!status) {
            return status;
        }
    }

    status = load_index();
    if (!status) {
        return status;
    }

    if (config_.sync_writes) {
        flusher_ = std::jthread([this](std::stop_token stop) { flush_loop(stop); });
    }

    opened_ = true;
    spdlog::info("disk store opened at {} with {} chunks",
                 config_.path.string(), index_.size());
    return Status::make_ok();
}

std::filesystem::path DiskChunkStore::chunk_path(const Address& address) const {
    std::string hex = address.to_hex();
    return config_.path / "chunks" / hex.substr(0, 2) / hex;
}

ChunkResult DiskChunkStore::get(const Address& address) {
    if (!opened_ || closed_) {
        return ChunkResult::failed(Status::error(ErrorCode::StoreClosed, "disk store not open"));
    }

    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        if (!index_.contains(address)) {
            misses_++;
            return ChunkResult::failed(Status::error(ErrorCode::NotFound));
        }
    }

    auto result = read_file(address, chunk_path(address));
    if (result.ok()) {
        hits_++;
    } else if (result.is_not_found()) {
        misses_++;
    }
    return result;
}

PutResult DiskChunkStore::put(SharedChunk chunk) {
    if (!chunk) {
        return PutResult::failed(Status::error(ErrorCode::InvalidArgument, "Null chunk"));
    }
    if (chunk->size() > config_.max_chunk_size) {
        return PutResult::failed(Status::error(ErrorCode::ChunkTooLarge,
            "chunk " + chunk->address().to_hex() + " exceeds maximum size"));
    }
    if (!opened_ || closed_) {
        return PutResult::failed(Status::error(ErrorCode::StoreClosed, "disk store not open"));
    }

    const Address& address = chunk->address();
    auto path = chunk_path(address);

    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        if (index_.contains(address)) {
            duplicate_writes_++;
            return PutResult::present();
        }

        auto status = write_file(path, chunk->data());
        if (!status) {
            return PutResult::failed(std::move(status));
        }
        index_.insert(address);
    }

    writes_++;
    bytes_written_ += chunk->size();

    if (!config_.sync_writes) {
        return PutResult::written([](const RequestContext&) { return Status::make_ok(); });
    }

    auto result = enqueue_flush(path);
    auto state = flush_;
    return PutResult::written([state, result](const RequestContext& ctx) {
        return wait_flushed(state, result, ctx);
    });
}

bool DiskChunkStore::has(const Address& address) {
    if (!opened_ || closed_) return false;
    std::lock_guard<std::mutex> lock(index_mutex_);
    return index_.contains(address);
}

void DiskChunkStore::close() {
    if (closed_.exchange(true)) {
        return;
    }

    if (flusher_.joinable()) {
        // The flusher drains pending files before it exits
        flusher_.request_stop();
        flusher_.join();
    } else {
        std::lock_guard<std::mutex> lock(flush_->mutex);
        flush_->stopped = true;
        flush_->done_cv.notify_all();
    }

    if (opened_) {
        spdlog::info("disk store at {} closed", config_.path.string());
    }
}

IChunkStore::Stats DiskChunkStore::stats() const {
    Stats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.writes = writes_.load();
    s.duplicate_writes = duplicate_writes_.load();
    s.bytes_written = bytes_written_.load();

    std::lock_guard<std::mutex> lock(index_mutex_);
    s.entry_count = index_.size();
    return s;
}

Status DiskChunkStore::write_file(const std::filesystem::path& path, ByteView data) {
    auto tmp = path;
    tmp += kTempSuffix;

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Status::error(ErrorCode::StorageError,
            errno_message("Failed to open for writing", tmp, errno));
    }

    size_t total_written = 0;
    while (total_written < data.size()) {
        ssize_t n = ::write(fd, data.data() + total_written, data.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            return Status::error(ErrorCode::StorageError, errno_message("Write failed for", tmp, err));
        }
        total_written += static_cast<size_t>(n);
    }

    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        return Status::error(ErrorCode::StorageError, errno_message("Close failed for", tmp, err));
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        return Status::error(ErrorCode::StorageError, errno_message("Rename failed for", path, err));
    }

    return Status::make_ok();
}

ChunkResult DiskChunkStore::read_file(const Address& address, const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return ChunkResult::failed(Status::error(ErrorCode::NotFound));
        }
        return ChunkResult::failed(Status::error(ErrorCode::StorageError,
            errno_message("Failed to open", path, errno)));
    }

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        return ChunkResult::failed(Status::error(ErrorCode::StorageError,
            errno_message("fstat failed for", path, err)));
    }

    ByteBuffer buffer(static_cast<size_t>(st.st_size));
    size_t total_read = 0;
    while (total_read < buffer.size()) {
        ssize_t n = ::pread(fd, buffer.data() + total_read, buffer.size() - total_read,
                            static_cast<off_t>(total_read));
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            return ChunkResult::failed(Status::error(ErrorCode::StorageError,
                errno_message("Read failed for", path, err)));
        }
        if (n == 0) {
            break;
        }
        total_read += static_cast<size_t>(n);
    }
    ::close(fd);

    if (total_read != buffer.size()) {
        return ChunkResult::failed(Status::error(ErrorCode::StorageError,
            "Short read for " + path.string()));
    }

    return ChunkResult::found(make_chunk(address, std::move(buffer)));
}

Status DiskChunkStore::ensure_directory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return Status::error(ErrorCode::StorageError,
            "Failed to create directory " + path.string() + ": " + ec.message());
    }
    return Status::make_ok();
}

Status DiskChunkStore::load_index() {
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(config_.path / "chunks", ec);
    if (ec) {
        return Status::error(ErrorCode::StorageError,
            "Failed to scan " + config_.path.string() + ": " + ec.message());
    }

    std::lock_guard<std::mutex> lock(index_mutex_);
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return Status::error(ErrorCode::StorageError,
                "Failed to scan " + config_.path.string() + ": " + ec.message());
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }

        const auto& path = it->path();
        auto name = path.filename().string();
        if (name.ends_with(kTempSuffix)) {
            // Left behind by an interrupted write
            std::filesystem::remove(path, ec);
            continue;
        }

        auto address = Address::parse(name);
        if (!address) {
            spdlog::warn("disk store ignoring unexpected file {}", path.string());
            continue;
        }
        index_.insert(*address);
    }
    return Status::make_ok();
}

std::shared_ptr<DiskChunkStore::FlushResult>
DiskChunkStore::enqueue_flush(const std::filesystem::path& path) {
    auto result = std::make_shared<FlushResult>();
    std::lock_guard<std::mutex> lock(flush_->mutex);
    flush_->pending.push_back({path, result});
    if (flush_->pending.size() >= kMaxFlushBatch) {
        flush_->work_cv.notify_one();
    }
    return result;
}

void DiskChunkStore::flush_loop(std::stop_token stop) {
    auto state = flush_;
    std::unique_lock<std::mutex> lock(state->mutex);

    while (!stop.stop_requested()) {
        state->work_cv.wait_for(lock, stop, config_.flush_interval, [&state] {
            return state->pending.size() >= kMaxFlushBatch;
        });
        if (state->pending.empty()) {
            continue;
        }

        auto batch = std::move(state->pending);
        state->pending.clear();
        lock.unlock();
        flush_batch(std::move(batch));
        lock.lock();
    }

    // Drain what was written before close()
    while (!state->pending.empty()) {
        auto batch = std::move(state->pending);
        state->pending.clear();
        lock.unlock();
        flush_batch(std::move(batch));
        lock.lock();
    }

    state->stopped = true;
    state->done_cv.notify_all();
}

void DiskChunkStore::flush_batch(std::vector<PendingFile> batch) {
    std::vector<Status> statuses(batch.size());
    std::set<std::filesystem::path> directories;

    for (size_t i = 0; i < batch.size(); ++i) {
        statuses[i] = fsync_path(batch[i].path, O_RDONLY);
        if (!statuses[i]) {
            spdlog::error("disk store flush failed: {}", statuses[i].message());
            continue;
        }
        directories.insert(batch[i].path.parent_path());
    }

    // Make the renames themselves durable
    for (const auto& dir : directories) {
        auto status = fsync_path(dir, O_RDONLY | O_DIRECTORY);
        if (!status) {
            spdlog::error("disk store flush failed: {}", status.message());
            for (size_t i = 0; i < batch.size(); ++i) {
                if (statuses[i] && batch[i].path.parent_path() == dir) {
                    statuses[i] = status;
                }
            }
        }
    }

    std::lock_guard<std::mutex> lock(flush_->mutex);
    for (size_t i = 0; i < batch.size(); ++i) {
        batch[i].result->status = std::move(statuses[i]);
        batch[i].result->done = true;
    }
    flush_->done_cv.notify_all();
}

Status DiskChunkStore::wait_flushed(const std::shared_ptr<FlushState>& state,
                                    const std::shared_ptr<FlushResult>& result,
                                    const RequestContext& ctx)
{
    std::unique_lock<std::mutex> lock(state->mutex);
    auto flushed = [&state, &result] {
        return result->done || state->stopped;
    };

    bool done = ctx.deadline
        ? state->done_cv.wait_until(lock, ctx.stop, *ctx.deadline, flushed)
        : state->done_cv.wait(lock, ctx.stop, flushed);
    if (!done) {
        return ctx.termination_status();
    }

    // Every call reports the same outcome for this write
    if (!result->done) {
        return Status::error(ErrorCode::StoreClosed, "disk store closed before chunk was flushed");
    }
    return result->status;
}

}  // namespace chunkfetch
