#include "chunkfetch/fetch_coordinator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace chunkfetch {

// FetchHandle implementation

FetchHandle::~FetchHandle() {
    reset();
}

FetchHandle::FetchHandle(FetchHandle&& other) noexcept
    : result_(std::move(other.result_))
    , session_(std::move(other.session_))
{}

FetchHandle& FetchHandle::operator=(FetchHandle&& other) noexcept {
    if (this != &other) {
        reset();
        result_ = std::move(other.result_);
        session_ = std::move(other.session_);
    }
    return *this;
}

FetchHandle FetchHandle::ready(SharedChunk chunk) {
    FetchHandle handle;
    handle.result_ = ChunkResult::found(std::move(chunk));
    return handle;
}

FetchHandle FetchHandle::failed(Status status) {
    FetchHandle handle;
    handle.result_ = ChunkResult::failed(std::move(status));
    return handle;
}

FetchHandle FetchHandle::attached(SharedSession session) {
    FetchHandle handle;
    handle.session_ = std::move(session);
    return handle;
}

ChunkResult FetchHandle::wait(const RequestContext& ctx) {
    if (session_) {
        auto session = std::move(session_);
        result_ = session->await(ctx);
    }
    return result_;
}

void FetchHandle::reset() noexcept {
    if (session_) {
        auto session = std::move(session_);
        session->release();
    }
}

// FetchCoordinator implementation

FetchCoordinator::FetchCoordinator(std::unique_ptr<IChunkStore> store,
                                   FetchFactory fetch_factory,
                                   const SessionTableConfig& config)
    : store_(std::move(store))
    , fetch_factory_(std::move(fetch_factory))
    , registry_(std::make_shared<Registry>(config))
{}

FetchCoordinator::~FetchCoordinator() = default;

WriteResult FetchCoordinator::write(SharedChunk chunk) {
    if (!chunk) {
        return {Status::error(ErrorCode::InvalidArgument, "Null chunk"), {}};
    }

    std::lock_guard<std::mutex> lock(registry_->mutex);

    auto put = store_->put(chunk);
    if (!put.ok()) {
        store_errors_++;
        return {std::move(put.status), {}};
    }

    // Detach the session before delivering so no later write can reach it
    if (auto session = registry_->table.take(chunk->address())) {
        session->deliver(chunk);
        deliveries_++;
    }

    if (put.already_present) {
        duplicate_writes_++;
        return {Status::make_ok(), {}};
    }

    writes_++;
    return {Status::make_ok(), std::move(put.wait)};
}

ChunkResult FetchCoordinator::read(const RequestContext& ctx, const Address& address) {
    auto handle = probe(address);
    bool waited = handle.pending();
    auto result = handle.wait(ctx);
    // Lookup failures are already counted as store errors
    if (waited && !result.ok()) {
        failed_waits_++;
    }
    return result;
}

FetchHandle FetchCoordinator::probe(const Address& address) {
    std::lock_guard<std::mutex> lock(registry_->mutex);

    auto local = store_->get(address);
    if (local.ok()) {
        local_hits_++;
        return FetchHandle::ready(std::move(local.chunk));
    }
    if (!local.is_not_found()) {
        store_errors_++;
        return FetchHandle::failed(std::move(local.status));
    }

    misses_++;

    // A session already torn down refuses acquire(); replace it
    auto session = registry_->table.get(address);
    if (!session || !session->acquire()) {
        session = create_session(address);
    }
    return FetchHandle::attached(std::move(session));
}

void FetchCoordinator::shutdown() {
    spdlog::info("fetch coordinator shutting down with {} active session(s)", session_count());
    store_->close();
}

FetchCoordinator::Stats FetchCoordinator::stats() const {
    Stats s;
    s.local_hits = local_hits_.load();
    s.misses = misses_.load();
    s.store_errors = store_errors_.load();
    s.sessions_created = registry_->sessions_created.load();
    s.sessions_torn_down = registry_->sessions_torn_down.load();
    s.deliveries = deliveries_.load();
    s.writes = writes_.load();
    s.duplicate_writes = duplicate_writes_.load();
    s.failed_waits = failed_waits_.load();

    std::lock_guard<std::mutex> lock(registry_->mutex);
    s.table_evictions = registry_->table.evictions();
    s.active_sessions = registry_->table.size();
    s.peak_sessions = registry_->peak_sessions;
    s.table_capacity = registry_->table.capacity();
    return s;
}

size_t FetchCoordinator::session_count() const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->table.size();
}

SharedSession FetchCoordinator::find_session(const Address& address) const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->table.peek(address);
}

SharedSession FetchCoordinator::create_session(const Address& address) {
    std::weak_ptr<Registry> weak_registry = registry_;
    auto teardown = [weak_registry](FetchSession& session) {
        auto registry = weak_registry.lock();
        if (!registry) {
            return;
        }
        std::lock_guard<std::mutex> lock(registry->mutex);
        registry->table.remove_if_same(session.address(), &session);
        registry->sessions_torn_down++;
    };

    auto session = std::make_shared<FetchSession>(address, fetch_factory_, std::move(teardown));
    // Registered for the caller before anyone else can see it
    session->acquire();

    // Evicted sessions are idle; dropping them stops their retrieval
    registry_->table.put(address, session);
    registry_->sessions_created++;
    registry_->peak_sessions = std::max(registry_->peak_sessions, registry_->table.size());

    spdlog::debug("fetch session {} created ({} in flight)",
                  address.to_hex(), registry_->table.size());
    return session;
}

}  // namespace chunkfetch
