#include "chunkfetch/fetch_session.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace chunkfetch {

namespace {

// Releases a session registration when the waiter leaves await()
class ReleaseGuard {
public:
    explicit ReleaseGuard(FetchSession& session) : session_(session) {}
    ~ReleaseGuard() { session_.release(); }

    ReleaseGuard(const ReleaseGuard&) = delete;
    ReleaseGuard& operator=(const ReleaseGuard&) = delete;

private:
    FetchSession& session_;
};

// Lists the requesting peer for the duration of a wait
class RequesterGuard {
public:
    RequesterGuard(RequesterSet& set, const std::optional<NodeId>& peer)
        : set_(set), peer_(peer)
    {
        if (peer_) set_.add(*peer_);
    }
    ~RequesterGuard() {
        if (peer_) set_.remove(*peer_);
    }

    RequesterGuard(const RequesterGuard&) = delete;
    RequesterGuard& operator=(const RequesterGuard&) = delete;

private:
    RequesterSet& set_;
    std::optional<NodeId> peer_;
};

}  // namespace

// DeliverySignal implementation

bool DeliverySignal::fire(SharedChunk chunk) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (chunk_) {
            return false;
        }
        chunk_ = std::move(chunk);
        fired_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    return true;
}

SharedChunk DeliverySignal::wait(const RequestContext& ctx) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this] { return chunk_ != nullptr; };

    if (ctx.deadline) {
        cv_.wait_until(lock, ctx.stop, *ctx.deadline, ready);
    } else {
        cv_.wait(lock, ctx.stop, ready);
    }
    return chunk_;
}

SharedChunk DeliverySignal::value() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunk_;
}

// FetchSession implementation

FetchSession::FetchSession(const Address& address,
                           const FetchFactory& factory,
                           TeardownFn on_teardown)
    : address_(address)
    , requesters_(std::make_shared<RequesterSet>())
    , on_teardown_(std::move(on_teardown))
{
    if (factory) {
        trigger_ = factory(lifetime_.get_token(), address_, requesters_);
    }
}

FetchSession::~FetchSession() {
    // A session dropped without a teardown still stops its retrieval
    lifetime_.request_stop();
}

bool FetchSession::acquire() {
    int n = requests_.load();
    do {
        if (n == kClosed) {
            return false;
        }
    } while (!requests_.compare_exchange_weak(n, n + 1));
    return true;
}

bool FetchSession::release() {
    int n = requests_.load();
    int next;
    do {
        if (n <= 0) {
            throw std::logic_error("release without acquire on fetch session " + address_.to_hex());
        }
        next = (n == 1) ? kClosed : n - 1;
    } while (!requests_.compare_exchange_weak(n, next));

    if (next != kClosed) {
        return false;
    }

    spdlog::debug("fetch session {} torn down ({})",
                  address_.to_hex(), delivered() ? "delivered" : "abandoned");
    lifetime_.request_stop();
    if (on_teardown_) {
        on_teardown_(*this);
    }
    return true;
}

ChunkResult FetchSession::await(const RequestContext& ctx) {
    if (active_requests() == 0) {
        throw std::logic_error("await without acquire on fetch session " + address_.to_hex());
    }
    ReleaseGuard release(*this);
    RequesterGuard requester(*requesters_, ctx.requester);

    if (trigger_ && !delivered()) {
        trigger_(ctx);
    }

    auto chunk = signal_.wait(ctx);
    if (chunk) {
        return ChunkResult::found(std::move(chunk));
    }
    return ChunkResult::failed(ctx.termination_status());
}

void FetchSession::deliver(SharedChunk chunk) {
    if (!chunk) {
        throw std::invalid_argument("null chunk delivered to fetch session " + address_.to_hex());
    }
    if (!signal_.fire(std::move(chunk))) {
        throw std::logic_error("chunk delivered twice to fetch session " + address_.to_hex());
    }
    spdlog::debug("fetch session {} delivered to {} waiter(s)",
                  address_.to_hex(), active_requests());
}

int FetchSession::active_requests() const noexcept {
    int n = requests_.load();
    return n == kClosed ? 0 : n;
}

FetchSession::State FetchSession::state() const noexcept {
    if (delivered()) {
        return State::Delivered;
    }
    if (torn_down()) {
        return State::Abandoned;
    }
    return State::Awaiting;
}

const char* session_state_string(FetchSession::State state) {
    switch (state) {
        case FetchSession::State::Awaiting: return "awaiting";
        case FetchSession::State::Delivered: return "delivered";
        case FetchSession::State::Abandoned: return "abandoned";
        default: return "unknown";
    }
}

}  // namespace chunkfetch
