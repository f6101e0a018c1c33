#pragma once

#include "types.hpp"
#include "chunk.hpp"
#include "request.hpp"
#include "remote_fetch.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>

namespace chunkfetch {

// One-shot broadcast of a delivered chunk.
// Fires at most once; any number of waiters, including ones that arrive after
// the fact, observe the same chunk.
class DeliverySignal {
public:
    // Returns false if the signal had already fired
    bool fire(SharedChunk chunk);

    // Blocks until fired or the context ends. Returns nullptr on the latter.
    SharedChunk wait(const RequestContext& ctx);

    bool fired() const noexcept { return fired_.load(std::memory_order_acquire); }

    // Delivered chunk, or nullptr before fire()
    SharedChunk value() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    SharedChunk chunk_;
    std::atomic<bool> fired_{false};
};

// Tracks an in-flight remote retrieval for one address and the requests
// waiting on it.
//
// Lifecycle: Awaiting -> Delivered | Abandoned. Each waiter is registered with
// acquire() and consumes that registration with await() or release(). The
// release that drops the count to zero closes the session for good: it can
// never be acquired again, its retrieval lifetime is stopped, and the
// teardown callback runs exactly once.
class FetchSession {
public:
    using TeardownFn = std::function<void(FetchSession& session)>;

    enum class State {
        Awaiting,
        Delivered,
        Abandoned,
    };

    FetchSession(const Address& address,
                 const FetchFactory& factory,
                 TeardownFn on_teardown);
    ~FetchSession();

    FetchSession(const FetchSession&) = delete;
    FetchSession& operator=(const FetchSession&) = delete;

    const Address& address() const noexcept { return address_; }

    // Register one more waiter. False once the session has been torn down.
    bool acquire();

    // Drop one registration. Returns true for the call that tore the session
    // down.
    bool release();

    // Wait for the chunk on behalf of a caller registered with acquire().
    // The registration is released on every exit path.
    ChunkResult await(const RequestContext& ctx);

    // Hand the chunk to every current and future waiter.
    // Throws std::logic_error if the session was already delivered.
    void deliver(SharedChunk chunk);

    bool delivered() const noexcept { return signal_.fired(); }
    bool torn_down() const noexcept { return requests_.load() == kClosed; }
    int active_requests() const noexcept;
    State state() const noexcept;

    const RequesterSet& requesters() const noexcept { return *requesters_; }
    std::stop_token lifetime() const noexcept { return lifetime_.get_token(); }

private:
    static constexpr int kClosed = -1;

    Address address_;
    std::stop_source lifetime_;
    std::shared_ptr<RequesterSet> requesters_;
    FetchTrigger trigger_;
    TeardownFn on_teardown_;
    DeliverySignal signal_;

    // Active waiter count, or kClosed after teardown
    std::atomic<int> requests_{0};
};

using SharedSession = std::shared_ptr<FetchSession>;

const char* session_state_string(FetchSession::State state);

}  // namespace chunkfetch
