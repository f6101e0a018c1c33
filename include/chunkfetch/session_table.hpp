#pragma once

#include "types.hpp"
#include "config.hpp"
#include "fetch_session.hpp"
#include "lru_cache.hpp"
#include <vector>

namespace chunkfetch {

// Bounded address -> FetchSession map.
//
// Least recently used sessions are evicted once capacity is reached, except
// sessions that still have waiters: those are pinned, and the table grows
// past capacity rather than strand them. Not synchronised; FetchCoordinator
// is the only owner and mutates it under its lock.
class SessionTable {
public:
    explicit SessionTable(const SessionTableConfig& config = {});

    // Lookup and mark as recently used
    SharedSession get(const Address& address);

    // Insert; returns sessions evicted to make room
    std::vector<SharedSession> put(const Address& address, SharedSession session);

    bool remove(const Address& address);

    // Remove only if the entry is still this very session
    bool remove_if_same(const Address& address, const FetchSession* session);

    // Remove and return the entry
    SharedSession take(const Address& address);

    // Lookup without touching recency
    SharedSession peek(const Address& address) const;

    bool contains(const Address& address) const { return cache_.contains(address); }
    size_t size() const noexcept { return cache_.size(); }
    size_t capacity() const noexcept { return cache_.capacity(); }
    uint64_t evictions() const { return cache_.stats().evictions; }

    // Over-capacity warnings logged so far
    uint64_t overflow_warnings() const noexcept { return overflow_warnings_; }

private:
    // Size the table must fall to before another overflow is reported
    size_t rearm_size() const noexcept { return cache_.capacity() - cache_.capacity() / 4; }

    LRUCache<Address, SharedSession> cache_;
    bool overflowing_ = false;
    uint64_t overflow_warnings_ = 0;
};

}  // namespace chunkfetch
