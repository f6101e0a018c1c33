#pragma once

#include "types.hpp"
#include "request.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <unordered_map>
#include <vector>

namespace chunkfetch {

// Peers currently waiting on one address.
// Counted per identity: two requests from the same peer keep it listed until
// both have finished.
class RequesterSet {
public:
    void add(const NodeId& peer);
    void remove(const NodeId& peer);

    bool contains(const NodeId& peer) const;
    size_t size() const;
    bool empty() const { return size() == 0; }
    std::vector<NodeId> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<NodeId, size_t> counts_;
};

// Nudges network retrieval on behalf of one request. Fire-and-forget: the
// chunk itself arrives later through a store write.
using FetchTrigger = std::function<void(const RequestContext& ctx)>;

// Builds the trigger for one address. The lifetime token is stopped when the
// last waiter for the address goes away.
using FetchFactory = std::function<FetchTrigger(
    std::stop_token lifetime,
    const Address& address,
    std::shared_ptr<const RequesterSet> requesters)>;

}  // namespace chunkfetch
