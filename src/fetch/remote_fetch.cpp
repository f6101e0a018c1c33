#include "chunkfetch/remote_fetch.hpp"

namespace chunkfetch {

void RequesterSet::add(const NodeId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_[peer]++;
}

void RequesterSet::remove(const NodeId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(peer);
    if (it == counts_.end()) {
        return;
    }
    if (--it->second == 0) {
        counts_.erase(it);
    }
}

bool RequesterSet::contains(const NodeId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_.find(peer) != counts_.end();
}

size_t RequesterSet::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_.size();
}

std::vector<NodeId> RequesterSet::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<NodeId> peers;
    peers.reserve(counts_.size());
    for (const auto& [peer, _] : counts_) {
        peers.push_back(peer);
    }
    return peers;
}

}  // namespace chunkfetch
