#include "chunkfetch/session_table.hpp"
#include <spdlog/spdlog.h>

namespace chunkfetch {

namespace {

bool evictable(const Address&, const SharedSession& session) {
    return !session || session->active_requests() == 0;
}

}  // namespace

SessionTable::SessionTable(const SessionTableConfig& config)
    : cache_(config.capacity, evictable)
{}

SharedSession SessionTable::get(const Address& address) {
    auto* session = cache_.get(address);
    return session ? *session : nullptr;
}

std::vector<SharedSession> SessionTable::put(const Address& address, SharedSession session) {
    // Re-arm the overflow warning only once the table has clearly drained
    if (overflowing_ && cache_.size() <= rearm_size()) {
        overflowing_ = false;
    }

    auto evicted = cache_.put(address, std::move(session));

    std::vector<SharedSession> sessions;
    sessions.reserve(evicted.size());
    for (auto& [key, value] : evicted) {
        spdlog::debug("session table evicted idle session {}", key.to_hex());
        sessions.push_back(std::move(value));
    }

    if (cache_.over_capacity() && !overflowing_) {
        spdlog::warn("session table over capacity ({} > {}): all sessions have waiters",
                     cache_.size(), cache_.capacity());
        overflowing_ = true;
        overflow_warnings_++;
    }
    return sessions;
}

bool SessionTable::remove(const Address& address) {
    return cache_.remove(address);
}

bool SessionTable::remove_if_same(const Address& address, const FetchSession* session) {
    return cache_.remove_if(address, [session](const SharedSession& entry) {
        return entry.get() == session;
    });
}

SharedSession SessionTable::peek(const Address& address) const {
    const SharedSession* entry = cache_.peek(address);
    return entry ? *entry : nullptr;
}

SharedSession SessionTable::take(const Address& address) {
    SharedSession session = peek(address);
    if (session) {
        remove(address);
    }
    return session;
}

}  // namespace chunkfetch
