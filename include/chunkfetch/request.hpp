#pragma once

#include "types.hpp"
#include <optional>
#include <stop_token>

namespace chunkfetch {

// Per-request context supplied by every caller that may block.
// A request ends when its stop token is triggered or its deadline passes;
// a default-constructed context never ends on its own.
struct RequestContext {
    std::optional<NodeId> requester;   // Who is asking (observability only)
    std::optional<TimePoint> deadline;
    std::stop_token stop;

    static RequestContext background() { return {}; }

    static RequestContext with_timeout(Duration timeout) {
        RequestContext ctx;
        ctx.deadline = Clock::now() + timeout;
        return ctx;
    }

    static RequestContext with_deadline(TimePoint deadline) {
        RequestContext ctx;
        ctx.deadline = deadline;
        return ctx;
    }

    RequestContext& from(NodeId peer) {
        requester = peer;
        return *this;
    }

    RequestContext& cancel_on(std::stop_token token) {
        stop = std::move(token);
        return *this;
    }

    bool cancelled() const noexcept { return stop.stop_requested(); }

    bool expired() const noexcept {
        return deadline && Clock::now() >= *deadline;
    }

    bool done() const noexcept { return cancelled() || expired(); }

    // The error a waiter reports once this context has ended
    Status termination_status() const {
        if (cancelled()) {
            return Status::error(ErrorCode::Cancelled, "request cancelled");
        }
        return Status::error(ErrorCode::Timeout, "request deadline exceeded");
    }
};

}  // namespace chunkfetch
