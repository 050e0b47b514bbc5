#pragma once
#include "protocol.hpp"
#include <chrono>
#include <functional>

namespace todochat {

// Bounds shared by every blocking step of one orchestration run
struct RunControl {
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
    std::function<bool()> cancelled;

    bool expired() const { return std::chrono::steady_clock::now() >= deadline; }
    bool cancel_requested() const { return cancelled && cancelled(); }

    static RunControl with_timeout(std::chrono::milliseconds timeout, std::function<bool()> cancelled = {}) {
        RunControl rc;
        rc.deadline = std::chrono::steady_clock::now() + timeout;
        rc.cancelled = std::move(cancelled);
        return rc;
    }
};

// Executes one tool call. Tool-level failures come back inside the result;
// transport failures are thrown.
class ToolInvoker {
public:
    virtual ~ToolInvoker() = default;
    virtual ToolCallResult call(const ToolCallRequest& req, const RunControl& control) = 0;
};

} // namespace todochat
