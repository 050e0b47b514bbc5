#pragma once
#include "config.hpp"
#include "credential.hpp"
#include "message.hpp"
#include "provider.hpp"
#include "reasoning_loop.hpp"
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/types.h>

namespace todochat {

// Infrastructure failure the chat boundary reports as an HTTP status
// instead of an answer (no credential, tool process cannot start).
class BoundaryError : public std::runtime_error {
public:
    BoundaryError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}
    int status() const { return status_; }

private:
    int status_;
};

struct ChatReply {
    std::string response;
    RunOutcome outcome;
    pid_t tool_pid = -1;        // process that served this run
    std::optional<int> tool_exit_status;
};

// User-facing text for a finished or aborted run. Never carries diagnostics.
std::string response_for(const RunOutcome& outcome);

// One chat request end to end: spawn a dedicated tool process for the
// caller's credential, run the reasoning loop, always tear the process down.
// Holds no per-run state, so one instance serves concurrent requests.
class Orchestrator {
public:
    Orchestrator(const Config& cfg, Model& model);

    ChatReply handle(const Credential& credential,
                     const std::vector<Message>& history,
                     const std::string& message,
                     std::function<bool()> cancelled = {}) const;

private:
    AgentConfig agent_;
    ToolProcessConfig tool_process_;
    Model& model_;
};

} // namespace todochat
