#pragma once
#include "message.hpp"
#include "provider.hpp"
#include "tool_channel.hpp"
#include "tool_invoker.hpp"
#include <optional>
#include <string>
#include <vector>

namespace todochat {

enum class RunState { thinking, tool_invoked, observing, finished, aborted };

enum class AbortReason {
    none,
    iteration_limit,
    channel_failure,
    unauthorized,
    deadline,
    cancelled,
    model_failure
};

const char* run_state_name(RunState state);
const char* abort_reason_name(AbortReason reason);

struct RunOutcome {
    RunState state = RunState::thinking;
    AbortReason reason = AbortReason::none;
    std::string answer;                 // set when finished
    int tool_calls = 0;
    std::vector<Message> transcript;    // final transcript, empty when cancelled
    std::optional<ChannelErrorKind> channel_error;

    bool finished() const { return state == RunState::finished; }
};

// New transcript holding `transcript` followed by `turn`
std::vector<Message> with_turn(const std::vector<Message>& transcript, Message turn);

// Drives Thinking -> {ToolInvoked -> Observing -> Thinking}* -> Finished | Aborted
// for one orchestration run. Single use per run; not thread-safe.
class ReasoningLoop {
public:
    ReasoningLoop(Model& model, ToolInvoker& tools, int max_tool_calls = 8);

    // System prompt for the run; defaults to format_system_prompt(now)
    void set_system_prompt(std::string prompt) { system_prompt_ = std::move(prompt); }

    RunOutcome run(const std::vector<Message>& history, const std::string& user_message,
                   const RunControl& control);

    RunState state() const { return state_; }

private:
    Model& model_;
    ToolInvoker& tools_;
    int max_tool_calls_;
    std::optional<std::string> system_prompt_;
    RunState state_ = RunState::thinking;

    void transition(RunState next);
    RunOutcome abort(RunOutcome outcome, AbortReason reason);
    ToolCallResult invoke(const ToolCall& tc, const std::string& correlation_id, const RunControl& control);
};

} // namespace todochat
