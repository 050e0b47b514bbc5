#include "orchestrator.hpp"
#include "tool_channel.hpp"
#include <iostream>

namespace todochat {

std::string response_for(const RunOutcome& outcome) {
    if (outcome.finished()) {
        if (outcome.answer.empty()) return "I'm sorry, I couldn't process your request.";
        return outcome.answer;
    }
    switch (outcome.reason) {
    case AbortReason::iteration_limit:
        return "I couldn't finish that request within the allowed number of steps. "
               "Please try rephrasing it or splitting it into smaller requests.";
    case AbortReason::unauthorized:
        return "Your session has expired. Please log in again.";
    case AbortReason::deadline:
        return "Sorry, that request took too long to complete. Please try again.";
    default:
        return "Sorry, something went wrong while processing your request. Please try again.";
    }
}

Orchestrator::Orchestrator(const Config& cfg, Model& model)
    : agent_(cfg.agent), tool_process_(cfg.tool_process), model_(model) {}

ChatReply Orchestrator::handle(const Credential& credential,
                               const std::vector<Message>& history,
                               const std::string& message,
                               std::function<bool()> cancelled) const {
    if (credential.empty()) {
        throw BoundaryError(401, "Missing credential");
    }

    auto control = RunControl::with_timeout(std::chrono::seconds(agent_.request_deadline_seconds),
                                            std::move(cancelled));
    ChatReply reply;

    // Scoped owner: the destructor closes on every path out of this block
    ToolChannel channel(tool_process_);
    try {
        channel.open(credential, control);
    } catch (const ChannelError& e) {
        reply.tool_pid = channel.pid();
        channel.close(true);
        if (e.kind() == ChannelErrorKind::spawn_failed) {
            throw BoundaryError(503, "Tool process unavailable");
        }
        reply.outcome.state = RunState::aborted;
        reply.outcome.channel_error = e.kind();
        if (e.kind() == ChannelErrorKind::cancelled) {
            reply.outcome.reason = control.cancel_requested() ? AbortReason::cancelled : AbortReason::deadline;
        } else {
            reply.outcome.reason = AbortReason::channel_failure;
        }
        reply.tool_exit_status = channel.exit_status();
        reply.response = response_for(reply.outcome);
        return reply;
    }
    reply.tool_pid = channel.pid();

    ReasoningLoop loop(model_, channel, agent_.max_tool_calls);
    reply.outcome = loop.run(history, message, control);

    // An aborted run gets no grace period
    channel.close(!reply.outcome.finished());
    reply.tool_exit_status = channel.exit_status();

    std::cerr << "[orchestrator] Run " << (reply.outcome.finished() ? "finished" : "aborted")
              << " with " << reply.outcome.tool_calls << " tool call(s) (pid " << reply.tool_pid << ")\n";
    reply.response = response_for(reply.outcome);
    return reply;
}

} // namespace todochat
