#include "reasoning_loop.hpp"
#include "prompt.hpp"
#include "tool_spec.hpp"
#include <ctime>
#include <iostream>

namespace todochat {

const char* run_state_name(RunState state) {
    switch (state) {
    case RunState::thinking:     return "thinking";
    case RunState::tool_invoked: return "tool_invoked";
    case RunState::observing:    return "observing";
    case RunState::finished:     return "finished";
    case RunState::aborted:      return "aborted";
    }
    return "aborted";
}

const char* abort_reason_name(AbortReason reason) {
    switch (reason) {
    case AbortReason::none:            return "none";
    case AbortReason::iteration_limit: return "iteration_limit";
    case AbortReason::channel_failure: return "channel_failure";
    case AbortReason::unauthorized:    return "unauthorized";
    case AbortReason::deadline:        return "deadline";
    case AbortReason::cancelled:       return "cancelled";
    case AbortReason::model_failure:   return "model_failure";
    }
    return "none";
}

std::vector<Message> with_turn(const std::vector<Message>& transcript, Message turn) {
    std::vector<Message> next;
    next.reserve(transcript.size() + 1);
    next.insert(next.end(), transcript.begin(), transcript.end());
    next.push_back(std::move(turn));
    return next;
}

ReasoningLoop::ReasoningLoop(Model& model, ToolInvoker& tools, int max_tool_calls)
    : model_(model), tools_(tools), max_tool_calls_(max_tool_calls) {}

void ReasoningLoop::transition(RunState next) {
    state_ = next;
}

RunOutcome ReasoningLoop::abort(RunOutcome outcome, AbortReason reason) {
    transition(RunState::aborted);
    outcome.state = RunState::aborted;
    outcome.reason = reason;
    if (reason == AbortReason::cancelled || reason == AbortReason::deadline) {
        outcome.transcript.clear();
    }
    std::cerr << "[loop] Aborted (" << abort_reason_name(reason) << ") after "
              << outcome.tool_calls << " tool call(s)\n";
    return outcome;
}

static ToolCallResult local_rejection(const std::string& id, ToolError err) {
    std::cerr << "[loop] Rejected tool call locally: " << err.message << "\n";
    return ToolCallResult::failure(id, std::move(err));
}

ToolCallResult ReasoningLoop::invoke(const ToolCall& tc, const std::string& correlation_id,
                                     const RunControl& control) {
    nlohmann::json args;
    try {
        args = tc.arguments.empty() ? nlohmann::json::object() : nlohmann::json::parse(tc.arguments);
    } catch (const nlohmann::json::parse_error&) {
        ToolError err;
        err.kind = ToolErrorKind::invalid_arguments;
        err.message = "Arguments for " + tc.name + " are not valid JSON";
        return local_rejection(correlation_id, std::move(err));
    }

    nlohmann::json normalized;
    if (auto err = validate_tool_call(tc.name, args, &normalized)) {
        return local_rejection(correlation_id, std::move(*err));
    }

    ToolCallRequest req;
    req.id = correlation_id;
    req.name = tc.name;
    req.arguments = std::move(normalized);
    return tools_.call(req, control);
}

RunOutcome ReasoningLoop::run(const std::vector<Message>& history, const std::string& user_message,
                              const RunControl& control) {
    RunOutcome outcome;

    Message sys;
    sys.role = "system";
    sys.content = system_prompt_ ? *system_prompt_ : format_system_prompt(std::time(nullptr));

    std::vector<Message> transcript{sys};
    for (auto& m : history) transcript = with_turn(transcript, m);
    transcript = with_turn(transcript, Message::user(user_message));

    const auto tools_spec = tools_spec_for_model();
    transition(RunState::thinking);

    while (true) {
        outcome.transcript = transcript;
        if (control.cancel_requested()) return abort(std::move(outcome), AbortReason::cancelled);
        if (control.expired()) return abort(std::move(outcome), AbortReason::deadline);

        // ── Thinking ──
        Decision decision;
        try {
            decision = model_.decide(transcript, tools_spec);
        } catch (const std::runtime_error& e) {
            std::cerr << "[loop] Model call failed: " << e.what() << "\n";
            return abort(std::move(outcome), AbortReason::model_failure);
        }

        if (control.cancel_requested()) return abort(std::move(outcome), AbortReason::cancelled);
        if (control.expired()) return abort(std::move(outcome), AbortReason::deadline);

        if (auto* answer = std::get_if<FinalAnswer>(&decision)) {
            transition(RunState::finished);
            outcome.transcript = with_turn(transcript, Message::assistant(answer->text));
            outcome.state = RunState::finished;
            outcome.answer = answer->text;
            return outcome;
        }

        ToolCall tc = std::get<ToolCall>(decision);
        if (outcome.tool_calls >= max_tool_calls_) {
            std::cerr << "[loop] Model asked for " << tc.name << " beyond the limit of "
                      << max_tool_calls_ << " tool calls\n";
            return abort(std::move(outcome), AbortReason::iteration_limit);
        }

        // ── ToolInvoked ──
        transition(RunState::tool_invoked);
        outcome.tool_calls++;
        std::string correlation_id = "call-" + std::to_string(outcome.tool_calls);
        if (tc.id.empty()) tc.id = correlation_id;

        Message assistant;
        assistant.role = "assistant";
        assistant.tool_calls = {tc};
        transcript = with_turn(transcript, std::move(assistant));

        ToolCallResult result;
        try {
            result = invoke(tc, correlation_id, control);
        } catch (const ChannelError& e) {
            outcome.transcript = transcript;
            outcome.channel_error = e.kind();
            if (e.kind() == ChannelErrorKind::cancelled) {
                return abort(std::move(outcome),
                             control.expired() && !control.cancel_requested() ? AbortReason::deadline
                                                                              : AbortReason::cancelled);
            }
            return abort(std::move(outcome), AbortReason::channel_failure);
        }

        // ── Observing ──
        transition(RunState::observing);
        Message observation;
        observation.role = "tool";
        observation.tool_call_id = tc.id;
        observation.content = result.observation();
        transcript = with_turn(transcript, std::move(observation));

        if (!result.ok() && result.error->kind == ToolErrorKind::unauthorized) {
            outcome.transcript = transcript;
            return abort(std::move(outcome), AbortReason::unauthorized);
        }

        transition(RunState::thinking);
    }
}

} // namespace todochat
