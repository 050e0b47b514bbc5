#include <gtest/gtest.h>
#include "reasoning_loop.hpp"
#include "support/scripted_model.hpp"
#include <functional>
#include <thread>

using namespace todochat;
using todochat::testing::ScriptedModel;
using todochat::testing::last_observation;

// Records requests and answers them through a handler
class FakeInvoker : public ToolInvoker {
public:
    std::vector<ToolCallRequest> requests;
    std::function<ToolCallResult(const ToolCallRequest&)> handler;

    ToolCallResult call(const ToolCallRequest& req, const RunControl&) override {
        requests.push_back(req);
        if (handler) return handler(req);
        return ToolCallResult::success(req.id, {{"ok", true}});
    }
};

class ReasoningLoopTest : public ::testing::Test {
protected:
    ScriptedModel model;
    FakeInvoker tools;
    ReasoningLoop loop{model, tools, 8};

    void SetUp() override {
        loop.set_system_prompt("You are a todo assistant.");
    }

    RunOutcome run(const std::string& message, const std::vector<Message>& history = {}) {
        return loop.run(history, message, RunControl::with_timeout(std::chrono::seconds(10)));
    }

    static ToolCallResult failure(const std::string& id, ToolErrorKind kind, const std::string& message) {
        ToolError err;
        err.kind = kind;
        err.message = message;
        return ToolCallResult::failure(id, err);
    }
};

TEST_F(ReasoningLoopTest, DirectAnswerNeedsNoTools) {
    model.then_answer("Hello! How can I help with your todos?");
    auto outcome = run("hi");
    EXPECT_TRUE(outcome.finished());
    EXPECT_EQ(outcome.answer, "Hello! How can I help with your todos?");
    EXPECT_EQ(outcome.tool_calls, 0);
    EXPECT_TRUE(tools.requests.empty());
    EXPECT_EQ(loop.state(), RunState::finished);
}

TEST_F(ReasoningLoopTest, TranscriptStartsWithSystemThenHistory) {
    model.then_answer("ok");
    std::vector<Message> history = {Message::user("earlier"), Message::assistant("reply")};
    run("now", history);

    auto seen = model.transcript_at(0);
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[0].role, "system");
    EXPECT_EQ(seen[0].content, "You are a todo assistant.");
    EXPECT_EQ(seen[1].content, "earlier");
    EXPECT_EQ(seen[2].role, "assistant");
    EXPECT_EQ(seen[3].role, "user");
    EXPECT_EQ(seen[3].content, "now");
    EXPECT_EQ(model.last_tools_spec().size(), 6u);
}

TEST_F(ReasoningLoopTest, CreateTodoScenario) {
    tools.handler = [](const ToolCallRequest& req) {
        return ToolCallResult::success(req.id, {{"id", 1}, {"name", req.arguments["name"]},
                                               {"due_date", req.arguments["due_date"]}});
    };
    model.then_call("create_todo", {{"name", "Buy milk"}, {"due_date", "2026-10-20"}});
    model.then([](const std::vector<Message>& t) -> Decision {
        auto obs = last_observation(t);
        return FinalAnswer{"Created '" + obs["name"].get<std::string>() + "' due " +
                           obs["due_date"].get<std::string>()};
    });

    auto outcome = run("Add a todo to buy milk tomorrow");
    ASSERT_TRUE(outcome.finished());
    EXPECT_EQ(outcome.answer, "Created 'Buy milk' due 2026-10-20T10:00:00");
    ASSERT_EQ(tools.requests.size(), 1u);
    EXPECT_EQ(tools.requests[0].id, "call-1");
    EXPECT_EQ(tools.requests[0].arguments["due_date"], "2026-10-20T10:00:00");

    // system, user, assistant tool call, observation, final answer
    ASSERT_EQ(outcome.transcript.size(), 5u);
    EXPECT_EQ(outcome.transcript[2].tool_calls.size(), 1u);
    EXPECT_EQ(outcome.transcript[3].role, "tool");
    EXPECT_EQ(outcome.transcript[3].tool_call_id, outcome.transcript[2].tool_calls[0].id);
}

TEST_F(ReasoningLoopTest, ModelCallIdIsKeptForTranscript) {
    model.then_call("list_todos", nlohmann::json::object(), "model-id-7");
    model.then_answer("done");
    auto outcome = run("list");
    ASSERT_TRUE(outcome.finished());
    EXPECT_EQ(tools.requests[0].id, "call-1");
    EXPECT_EQ(outcome.transcript[2].tool_calls[0].id, "model-id-7");
    EXPECT_EQ(outcome.transcript[3].tool_call_id, "model-id-7");
}

TEST_F(ReasoningLoopTest, CorrelationIdsAreSequential) {
    model.then_call("list_todos", nlohmann::json::object())
         .then_call("get_todo", {{"todo_id", 1}})
         .then_call("toggle_todo_complete", {{"todo_id", 1}})
         .then_answer("done");
    auto outcome = run("toggle the first one");
    ASSERT_TRUE(outcome.finished());
    ASSERT_EQ(tools.requests.size(), 3u);
    EXPECT_EQ(tools.requests[0].id, "call-1");
    EXPECT_EQ(tools.requests[1].id, "call-2");
    EXPECT_EQ(tools.requests[2].id, "call-3");
    EXPECT_EQ(outcome.tool_calls, 3);
}

TEST_F(ReasoningLoopTest, NotFoundIsFedBackToModel) {
    tools.handler = [](const ToolCallRequest& req) {
        return failure(req.id, ToolErrorKind::not_found, "Todo not found");
    };
    model.then_call("delete_todo", {{"todo_id", 999}});
    model.then([](const std::vector<Message>& t) -> Decision {
        auto obs = last_observation(t);
        return FinalAnswer{obs["error"]["kind"] == "NotFound" ? "There is no todo 999." : "?"};
    });

    auto outcome = run("delete todo 999");
    ASSERT_TRUE(outcome.finished());
    EXPECT_EQ(outcome.answer, "There is no todo 999.");
}

TEST_F(ReasoningLoopTest, InvalidArgumentsStayLocal) {
    model.then_call("create_todo", {{"name", "Dentist"}, {"due_date", "next-ish"}});
    model.then([](const std::vector<Message>& t) -> Decision {
        auto obs = last_observation(t);
        return FinalAnswer{obs["error"]["field"].get<std::string>()};
    });

    auto outcome = run("dentist sometime");
    ASSERT_TRUE(outcome.finished());
    EXPECT_EQ(outcome.answer, "due_date");
    EXPECT_TRUE(tools.requests.empty());
    EXPECT_EQ(outcome.tool_calls, 1);
}

TEST_F(ReasoningLoopTest, UnparseableArgumentsStayLocal) {
    model.then([](const std::vector<Message>&) -> Decision {
        return ToolCall{"", "create_todo", "{name: Buy milk"};
    });
    model.then_answer("sorry");
    auto outcome = run("add milk");
    ASSERT_TRUE(outcome.finished());
    EXPECT_TRUE(tools.requests.empty());
    EXPECT_EQ(last_observation(outcome.transcript)["error"]["kind"], "InvalidArguments");
}

TEST_F(ReasoningLoopTest, UnauthorizedAbortsRun) {
    tools.handler = [](const ToolCallRequest& req) {
        return failure(req.id, ToolErrorKind::unauthorized, "token rejected");
    };
    model.then_call("list_todos", nlohmann::json::object());
    model.then_answer("should not be asked");

    auto outcome = run("show my todos");
    EXPECT_EQ(outcome.state, RunState::aborted);
    EXPECT_EQ(outcome.reason, AbortReason::unauthorized);
    EXPECT_EQ(model.turns(), 1u);
    EXPECT_EQ(outcome.transcript.back().role, "tool");
}

TEST_F(ReasoningLoopTest, NinthCallHitsIterationLimit) {
    model.set_responder([](const std::vector<Message>&) -> Decision {
        return ToolCall{"", "list_todos", "{}"};
    });

    auto outcome = run("loop forever");
    EXPECT_EQ(outcome.state, RunState::aborted);
    EXPECT_EQ(outcome.reason, AbortReason::iteration_limit);
    EXPECT_EQ(outcome.tool_calls, 8);
    EXPECT_EQ(tools.requests.size(), 8u);
    EXPECT_EQ(model.turns(), 9u);
}

TEST_F(ReasoningLoopTest, EighthCallMayStillFinish) {
    for (int i = 0; i < 8; i++) model.then_call("list_todos", nlohmann::json::object());
    model.then_answer("finally");
    auto outcome = run("busy");
    EXPECT_TRUE(outcome.finished());
    EXPECT_EQ(outcome.tool_calls, 8);
}

TEST_F(ReasoningLoopTest, ModelFailureAborts) {
    model.then_fail("connection refused");
    auto outcome = run("hi");
    EXPECT_EQ(outcome.state, RunState::aborted);
    EXPECT_EQ(outcome.reason, AbortReason::model_failure);
}

TEST_F(ReasoningLoopTest, ChannelFailureAborts) {
    tools.handler = [](const ToolCallRequest&) -> ToolCallResult {
        throw ChannelError(ChannelErrorKind::process_exited, "tool process closed its output");
    };
    model.then_call("list_todos", nlohmann::json::object());

    auto outcome = run("list");
    EXPECT_EQ(outcome.reason, AbortReason::channel_failure);
    ASSERT_TRUE(outcome.channel_error.has_value());
    EXPECT_EQ(*outcome.channel_error, ChannelErrorKind::process_exited);
}

TEST_F(ReasoningLoopTest, CancellationDiscardsTranscript) {
    bool cancel = false;
    model.then([&cancel](const std::vector<Message>&) -> Decision {
        cancel = true;
        return ToolCall{"", "list_todos", "{}"};
    });

    RunControl control;
    control.cancelled = [&cancel] { return cancel; };
    auto outcome = loop.run({}, "list", control);
    EXPECT_EQ(outcome.reason, AbortReason::cancelled);
    EXPECT_TRUE(outcome.transcript.empty());
    EXPECT_TRUE(tools.requests.empty());
}

TEST_F(ReasoningLoopTest, ExpiredDeadlineAbortsBeforeModel) {
    auto control = RunControl::with_timeout(std::chrono::milliseconds(0));
    auto outcome = loop.run({}, "hi", control);
    EXPECT_EQ(outcome.reason, AbortReason::deadline);
    EXPECT_EQ(model.turns(), 0u);
}

TEST_F(ReasoningLoopTest, ChannelDeadlineMapsToDeadline) {
    auto control = RunControl::with_timeout(std::chrono::milliseconds(50));
    tools.handler = [](const ToolCallRequest&) -> ToolCallResult {
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
        throw ChannelError(ChannelErrorKind::cancelled, "run deadline exceeded");
    };
    model.then_call("list_todos", nlohmann::json::object());
    auto outcome = loop.run({}, "list", control);
    EXPECT_EQ(outcome.reason, AbortReason::deadline);
}

TEST(WithTurnTest, LeavesOriginalUntouched) {
    std::vector<Message> base = {Message::user("a")};
    auto next = with_turn(base, Message::assistant("b"));
    EXPECT_EQ(base.size(), 1u);
    ASSERT_EQ(next.size(), 2u);
    EXPECT_EQ(next[1].content, "b");
}
