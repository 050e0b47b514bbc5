#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace todochat {

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // JSON string, as produced by the model
};

// One conversation turn. "user"/"assistant" come from the caller's history;
// "system" and "tool" (observations) are added during a run.
struct Message {
    std::string role;
    std::string content;
    std::string tool_call_id;         // for role="tool"
    std::vector<ToolCall> tool_calls; // for role="assistant" with a tool call

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["role"] = role;
        if (!content.empty() || tool_calls.empty()) j["content"] = content;
        if (!tool_call_id.empty()) j["tool_call_id"] = tool_call_id;
        if (!tool_calls.empty()) {
            auto& arr = j["tool_calls"];
            for (auto& tc : tool_calls) {
                arr.push_back({
                    {"id", tc.id},
                    {"type", "function"},
                    {"function", {{"name", tc.name}, {"arguments", tc.arguments}}}
                });
            }
        }
        return j;
    }

    static Message user(std::string text) {
        Message m;
        m.role = "user";
        m.content = std::move(text);
        return m;
    }

    static Message assistant(std::string text) {
        Message m;
        m.role = "assistant";
        m.content = std::move(text);
        return m;
    }
};

// Caller-supplied history: only user/assistant turns are accepted, anything
// else is dropped.
inline std::vector<Message> history_from_json(const nlohmann::json& arr) {
    std::vector<Message> out;
    if (!arr.is_array()) return out;
    for (auto& item : arr) {
        if (!item.is_object()) continue;
        std::string role = item.value("role", "");
        if (role != "user" && role != "assistant") continue;
        std::string content;
        if (item.contains("content") && item["content"].is_string()) {
            content = item["content"].get<std::string>();
        }
        Message m;
        m.role = role;
        m.content = std::move(content);
        out.push_back(std::move(m));
    }
    return out;
}

} // namespace todochat
