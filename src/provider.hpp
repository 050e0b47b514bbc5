#pragma once
#include "config.hpp"
#include "message.hpp"
#include <string>
#include <variant>
#include <vector>
#include <stdexcept>

namespace todochat {

struct FinalAnswer {
    std::string text;
};

// What the model wants next: answer the user, or run exactly one tool
using Decision = std::variant<FinalAnswer, ToolCall>;

class Model {
public:
    virtual ~Model() = default;
    // Throws std::runtime_error when the model cannot be reached
    virtual Decision decide(const std::vector<Message>& transcript, const nlohmann::json& tools_spec) = 0;
};

struct ProviderResponse {
    std::string content;
    std::vector<ToolCall> tool_calls;
    bool has_tool_calls() const { return !tool_calls.empty(); }
};

// Parses a /chat/completions body, including tool calls some models emit
// as tagged or fenced JSON inside the content. Throws std::runtime_error.
ProviderResponse parse_chat_completion(const std::string& body);

// First tool call wins; extra calls are dropped
Decision to_decision(const ProviderResponse& resp);

// OpenAI-compatible chat completions client
class Provider : public Model {
public:
    Provider(const ProviderConfig& cfg, std::string model, int max_tokens, double temperature,
             int timeout_sec = 60);

    ProviderResponse chat(const std::vector<Message>& messages, const nlohmann::json& tools_spec);

    Decision decide(const std::vector<Message>& transcript, const nlohmann::json& tools_spec) override;

    const ProviderConfig& config() const { return config_; }

private:
    ProviderConfig config_;
    UrlParts url_;
    std::string model_;
    int max_tokens_;
    double temperature_;
    int timeout_sec_;
};

} // namespace todochat
