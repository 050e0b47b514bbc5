#include "provider.hpp"
#include <httplib.h>
#include <iostream>
#include <optional>
#include <utility>

namespace todochat {

Provider::Provider(const ProviderConfig& cfg, std::string model, int max_tokens, double temperature,
                   int timeout_sec)
    : config_(cfg), url_(parse_url(cfg.api_base)), model_(std::move(model)),
      max_tokens_(max_tokens), temperature_(temperature), timeout_sec_(timeout_sec) {
    if (model_.empty()) model_ = config_.default_model;
}

// ── Tool calls embedded in content ──────────────────────────────────

namespace {

struct Span {
    size_t begin;
    size_t end;  // one past the closing brace
};

// Locates the first top-level {...} in text, skipping braces inside strings
std::optional<Span> first_object_span(const std::string& text) {
    size_t open = text.find('{');
    if (open == std::string::npos) return std::nullopt;
    int depth = 0;
    bool quoted = false;
    for (size_t i = open; i < text.size(); i++) {
        char c = text[i];
        if (quoted) {
            if (c == '\\') i++;
            else if (c == '"') quoted = false;
            continue;
        }
        if (c == '"') quoted = true;
        else if (c == '{') depth++;
        else if (c == '}' && --depth == 0) return Span{open, i + 1};
    }
    return std::nullopt;
}

// Models often leave a comma before } or ]
std::string without_trailing_commas(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool quoted = false;
    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (quoted) {
            out += c;
            if (c == '\\' && i + 1 < text.size()) out += text[++i];
            else if (c == '"') quoted = false;
            continue;
        }
        if (c == '"') quoted = true;
        if (c == ',') {
            size_t next = text.find_first_not_of(" \t\r\n", i + 1);
            if (next != std::string::npos && (text[next] == '}' || text[next] == ']')) continue;
        }
        out += c;
    }
    return out;
}

std::optional<nlohmann::json> lenient_object(const std::string& text) {
    auto span = first_object_span(text);
    if (!span) return std::nullopt;
    auto parsed = nlohmann::json::parse(without_trailing_commas(text.substr(span->begin, span->end - span->begin)),
                                        nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;
    return parsed;
}

// {"name": ..., "arguments"|"parameters": ...}
std::optional<ToolCall> call_from_object(const nlohmann::json& j, size_t ordinal) {
    if (!j.contains("name") || !j["name"].is_string() || j["name"].get<std::string>().empty()) return std::nullopt;
    ToolCall tc;
    tc.id = "text_call_" + std::to_string(ordinal);
    tc.name = j["name"].get<std::string>();
    tc.arguments = "{}";
    for (const char* key : {"arguments", "parameters"}) {
        if (!j.contains(key)) continue;
        tc.arguments = j[key].is_string() ? j[key].get<std::string>() : j[key].dump();
        break;
    }
    return tc;
}

// Collects <tag>{...}</tag> calls and removes every complete tag pair from content
std::vector<ToolCall> take_tagged_calls(std::string& content, const std::string& tag) {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    std::vector<ToolCall> calls;
    std::string rest;
    size_t pos = 0;
    for (;;) {
        size_t a = content.find(open, pos);
        size_t b = a == std::string::npos ? a : content.find(close, a + open.size());
        if (b == std::string::npos) {
            rest += content.substr(pos);
            break;
        }
        rest += content.substr(pos, a - pos);
        if (auto j = lenient_object(content.substr(a + open.size(), b - a - open.size()))) {
            if (auto tc = call_from_object(*j, calls.size())) calls.push_back(std::move(*tc));
        }
        pos = b + close.size();
    }
    if (!calls.empty()) {
        size_t last = rest.find_last_not_of(" \t\r\n");
        content = last == std::string::npos ? "" : rest.substr(0, last + 1);
    }
    return calls;
}

// ```json (or bare ```) blocks whose object names a tool
std::vector<ToolCall> fenced_calls(const std::string& content) {
    std::vector<ToolCall> calls;
    size_t pos = 0;
    while (true) {
        size_t fence = content.find("```", pos);
        if (fence == std::string::npos) break;
        size_t body = content.find('\n', fence);
        if (body == std::string::npos) break;
        size_t close = content.find("```", body);
        if (close == std::string::npos) break;
        pos = close + 3;

        std::string lang = trim(content.substr(fence + 3, body - fence - 3));
        if (!lang.empty() && lang != "json" && lang != "tool") continue;
        if (auto j = lenient_object(content.substr(body + 1, close - body - 1))) {
            if (auto tc = call_from_object(*j, calls.size())) calls.push_back(std::move(*tc));
        }
    }
    return calls;
}

} // namespace

ProviderResponse parse_chat_completion(const std::string& body) {
    ProviderResponse resp;
    try {
        auto j = nlohmann::json::parse(body);
        if (j.contains("choices") && j["choices"].is_array() && !j["choices"].empty()) {
            auto& msg = j["choices"][0]["message"];
            resp.content = msg.contains("content") && msg["content"].is_string()
                           ? msg["content"].get<std::string>() : "";

            if (msg.contains("tool_calls") && msg["tool_calls"].is_array()) {
                for (auto& tc : msg["tool_calls"]) {
                    ToolCall t;
                    t.id = tc.value("id", "");
                    if (tc.contains("function")) {
                        auto& fn = tc["function"];
                        t.name = fn.value("name", "");
                        if (fn.contains("arguments")) {
                            t.arguments = fn["arguments"].is_string() ? fn["arguments"].get<std::string>()
                                                                      : fn["arguments"].dump();
                        }
                    }
                    if (!t.name.empty()) resp.tool_calls.push_back(std::move(t));
                }
            }
        } else {
            throw std::runtime_error("response has no choices");
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse provider response: ") + e.what());
    }

    if (resp.tool_calls.empty() && !resp.content.empty()) {
        for (const char* tag : {"tool_call", "toolcall"}) {
            resp.tool_calls = take_tagged_calls(resp.content, tag);
            if (!resp.tool_calls.empty()) return resp;
        }
        resp.tool_calls = fenced_calls(resp.content);
    }
    return resp;
}

Decision to_decision(const ProviderResponse& resp) {
    if (!resp.has_tool_calls()) return FinalAnswer{resp.content};
    if (resp.tool_calls.size() > 1) {
        std::cerr << "[provider] Model requested " << resp.tool_calls.size()
                  << " tool calls, using only " << resp.tool_calls.front().name << "\n";
    }
    ToolCall tc = resp.tool_calls.front();
    if (tc.arguments.empty()) tc.arguments = "{}";
    return tc;
}

ProviderResponse Provider::chat(const std::vector<Message>& messages, const nlohmann::json& tools_spec) {
    httplib::Client cli(url_.origin());
    cli.set_connection_timeout(10);
    cli.set_read_timeout(timeout_sec_);

    nlohmann::json body;
    body["model"] = model_;
    body["max_tokens"] = max_tokens_;
    body["temperature"] = temperature_;

    auto& msgs = body["messages"];
    msgs = nlohmann::json::array();
    for (auto& m : messages) msgs.push_back(m.to_json());

    if (tools_spec.is_array() && !tools_spec.empty()) {
        body["tools"] = tools_spec;
        body["tool_choice"] = "auto";
    }

    httplib::Headers headers;
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }

    auto res = cli.Post(url_.path_prefix + "/chat/completions", headers, body.dump(), "application/json");
    if (!res) {
        throw std::runtime_error("Provider request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw std::runtime_error("Provider returned status " + std::to_string(res->status) + ": " +
                                 res->body.substr(0, 300));
    }
    return parse_chat_completion(res->body);
}

Decision Provider::decide(const std::vector<Message>& transcript, const nlohmann::json& tools_spec) {
    return to_decision(chat(transcript, tools_spec));
}

} // namespace todochat
