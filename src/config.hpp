#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace todochat {

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
    std::string default_model;  // Optional: default model for this provider
};

struct AgentConfig {
    int max_tool_calls = 8;            // tool calls per orchestration run
    int request_deadline_seconds = 60; // wall clock for one chat request
};

// How the per-run Tool Process is started. Credentials are never part of this.
struct ToolProcessConfig {
    std::string command;        // empty = todochat-tools next to the running binary
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    int handshake_timeout_ms = 5000;
    int call_timeout_ms = 15000;
    int close_grace_ms = 2000;
};

struct HTTPConfig {
    std::string host = "127.0.0.1";
    int port = 8000;
    int worker_threads = 16;
    int store_worker_threads = 8;  // loopback listener for tool processes
    int rate_limit_rpm = 0;    // per client address, 0 = unlimited
};

struct StoreConfig {
    std::string db_path = "~/.todochat/todos.db";
    int token_ttl_minutes = 30;
};

struct Config {
    std::string model = "gpt-4o-mini";
    std::string provider;  // which provider key to use (empty = auto-detect)
    int max_tokens = 1024;
    double temperature = 0.0;

    // Base address the Tool Process uses to reach the todo store
    std::string api_base_url = "http://127.0.0.1:8000";

    std::map<std::string, ProviderConfig> providers;
    AgentConfig agent;
    ToolProcessConfig tool_process;
    HTTPConfig http;
    StoreConfig store;

    std::string db_path() const {
        return expand_path(store.db_path);
    }

    ProviderConfig resolve_provider() const;

    // Applies OPENAI_API_KEY / TODOCHAT_API_BASE_URL when set
    void apply_env_overrides();

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace todochat
