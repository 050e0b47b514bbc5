#include "config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace todochat {

// Named provider, then "default", then whichever is configured, then OpenAI
ProviderConfig Config::resolve_provider() const {
    for (const std::string& name : {provider, std::string("default")}) {
        if (name.empty()) continue;
        auto it = providers.find(name);
        if (it != providers.end()) return it->second;
        if (name == provider) std::cerr << "[config] unknown provider '" << provider << "', trying others\n";
    }
    if (!providers.empty()) return providers.begin()->second;
    return ProviderConfig{"", "https://api.openai.com/v1", ""};
}

void Config::apply_env_overrides() {
    if (const char* key = std::getenv("OPENAI_API_KEY"); key && *key) {
        auto& p = providers[provider.empty() ? "default" : provider];
        if (p.api_base.empty()) p.api_base = "https://api.openai.com/v1";
        p.api_key = key;
    }
    if (const char* base = std::getenv("TODOCHAT_API_BASE_URL"); base && *base) {
        api_base_url = base;
    }
}

Config Config::make_default() {
    Config c;
    c.providers["default"] = ProviderConfig{
        "", "https://api.openai.com/v1", ""
    };
    return c;
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    j["model"] = model;
    if (!provider.empty()) j["provider"] = provider;
    j["max_tokens"] = max_tokens;
    j["temperature"] = temperature;
    j["api_base_url"] = api_base_url;

    for (auto& [k, v] : providers) {
        j["providers"][k] = {{"api_base", v.api_base}};
        if (!v.api_key.empty()) j["providers"][k]["api_key"] = v.api_key;
        if (!v.default_model.empty()) j["providers"][k]["default_model"] = v.default_model;
    }

    j["agent"] = {
        {"max_tool_calls", agent.max_tool_calls},
        {"request_deadline_seconds", agent.request_deadline_seconds}
    };

    auto& tp = j["tool_process"];
    if (!tool_process.command.empty()) tp["command"] = tool_process.command;
    if (!tool_process.args.empty()) tp["args"] = tool_process.args;
    if (!tool_process.env.empty()) tp["env"] = tool_process.env;
    tp["handshake_timeout_ms"] = tool_process.handshake_timeout_ms;
    tp["call_timeout_ms"] = tool_process.call_timeout_ms;
    tp["close_grace_ms"] = tool_process.close_grace_ms;

    auto& hc = j["http"];
    hc["host"] = http.host;
    hc["port"] = http.port;
    hc["worker_threads"] = http.worker_threads;
    hc["store_worker_threads"] = http.store_worker_threads;
    if (http.rate_limit_rpm > 0) hc["rate_limit_rpm"] = http.rate_limit_rpm;

    j["store"] = {
        {"db_path", store.db_path},
        {"token_ttl_minutes", store.token_ttl_minutes}
    };

    return j;
}

static std::vector<std::string> parse_string_array(const nlohmann::json& arr) {
    std::vector<std::string> result;
    if (arr.is_array()) {
        for (auto& item : arr) {
            if (item.is_string()) result.push_back(item.get<std::string>());
        }
    }
    return result;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;

    c.model = j.value("model", c.model);
    c.provider = j.value("provider", c.provider);
    c.max_tokens = j.value("max_tokens", c.max_tokens);
    c.temperature = j.value("temperature", c.temperature);
    c.api_base_url = j.value("api_base_url", c.api_base_url);

    if (j.contains("providers")) {
        for (auto& [k, v] : j["providers"].items()) {
            c.providers[k] = ProviderConfig{
                v.value("api_key", ""),
                v.value("api_base", ""),
                v.value("default_model", "")
            };
        }
    }

    if (j.contains("agent")) {
        auto& a = j["agent"];
        c.agent.max_tool_calls = a.value("max_tool_calls", c.agent.max_tool_calls);
        c.agent.request_deadline_seconds = a.value("request_deadline_seconds", c.agent.request_deadline_seconds);
    }

    if (j.contains("tool_process")) {
        auto& tp = j["tool_process"];
        c.tool_process.command = tp.value("command", "");
        if (tp.contains("args")) c.tool_process.args = parse_string_array(tp["args"]);
        if (tp.contains("env") && tp["env"].is_object()) {
            for (auto& [ek, ev] : tp["env"].items()) {
                if (ev.is_string()) c.tool_process.env[ek] = ev.get<std::string>();
            }
        }
        c.tool_process.handshake_timeout_ms = tp.value("handshake_timeout_ms", c.tool_process.handshake_timeout_ms);
        c.tool_process.call_timeout_ms = tp.value("call_timeout_ms", c.tool_process.call_timeout_ms);
        c.tool_process.close_grace_ms = tp.value("close_grace_ms", c.tool_process.close_grace_ms);
    }

    if (j.contains("http")) {
        auto& hc = j["http"];
        c.http.host = hc.value("host", c.http.host);
        c.http.port = hc.value("port", c.http.port);
        c.http.worker_threads = hc.value("worker_threads", c.http.worker_threads);
        c.http.store_worker_threads = hc.value("store_worker_threads", c.http.store_worker_threads);
        c.http.rate_limit_rpm = hc.value("rate_limit_rpm", 0);
    }

    if (j.contains("store")) {
        auto& st = j["store"];
        c.store.db_path = st.value("db_path", c.store.db_path);
        c.store.token_ttl_minutes = st.value("token_ttl_minutes", c.store.token_ttl_minutes);
    }

    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[config] " << path << " not found, using defaults\n";
        return make_default();
    }
    auto j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        std::cerr << "[config] " << path << " is not a JSON object, using defaults\n";
        return make_default();
    }
    try {
        return from_json(j);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[config] bad value in " << path << ": " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream f(path);
    f << to_json().dump(2) << std::endl;
}

} // namespace todochat
