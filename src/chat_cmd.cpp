#include "commands.hpp"
#include "config.hpp"
#include "credential.hpp"
#include "orchestrator.hpp"
#include "provider.hpp"
#include <iostream>

namespace todochat {

// One orchestration run from the terminal, against a running store
int cmd_chat(const std::string& message, bool token_from_stdin, const std::string& history_file) {
    if (message.empty()) {
        std::cerr << "Usage: todochat chat -m MSG [--token-stdin] [--history FILE]\n";
        return 1;
    }

    Config cfg = Config::load(default_config_path());
    cfg.apply_env_overrides();

    Credential cred;
    cred.token = cli_token(token_from_stdin, std::cin);
    cred.base_url = cfg.api_base_url;
    if (cred.token.empty()) {
        std::cerr << "[error] No token: use --token-stdin or set " << kAuthTokenEnv << "\n";
        return 1;
    }

    std::vector<Message> history;
    if (!history_file.empty()) {
        std::string content = read_file(expand_path(history_file));
        if (content.empty()) {
            std::cerr << "[error] Cannot read history file: " << history_file << "\n";
            return 1;
        }
        try {
            history = history_from_json(nlohmann::json::parse(content));
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[error] History file is not valid JSON: " << e.what() << "\n";
            return 1;
        }
    }

    Provider provider(cfg.resolve_provider(), cfg.model, cfg.max_tokens, cfg.temperature,
                      cfg.agent.request_deadline_seconds);
    Orchestrator orchestrator(cfg, provider);

    try {
        auto reply = orchestrator.handle(cred, history, message);
        std::cout << reply.response << "\n";
        return reply.outcome.finished() ? 0 : 2;
    } catch (const BoundaryError& e) {
        std::cerr << "[error] " << e.what() << " (" << e.status() << ")\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
}

} // namespace todochat
