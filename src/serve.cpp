#include "commands.hpp"
#include "config.hpp"
#include "orchestrator.hpp"
#include "provider.hpp"
#include "channels/http_server.hpp"
#include "store/todo_store.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace todochat {

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

int cmd_serve(const std::string& host, int port) {
    Config cfg = Config::load(default_config_path());
    const std::string default_base = Config{}.api_base_url;
    cfg.apply_env_overrides();

    if (!host.empty()) cfg.http.host = host;
    if (port > 0) cfg.http.port = port;
    // Without an external store, tool processes use the server's own
    // loopback store listener
    if (cfg.api_base_url == default_base) cfg.api_base_url.clear();

    ProviderConfig pc = cfg.resolve_provider();
    if (pc.api_key.empty()) {
        std::cerr << "[warn] No provider API key configured; /api/chat will answer with errors\n";
    }

    try {
        TodoStore store(cfg.db_path(), cfg.store.token_ttl_minutes);
        Provider provider(pc, cfg.model, cfg.max_tokens, cfg.temperature, cfg.agent.request_deadline_seconds);
        Orchestrator orchestrator(cfg, provider);
        HTTPServer http(cfg, store, orchestrator);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        http.start();
        std::cerr << "[serve] Store: " << cfg.db_path() << "\n";
        std::cerr << "[serve] Tool processes use " << http.api_base_url() << "\n";
        std::cerr << "[serve] Ready. Ctrl+C to quit.\n";

        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cerr << "[serve] Shutting down...\n";
        http.stop();
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
    std::cerr << "[serve] Done.\n";
    return 0;
}

} // namespace todochat
