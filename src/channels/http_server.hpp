#pragma once
#include "chat_endpoint.hpp"
#include "../config.hpp"
#include "../orchestrator.hpp"
#include "../rate_limiter.hpp"
#include "../store/store_routes.hpp"
#include "../store/todo_store.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace todochat {

// The todo store REST surface and the chat endpoint on one listener.
// Chat handlers block a worker for the whole run while their tool process
// calls back into the store, so that traffic gets a loopback listener with
// its own pool unless an external store address is configured.
class HTTPServer {
public:
    HTTPServer(const Config& cfg, TodoStore& store, const Orchestrator& orchestrator)
        : config_(cfg.http), api_base_url_(cfg.api_base_url), store_(store),
          orchestrator_(orchestrator), rate_limiter_(cfg.http.rate_limit_rpm) {
        setup();
    }

    ~HTTPServer() { stop(); }

    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

    // Binds the configured port (0 = ephemeral) and serves on a background
    // thread. Returns the bound port.
    int start() {
        if (api_base_url_.empty()) {
            int store_port = store_server_.bind_to_any_port("127.0.0.1");
            if (store_port <= 0) throw std::runtime_error("Cannot bind the tool process store listener");
            store_thread_ = std::thread([this]() { store_server_.listen_after_bind(); });
            store_server_.wait_until_ready();
            api_base_url_ = "http://127.0.0.1:" + std::to_string(store_port);
            std::cerr << "[http] Tool process store listener on 127.0.0.1:" << store_port << "\n";
        }

        int port = config_.port;
        if (port == 0) {
            port = server_.bind_to_any_port(config_.host);
            if (port <= 0) throw std::runtime_error("Cannot bind " + config_.host);
        } else if (!server_.bind_to_port(config_.host, port)) {
            throw std::runtime_error("Cannot listen on " + config_.host + ":" + std::to_string(port));
        }
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        server_.wait_until_ready();
        std::cerr << "[http] Listening on " << config_.host << ":" << port << "\n";
        return port;
    }

    // Address handed to tool processes
    const std::string& api_base_url() const { return api_base_url_; }

    void stop() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
        store_server_.stop();
        if (store_thread_.joinable()) store_thread_.join();
    }

private:
    HTTPConfig config_;
    std::string api_base_url_;
    TodoStore& store_;
    const Orchestrator& orchestrator_;
    httplib::Server server_;
    httplib::Server store_server_;
    std::thread thread_;
    std::thread store_thread_;
    RateLimiter rate_limiter_;

    static void configure(httplib::Server& server, int workers) {
        server.new_task_queue = [workers] { return new httplib::ThreadPool(static_cast<size_t>(workers)); };

        server.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
            std::string msg = "unknown error";
            try { if (ep) std::rethrow_exception(ep); }
            catch (const std::exception& e) { msg = e.what(); }
            catch (...) { msg = "non-std exception"; }
            std::cerr << "[http] Unhandled exception: " << msg << "\n";
            res.status = 500;
            nlohmann::json err;
            err["error"] = "internal server error";
            res.set_content(err.dump(), "application/json");
        });
    }

    void setup() {
        configure(server_, config_.worker_threads > 0 ? config_.worker_threads : 8);
        configure(store_server_, config_.store_worker_threads > 0 ? config_.store_worker_threads : 4);

        server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"status":"ok"})", "application/json");
        });

        server_.Get("/", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"message":"Todo API is running"})", "application/json");
        });

        register_store_routes(server_, store_);
        register_store_routes(store_server_, store_);

        // The chat endpoint forwards the caller's own token to its tool process
        auto resolve = [this](const std::string& token) -> std::optional<Credential> {
            auto session = store_.session(token);
            if (!session) return std::nullopt;
            Credential cred;
            cred.token = token;
            cred.base_url = api_base_url_;
            cred.expiry = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(session->expires_at));
            return cred;
        };
        register_chat_routes(server_, orchestrator_, resolve, rate_limiter_);
    }
};

} // namespace todochat
