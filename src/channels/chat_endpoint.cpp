#include "chat_endpoint.hpp"
#include "../store/store_routes.hpp"
#include <iostream>

namespace todochat {

static void send_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    nlohmann::json err;
    err["error"] = message;
    res.set_content(err.dump(), "application/json");
}

void register_chat_routes(httplib::Server& server, const Orchestrator& orchestrator,
                          CredentialResolver resolve, RateLimiter& limiter) {
    server.Post("/api/chat", [&orchestrator, resolve = std::move(resolve), &limiter](
                                 const httplib::Request& req, httplib::Response& res) {
        if (!limiter.allow(req.remote_addr)) {
            send_error(res, 429, "rate limit exceeded");
            return;
        }

        std::string token = bearer_token(req);
        if (token.empty()) {
            res.set_header("WWW-Authenticate", "Bearer");
            send_error(res, 401, "missing credential");
            return;
        }
        auto credential = resolve(token);
        if (!credential) {
            res.set_header("WWW-Authenticate", "Bearer");
            send_error(res, 401, "invalid or expired credential");
            return;
        }

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(req.body);
        } catch (const nlohmann::json::parse_error&) {
            send_error(res, 400, "invalid JSON in request body");
            return;
        }
        if (!j.is_object() || !j.contains("message") || !j["message"].is_string() ||
            j["message"].get<std::string>().empty()) {
            send_error(res, 400, "message is required");
            return;
        }
        if (j.contains("conversation_history") && !j["conversation_history"].is_null() &&
            !j["conversation_history"].is_array()) {
            send_error(res, 400, "conversation_history must be a list");
            return;
        }

        auto history = history_from_json(j.value("conversation_history", nlohmann::json::array()));
        auto cancelled = [&req] { return req.is_connection_closed && req.is_connection_closed(); };

        try {
            auto reply = orchestrator.handle(*credential, history, j["message"].get<std::string>(), cancelled);
            nlohmann::json resp;
            resp["response"] = reply.response;
            res.set_content(resp.dump(), "application/json");
        } catch (const BoundaryError& e) {
            std::cerr << "[http] /api/chat failed: " << e.what() << "\n";
            send_error(res, e.status(), e.what());
        }
    });
}

} // namespace todochat
