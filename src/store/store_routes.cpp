#include "store_routes.hpp"
#include "../utils.hpp"
#include <iostream>

namespace todochat {

std::string bearer_token(const httplib::Request& req) {
    auto auth = req.get_header_value("Authorization");
    const std::string prefix = "Bearer ";
    if (auth.size() <= prefix.size()) return "";
    if (to_lower(auth.substr(0, prefix.size())) != "bearer ") return "";
    return auth.substr(prefix.size());
}

static void send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

static void send_detail(httplib::Response& res, int status, const std::string& detail) {
    send_json(res, status, {{"detail", detail}});
}

static std::optional<Session> require_session(const httplib::Request& req, httplib::Response& res,
                                              TodoStore& store) {
    auto session = store.session(bearer_token(req));
    if (!session) {
        res.set_header("WWW-Authenticate", "Bearer");
        send_detail(res, 401, "Could not validate credentials");
    }
    return session;
}

static bool parse_body(const httplib::Request& req, httplib::Response& res, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error&) {
        send_detail(res, 422, "Request body is not valid JSON");
        return false;
    }
    if (!out.is_object()) {
        send_detail(res, 422, "Request body must be a JSON object");
        return false;
    }
    return true;
}

// Reads an optional nullable string field; false when the type is wrong
static bool read_nullable_string(const nlohmann::json& body, const char* key, bool& present,
                                 std::optional<std::string>& value) {
    present = body.contains(key);
    if (!present) return true;
    auto& v = body[key];
    if (v.is_null()) { value.reset(); return true; }
    if (!v.is_string()) return false;
    value = v.get<std::string>();
    return true;
}

static int int_param(const httplib::Request& req, const char* key, int fallback) {
    if (!req.has_param(key)) return fallback;
    try {
        return std::stoi(req.get_param_value(key));
    } catch (const std::exception&) {
        throw StoreError(422, std::string(key) + " must be an integer");
    }
}

static int64_t todo_id_of(const httplib::Request& req) {
    try {
        return std::stoll(req.matches[1].str());
    } catch (const std::exception&) {
        throw StoreError(404, "Todo not found");
    }
}

// Runs a handler and turns StoreError into its status
template <typename Fn>
static void guarded(httplib::Response& res, Fn&& fn) {
    try {
        fn();
    } catch (const StoreError& e) {
        send_detail(res, e.status(), e.what());
    }
}

void register_store_routes(httplib::Server& server, TodoStore& store) {
    // ── Auth ──

    server.Post("/api/auth/register", [&store](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            nlohmann::json body;
            if (!parse_body(req, res, body)) return;
            auto field = [&](const char* key) {
                if (!body.contains(key) || !body[key].is_string()) {
                    throw StoreError(422, std::string(key) + " is required");
                }
                return body[key].get<std::string>();
            };
            auto user = store.register_user(field("username"), field("email"), field("password"));
            send_json(res, 200, user.to_json());
        });
    });

    server.Post("/api/auth/login", [&store](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            std::string username, password;
            if (req.get_header_value("Content-Type").find("application/json") != std::string::npos) {
                nlohmann::json body;
                if (!parse_body(req, res, body)) return;
                username = body.value("username", "");
                password = body.value("password", "");
            } else {
                // OAuth2 password form
                username = req.get_param_value("username");
                password = req.get_param_value("password");
            }

            auto token = store.login(username, password);
            if (!token) {
                res.set_header("WWW-Authenticate", "Bearer");
                send_detail(res, 401, "Incorrect username or password");
                return;
            }
            send_json(res, 200, {{"access_token", *token}, {"token_type", "bearer"}});
        });
    });

    server.Get("/api/auth/me", [&store](const httplib::Request& req, httplib::Response& res) {
        auto session = require_session(req, res, store);
        if (!session) return;
        send_json(res, 200, session->user.to_json());
    });

    server.Post("/api/auth/logout", [&store](const httplib::Request& req, httplib::Response& res) {
        auto session = require_session(req, res, store);
        if (!session) return;
        store.revoke_session(session->token);
        send_json(res, 200, {{"message", "Logged out"}});
    });

    // ── Todos ──

    server.Get("/api/todos", [&store](const httplib::Request& req, httplib::Response& res) {
        auto session = require_session(req, res, store);
        if (!session) return;
        guarded(res, [&] {
            TodoQuery q;
            if (req.has_param("search")) q.search = req.get_param_value("search");
            if (req.has_param("sort_by")) q.sort_by = req.get_param_value("sort_by");
            if (req.has_param("sort_order")) q.sort_order = req.get_param_value("sort_order");
            if (req.has_param("completed")) q.completed = req.get_param_value("completed");
            q.page = int_param(req, "page", 1);
            q.page_size = int_param(req, "page_size", 10);
            send_json(res, 200, store.list_todos(session->user.id, q).to_json());
        });
    });

    server.Post("/api/todos", [&store](const httplib::Request& req, httplib::Response& res) {
        auto session = require_session(req, res, store);
        if (!session) return;
        guarded(res, [&] {
            nlohmann::json body;
            if (!parse_body(req, res, body)) return;
            if (!body.contains("name") || !body["name"].is_string()) {
                throw StoreError(422, "name is required");
            }

            TodoDraft draft;
            draft.name = body["name"].get<std::string>();
            bool present = false;
            if (!read_nullable_string(body, "description", present, draft.description)) {
                throw StoreError(422, "description must be a string");
            }
            if (!read_nullable_string(body, "due_date", present, draft.due_date)) {
                throw StoreError(422, "due_date must be a string");
            }
            auto todo = store.create_todo(session->user.id, draft);
            std::cerr << "[store] Created todo " << todo.id << " for user " << session->user.id << "\n";
            send_json(res, 200, todo.to_json());
        });
    });

    server.Get(R"(/api/todos/(\d+))", [&store](const httplib::Request& req, httplib::Response& res) {
        auto session = require_session(req, res, store);
        if (!session) return;
        guarded(res, [&] {
            auto todo = store.get_todo(session->user.id, todo_id_of(req));
            if (!todo) throw StoreError(404, "Todo not found");
            send_json(res, 200, todo->to_json());
        });
    });

    server.Put(R"(/api/todos/(\d+))", [&store](const httplib::Request& req, httplib::Response& res) {
        auto session = require_session(req, res, store);
        if (!session) return;
        guarded(res, [&] {
            nlohmann::json body;
            if (!parse_body(req, res, body)) return;

            TodoUpdate update;
            if (body.contains("name") && !body["name"].is_null()) {
                if (!body["name"].is_string()) throw StoreError(422, "name must be a string");
                update.name = body["name"].get<std::string>();
            }
            if (!read_nullable_string(body, "description", update.set_description, update.description)) {
                throw StoreError(422, "description must be a string");
            }
            if (!read_nullable_string(body, "due_date", update.set_due_date, update.due_date)) {
                throw StoreError(422, "due_date must be a string");
            }
            if (body.contains("is_completed") && !body["is_completed"].is_null()) {
                if (!body["is_completed"].is_boolean()) throw StoreError(422, "is_completed must be a boolean");
                update.is_completed = body["is_completed"].get<bool>();
            }

            auto todo = store.update_todo(session->user.id, todo_id_of(req), update);
            if (!todo) throw StoreError(404, "Todo not found");
            send_json(res, 200, todo->to_json());
        });
    });

    server.Patch(R"(/api/todos/(\d+)/toggle-complete)", [&store](const httplib::Request& req, httplib::Response& res) {
        auto session = require_session(req, res, store);
        if (!session) return;
        guarded(res, [&] {
            auto todo = store.toggle_todo(session->user.id, todo_id_of(req));
            if (!todo) throw StoreError(404, "Todo not found");
            send_json(res, 200, todo->to_json());
        });
    });

    server.Delete(R"(/api/todos/(\d+))", [&store](const httplib::Request& req, httplib::Response& res) {
        auto session = require_session(req, res, store);
        if (!session) return;
        guarded(res, [&] {
            if (!store.delete_todo(session->user.id, todo_id_of(req))) {
                throw StoreError(404, "Todo not found");
            }
            send_json(res, 200, {{"message", "Todo deleted successfully"}});
        });
    });
}

} // namespace todochat
