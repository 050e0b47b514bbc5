#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <sqlite3.h>

namespace todochat {

// Client-visible store failure carrying the HTTP status to report
class StoreError : public std::runtime_error {
public:
    StoreError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}
    int status() const { return status_; }

private:
    int status_;
};

struct User {
    int64_t id = 0;
    std::string username;
    std::string email;
    std::string created_at;

    nlohmann::json to_json() const;
};

struct Session {
    User user;
    std::string token;
    int64_t expires_at = 0;    // unix seconds
};

struct Todo {
    int64_t id = 0;
    std::string name;
    std::optional<std::string> description;
    std::string creation_date;
    std::optional<std::string> due_date;
    int64_t created_by = 0;
    bool is_completed = false;
    std::optional<std::string> completed_at;

    nlohmann::json to_json() const;
};

struct TodoDraft {
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> due_date;
};

// Only fields flagged as set are written; a set field with no value clears it
struct TodoUpdate {
    std::optional<std::string> name;
    bool set_description = false;
    std::optional<std::string> description;
    bool set_due_date = false;
    std::optional<std::string> due_date;
    std::optional<bool> is_completed;
};

struct TodoQuery {
    std::string search;
    std::string sort_by = "creation_date";
    std::string sort_order = "desc";
    std::string completed;   // "true", "false", anything else = all
    int page = 1;
    int page_size = 10;
};

struct TodoPage {
    std::vector<Todo> todos;
    int64_t total = 0;
    int page = 1;
    int page_size = 10;
    int64_t total_pages = 1;

    nlohmann::json to_json() const;
};

// SQLite-backed users, sessions and todos. One connection, serialized by a
// mutex so HTTP worker threads can share it. Todos are always scoped to
// their owner: another user's id behaves as not found.
class TodoStore {
public:
    explicit TodoStore(const std::string& db_path, int token_ttl_minutes = 30);
    ~TodoStore();

    TodoStore(const TodoStore&) = delete;
    TodoStore& operator=(const TodoStore&) = delete;

    // ── Users and sessions ──
    User register_user(const std::string& username, const std::string& email, const std::string& password);
    std::optional<std::string> login(const std::string& username, const std::string& password);
    std::optional<Session> session(const std::string& token);
    bool revoke_session(const std::string& token);

    // ── Todos ──
    Todo create_todo(int64_t user_id, const TodoDraft& draft);
    TodoPage list_todos(int64_t user_id, const TodoQuery& query);
    std::optional<Todo> get_todo(int64_t user_id, int64_t todo_id);
    std::optional<Todo> update_todo(int64_t user_id, int64_t todo_id, const TodoUpdate& update);
    std::optional<Todo> toggle_todo(int64_t user_id, int64_t todo_id);
    bool delete_todo(int64_t user_id, int64_t todo_id);

private:
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
    int token_ttl_minutes_;

    void init_db();
    std::optional<Todo> find_todo(int64_t user_id, int64_t todo_id);
};

} // namespace todochat
