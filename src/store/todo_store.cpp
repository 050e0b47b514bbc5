#include "todo_store.hpp"
#include "password.hpp"
#include "../tool_spec.hpp"
#include "../utils.hpp"
#include <iostream>

namespace todochat {

// ── Statement helper ────────────────────────────────────────────────

namespace {

class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, const std::string& v) { sqlite3_bind_text(stmt_, idx, v.c_str(), -1, SQLITE_TRANSIENT); }
    void bind(int idx, int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }
    void bind(int idx, const std::optional<std::string>& v) {
        if (v) bind(idx, *v);
        else sqlite3_bind_null(stmt_, idx);
    }

    // true while rows are available
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        if (rc == SQLITE_CONSTRAINT) throw StoreError(400, sqlite3_errmsg(db_));
        throw std::runtime_error(std::string("SQLite step failed: ") + sqlite3_errmsg(db_));
    }

    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    std::string text(int col) const {
        auto p = sqlite3_column_text(stmt_, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    }
    std::optional<std::string> nullable_text(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
        return text(col);
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

const char* kTodoColumns =
    "id, name, description, creation_date, due_date, created_by, is_completed, completed_at";

Todo read_todo(const Statement& st) {
    Todo t;
    t.id = st.int64(0);
    t.name = st.text(1);
    t.description = st.nullable_text(2);
    t.creation_date = st.text(3);
    t.due_date = st.nullable_text(4);
    t.created_by = st.int64(5);
    t.is_completed = st.int64(6) != 0;
    t.completed_at = st.nullable_text(7);
    return t;
}

std::optional<std::string> checked_due_date(const std::optional<std::string>& due) {
    if (!due) return std::nullopt;
    auto normalized = normalize_due_date(*due);
    if (!normalized) throw StoreError(422, "Invalid due_date: " + *due);
    return normalized;
}

std::string like_pattern(const std::string& search) {
    std::string out = "%";
    for (char c : search) {
        if (c == '%' || c == '_' || c == '\\') out += '\\';
        out += c;
    }
    out += "%";
    return out;
}

} // namespace

// ── JSON views ──────────────────────────────────────────────────────

static nlohmann::json nullable(const std::optional<std::string>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

nlohmann::json User::to_json() const {
    return {{"id", id}, {"username", username}, {"email", email}, {"created_at", created_at}};
}

nlohmann::json Todo::to_json() const {
    return {
        {"id", id},
        {"name", name},
        {"description", nullable(description)},
        {"creation_date", creation_date},
        {"due_date", nullable(due_date)},
        {"created_by", created_by},
        {"is_completed", is_completed},
        {"completed_at", nullable(completed_at)}
    };
}

nlohmann::json TodoPage::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& t : todos) arr.push_back(t.to_json());
    return {
        {"todos", std::move(arr)},
        {"total", total},
        {"page", page},
        {"page_size", page_size},
        {"total_pages", total_pages}
    };
}

// ── Setup ───────────────────────────────────────────────────────────

TodoStore::TodoStore(const std::string& db_path, int token_ttl_minutes)
    : token_ttl_minutes_(token_ttl_minutes) {
    if (db_path != ":memory:") {
        auto parent = fs::path(db_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
    }
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open todo DB: " + msg);
    }
    init_db();
}

TodoStore::~TodoStore() {
    if (db_) sqlite3_close(db_);
}

void TodoStore::init_db() {
    const char* sql = R"(
        PRAGMA foreign_keys = ON;
        CREATE TABLE IF NOT EXISTS users (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            username TEXT NOT NULL UNIQUE,
            email TEXT NOT NULL UNIQUE,
            hashed_password TEXT NOT NULL,
            created_at TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS sessions (
            token TEXT PRIMARY KEY,
            user_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,
            expires_at INTEGER NOT NULL
        );
        CREATE TABLE IF NOT EXISTS todos (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL,
            description TEXT,
            creation_date TEXT NOT NULL,
            due_date TEXT,
            created_by INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,
            is_completed INTEGER NOT NULL DEFAULT 0,
            completed_at TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_todos_owner ON todos(created_by);
        CREATE INDEX IF NOT EXISTS idx_todos_completed ON todos(is_completed);
    )";
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Failed to init todo DB: " + msg);
    }
}

// ── Users and sessions ──────────────────────────────────────────────

User TodoStore::register_user(const std::string& username, const std::string& email, const std::string& password) {
    if (username.empty()) throw StoreError(422, "username is required");
    if (password.empty()) throw StoreError(422, "password is required");
    auto at = email.find('@');
    if (at == std::string::npos || at == 0 || at + 1 >= email.size()) {
        throw StoreError(422, "email is not a valid address");
    }

    std::string hashed = hash_password(password);
    std::lock_guard<std::mutex> lock(mutex_);

    {
        Statement st(db_, "SELECT username = ?1 FROM users WHERE username = ?1 OR email = ?2 LIMIT 1");
        st.bind(1, username);
        st.bind(2, email);
        if (st.step()) {
            throw StoreError(400, st.int64(0) ? "Username already registered" : "Email already registered");
        }
    }

    User u;
    u.username = username;
    u.email = email;
    u.created_at = iso_now_utc();

    Statement st(db_, "INSERT INTO users (username, email, hashed_password, created_at) VALUES (?, ?, ?, ?)");
    st.bind(1, username);
    st.bind(2, email);
    st.bind(3, hashed);
    st.bind(4, u.created_at);
    st.step();
    u.id = sqlite3_last_insert_rowid(db_);
    std::cerr << "[store] Registered user " << username << " (id " << u.id << ")\n";
    return u;
}

std::optional<std::string> TodoStore::login(const std::string& username, const std::string& password) {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t user_id = 0;
    std::string hashed;
    {
        Statement st(db_, "SELECT id, hashed_password FROM users WHERE username = ?");
        st.bind(1, username);
        if (!st.step()) return std::nullopt;
        user_id = st.int64(0);
        hashed = st.text(1);
    }
    if (!verify_password(password, hashed)) return std::nullopt;

    int64_t now = epoch_now();
    {
        Statement st(db_, "DELETE FROM sessions WHERE expires_at <= ?");
        st.bind(1, now);
        st.step();
    }

    std::string token = random_token();
    Statement st(db_, "INSERT INTO sessions (token, user_id, expires_at) VALUES (?, ?, ?)");
    st.bind(1, token);
    st.bind(2, user_id);
    st.bind(3, now + static_cast<int64_t>(token_ttl_minutes_) * 60);
    st.step();
    return token;
}

std::optional<Session> TodoStore::session(const std::string& token) {
    if (token.empty()) return std::nullopt;
    std::lock_guard<std::mutex> lock(mutex_);

    Statement st(db_,
        "SELECT u.id, u.username, u.email, u.created_at, s.expires_at "
        "FROM sessions s JOIN users u ON u.id = s.user_id "
        "WHERE s.token = ? AND s.expires_at > ?");
    st.bind(1, token);
    st.bind(2, epoch_now());
    if (!st.step()) return std::nullopt;

    Session s;
    s.user.id = st.int64(0);
    s.user.username = st.text(1);
    s.user.email = st.text(2);
    s.user.created_at = st.text(3);
    s.expires_at = st.int64(4);
    s.token = token;
    return s;
}

bool TodoStore::revoke_session(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_, "DELETE FROM sessions WHERE token = ?");
    st.bind(1, token);
    st.step();
    return sqlite3_changes(db_) > 0;
}

// ── Todos ───────────────────────────────────────────────────────────

std::optional<Todo> TodoStore::find_todo(int64_t user_id, int64_t todo_id) {
    std::string sql = std::string("SELECT ") + kTodoColumns + " FROM todos WHERE id = ? AND created_by = ?";
    Statement st(db_, sql.c_str());
    st.bind(1, todo_id);
    st.bind(2, user_id);
    if (!st.step()) return std::nullopt;
    return read_todo(st);
}

Todo TodoStore::create_todo(int64_t user_id, const TodoDraft& draft) {
    auto due = checked_due_date(draft.due_date);
    std::lock_guard<std::mutex> lock(mutex_);

    Statement st(db_,
        "INSERT INTO todos (name, description, creation_date, due_date, created_by, is_completed) "
        "VALUES (?, ?, ?, ?, ?, 0)");
    st.bind(1, draft.name);
    st.bind(2, draft.description);
    st.bind(3, iso_now_utc());
    st.bind(4, due);
    st.bind(5, user_id);
    st.step();

    auto created = find_todo(user_id, sqlite3_last_insert_rowid(db_));
    if (!created) throw std::runtime_error("Created todo vanished");
    return *created;
}

TodoPage TodoStore::list_todos(int64_t user_id, const TodoQuery& query) {
    if (query.page < 1) throw StoreError(422, "page must be >= 1");
    if (query.page_size < 1 || query.page_size > 100) throw StoreError(422, "page_size must be between 1 and 100");

    std::string where = " WHERE created_by = ?1";
    if (query.completed == "true") where += " AND is_completed = 1";
    else if (query.completed == "false") where += " AND is_completed = 0";
    if (!query.search.empty()) {
        where += " AND (name LIKE ?2 ESCAPE '\\' OR description LIKE ?2 ESCAPE '\\')";
    }

    std::string column = "creation_date";
    if (query.sort_by == "name" || query.sort_by == "due_date") column = query.sort_by;
    std::string order = query.sort_order == "asc" ? "ASC" : "DESC";

    std::lock_guard<std::mutex> lock(mutex_);
    TodoPage page;
    page.page = query.page;
    page.page_size = query.page_size;

    {
        std::string sql = "SELECT COUNT(*) FROM todos" + where;
        Statement st(db_, sql.c_str());
        st.bind(1, user_id);
        if (!query.search.empty()) st.bind(2, like_pattern(query.search));
        if (st.step()) page.total = st.int64(0);
    }

    std::string sql = std::string("SELECT ") + kTodoColumns + " FROM todos" + where +
                      " ORDER BY " + column + " " + order + ", id " + order + " LIMIT ?3 OFFSET ?4";
    Statement st(db_, sql.c_str());
    st.bind(1, user_id);
    if (!query.search.empty()) st.bind(2, like_pattern(query.search));
    st.bind(3, static_cast<int64_t>(query.page_size));
    st.bind(4, static_cast<int64_t>(query.page - 1) * query.page_size);
    while (st.step()) page.todos.push_back(read_todo(st));

    page.total_pages = page.total > 0 ? (page.total + query.page_size - 1) / query.page_size : 1;
    return page;
}

std::optional<Todo> TodoStore::get_todo(int64_t user_id, int64_t todo_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_todo(user_id, todo_id);
}

std::optional<Todo> TodoStore::update_todo(int64_t user_id, int64_t todo_id, const TodoUpdate& update) {
    std::optional<std::string> due;
    if (update.set_due_date) due = checked_due_date(update.due_date);

    std::lock_guard<std::mutex> lock(mutex_);
    auto todo = find_todo(user_id, todo_id);
    if (!todo) return std::nullopt;

    if (update.name) todo->name = *update.name;
    if (update.set_description) todo->description = update.description;
    if (update.set_due_date) todo->due_date = due;
    if (update.is_completed) {
        todo->is_completed = *update.is_completed;
        if (todo->is_completed) todo->completed_at = iso_now_utc();
        else todo->completed_at.reset();
    }

    Statement st(db_,
        "UPDATE todos SET name = ?, description = ?, due_date = ?, is_completed = ?, completed_at = ? "
        "WHERE id = ? AND created_by = ?");
    st.bind(1, todo->name);
    st.bind(2, todo->description);
    st.bind(3, todo->due_date);
    st.bind(4, static_cast<int64_t>(todo->is_completed ? 1 : 0));
    st.bind(5, todo->completed_at);
    st.bind(6, todo_id);
    st.bind(7, user_id);
    st.step();
    return todo;
}

std::optional<Todo> TodoStore::toggle_todo(int64_t user_id, int64_t todo_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto todo = find_todo(user_id, todo_id);
    if (!todo) return std::nullopt;

    todo->is_completed = !todo->is_completed;
    if (todo->is_completed) todo->completed_at = iso_now_utc();
    else todo->completed_at.reset();

    Statement st(db_, "UPDATE todos SET is_completed = ?, completed_at = ? WHERE id = ? AND created_by = ?");
    st.bind(1, static_cast<int64_t>(todo->is_completed ? 1 : 0));
    st.bind(2, todo->completed_at);
    st.bind(3, todo_id);
    st.bind(4, user_id);
    st.step();
    return todo;
}

bool TodoStore::delete_todo(int64_t user_id, int64_t todo_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_, "DELETE FROM todos WHERE id = ? AND created_by = ?");
    st.bind(1, todo_id);
    st.bind(2, user_id);
    st.step();
    return sqlite3_changes(db_) > 0;
}

} // namespace todochat
