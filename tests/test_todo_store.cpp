#include <gtest/gtest.h>
#include "store/todo_store.hpp"
#include <functional>
#include <thread>

using namespace todochat;

class TodoStoreTest : public ::testing::Test {
protected:
    TodoStore store{":memory:"};
    User alice;
    User bob;

    void SetUp() override {
        alice = store.register_user("alice", "alice@example.com", "wonderland");
        bob = store.register_user("bob", "bob@example.com", "builder");
    }

    Todo add(const User& u, const std::string& name, std::optional<std::string> due = std::nullopt) {
        TodoDraft d;
        d.name = name;
        d.due_date = std::move(due);
        return store.create_todo(u.id, d);
    }

    static int status_of(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const StoreError& e) {
            return e.status();
        }
        return 0;
    }
};

TEST_F(TodoStoreTest, DuplicateRegistrationIsRejected) {
    EXPECT_EQ(status_of([&] { store.register_user("alice", "other@example.com", "x"); }), 400);
    EXPECT_EQ(status_of([&] { store.register_user("carol", "alice@example.com", "x"); }), 400);
    try {
        store.register_user("alice", "new@example.com", "x");
    } catch (const StoreError& e) {
        EXPECT_STREQ(e.what(), "Username already registered");
    }
}

TEST_F(TodoStoreTest, InvalidRegistrationIs422) {
    EXPECT_EQ(status_of([&] { store.register_user("", "e@example.com", "x"); }), 422);
    EXPECT_EQ(status_of([&] { store.register_user("dave", "not-an-email", "x"); }), 422);
    EXPECT_EQ(status_of([&] { store.register_user("dave", "d@example.com", ""); }), 422);
}

TEST_F(TodoStoreTest, LoginIssuesSession) {
    auto token = store.login("alice", "wonderland");
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->size(), 64u);

    auto session = store.session(*token);
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->user.username, "alice");
    EXPECT_GT(session->expires_at, 0);

    EXPECT_FALSE(store.login("alice", "wrong").has_value());
    EXPECT_FALSE(store.login("nobody", "wonderland").has_value());
    EXPECT_FALSE(store.session("made-up").has_value());
    EXPECT_FALSE(store.session("").has_value());
}

TEST_F(TodoStoreTest, RevokedSessionIsGone) {
    auto token = store.login("alice", "wonderland");
    ASSERT_TRUE(token.has_value());
    EXPECT_TRUE(store.revoke_session(*token));
    EXPECT_FALSE(store.session(*token).has_value());
    EXPECT_FALSE(store.revoke_session(*token));
}

TEST_F(TodoStoreTest, ZeroTtlSessionsExpireAtOnce) {
    TodoStore short_lived(":memory:", 0);
    short_lived.register_user("eve", "eve@example.com", "pw");
    auto token = short_lived.login("eve", "pw");
    ASSERT_TRUE(token.has_value());
    EXPECT_FALSE(short_lived.session(*token).has_value());
}

TEST_F(TodoStoreTest, CreateNormalizesDueDate) {
    auto todo = add(alice, "Buy milk", std::string("2026-10-20"));
    EXPECT_GT(todo.id, 0);
    EXPECT_EQ(todo.name, "Buy milk");
    EXPECT_EQ(todo.due_date.value_or(""), "2026-10-20T10:00:00");
    EXPECT_FALSE(todo.is_completed);
    EXPECT_FALSE(todo.description.has_value());
    EXPECT_EQ(todo.created_by, alice.id);

    auto j = todo.to_json();
    EXPECT_TRUE(j["description"].is_null());
    EXPECT_TRUE(j["completed_at"].is_null());

    EXPECT_EQ(status_of([&] { add(alice, "Bad", std::string("someday")); }), 422);
}

TEST_F(TodoStoreTest, TodosAreScopedToOwner) {
    auto todo = add(alice, "Secret plan");
    EXPECT_FALSE(store.get_todo(bob.id, todo.id).has_value());
    EXPECT_FALSE(store.toggle_todo(bob.id, todo.id).has_value());
    EXPECT_FALSE(store.delete_todo(bob.id, todo.id));
    EXPECT_EQ(store.list_todos(bob.id, {}).total, 0);
    EXPECT_TRUE(store.get_todo(alice.id, todo.id).has_value());
}

TEST_F(TodoStoreTest, ToggleFlipsTwice) {
    auto todo = add(alice, "Buy milk");
    auto once = store.toggle_todo(alice.id, todo.id);
    ASSERT_TRUE(once.has_value());
    EXPECT_TRUE(once->is_completed);
    EXPECT_TRUE(once->completed_at.has_value());

    auto twice = store.toggle_todo(alice.id, todo.id);
    ASSERT_TRUE(twice.has_value());
    EXPECT_FALSE(twice->is_completed);
    EXPECT_FALSE(twice->completed_at.has_value());
}

TEST_F(TodoStoreTest, UpdateWritesOnlySetFields) {
    TodoDraft d;
    d.name = "Call mom";
    d.description = "about the weekend";
    d.due_date = "2026-10-21T18:00:00";
    auto todo = store.create_todo(alice.id, d);

    TodoUpdate rename;
    rename.name = "Call mum";
    auto updated = store.update_todo(alice.id, todo.id, rename);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->name, "Call mum");
    EXPECT_EQ(updated->description.value_or(""), "about the weekend");
    EXPECT_EQ(updated->due_date.value_or(""), "2026-10-21T18:00:00");

    TodoUpdate clear;
    clear.set_description = true;
    clear.is_completed = true;
    updated = store.update_todo(alice.id, todo.id, clear);
    ASSERT_TRUE(updated.has_value());
    EXPECT_FALSE(updated->description.has_value());
    EXPECT_TRUE(updated->is_completed);

    auto reread = store.get_todo(alice.id, todo.id);
    ASSERT_TRUE(reread.has_value());
    EXPECT_FALSE(reread->description.has_value());
    EXPECT_TRUE(reread->is_completed);

    EXPECT_FALSE(store.update_todo(alice.id, 999, rename).has_value());
}

TEST_F(TodoStoreTest, DeleteMissingIsFalse) {
    auto todo = add(alice, "Temp");
    EXPECT_TRUE(store.delete_todo(alice.id, todo.id));
    EXPECT_FALSE(store.delete_todo(alice.id, todo.id));
    EXPECT_FALSE(store.delete_todo(alice.id, 999));
}

TEST_F(TodoStoreTest, ListSearchesAndSorts) {
    add(alice, "Buy milk", std::string("2026-10-22"));
    add(alice, "Walk dog", std::string("2026-10-20"));
    add(alice, "Buy bread", std::string("2026-10-21"));

    TodoQuery q;
    q.search = "buy";
    auto page = store.list_todos(alice.id, q);
    EXPECT_EQ(page.total, 2);

    q.search.clear();
    q.sort_by = "due_date";
    q.sort_order = "asc";
    page = store.list_todos(alice.id, q);
    ASSERT_EQ(page.todos.size(), 3u);
    EXPECT_EQ(page.todos[0].name, "Walk dog");
    EXPECT_EQ(page.todos[2].name, "Buy milk");

    q.sort_by = "name";
    page = store.list_todos(alice.id, q);
    EXPECT_EQ(page.todos[0].name, "Buy bread");
}

TEST_F(TodoStoreTest, SearchTreatsWildcardsLiterally) {
    add(alice, "100% done");
    add(alice, "1000 things");
    TodoQuery q;
    q.search = "100%";
    EXPECT_EQ(store.list_todos(alice.id, q).total, 1);
}

TEST_F(TodoStoreTest, ListPaginatesAndFilters) {
    for (int i = 0; i < 12; i++) add(alice, "Item " + std::to_string(i));
    auto first = add(alice, "Done one");
    store.toggle_todo(alice.id, first.id);

    TodoQuery q;
    q.page_size = 5;
    q.page = 3;
    auto page = store.list_todos(alice.id, q);
    EXPECT_EQ(page.total, 13);
    EXPECT_EQ(page.total_pages, 3);
    EXPECT_EQ(page.todos.size(), 3u);

    q.page = 1;
    q.completed = "true";
    page = store.list_todos(alice.id, q);
    EXPECT_EQ(page.total, 1);

    q.page_size = 101;
    EXPECT_EQ(status_of([&] { store.list_todos(alice.id, q); }), 422);
    q.page_size = 10;
    q.page = 0;
    EXPECT_EQ(status_of([&] { store.list_todos(alice.id, q); }), 422);
}

TEST_F(TodoStoreTest, ConcurrentWritersAreSerialized) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < 10; i++) add(alice, "t" + std::to_string(t) + "-" + std::to_string(i));
        });
    }
    for (auto& th : threads) th.join();
    TodoQuery q;
    q.page_size = 100;
    EXPECT_EQ(store.list_todos(alice.id, q).total, 40);
}
