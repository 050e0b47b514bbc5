#pragma once
#include "todo_store.hpp"
#include <httplib.h>
#include <optional>
#include <string>

namespace todochat {

// Token from "Authorization: Bearer <token>", empty when absent
std::string bearer_token(const httplib::Request& req);

// REST surface of the todo store: /api/auth/* and /api/todos*
void register_store_routes(httplib::Server& server, TodoStore& store);

} // namespace todochat
