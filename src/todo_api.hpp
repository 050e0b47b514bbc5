#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace todochat {

struct ApiResponse {
    int status = 0;          // 0 = transport failure, no HTTP response
    std::string body;        // raw body, or the transport error text
    bool ok() const { return status >= 200 && status < 300; }
};

struct ListQuery {
    std::string search;
    std::string sort_by = "creation_date";
    std::string sort_order = "desc";
};

// The six upstream operations of the todo store. One call is one round trip.
class TodoApi {
public:
    virtual ~TodoApi() = default;
    virtual ApiResponse create_todo(const nlohmann::json& body) = 0;
    virtual ApiResponse list_todos(const ListQuery& query) = 0;
    virtual ApiResponse get_todo(int64_t id) = 0;
    virtual ApiResponse update_todo(int64_t id, const nlohmann::json& body) = 0;
    virtual ApiResponse delete_todo(int64_t id) = 0;
    virtual ApiResponse toggle_todo_complete(int64_t id) = 0;
};

} // namespace todochat
