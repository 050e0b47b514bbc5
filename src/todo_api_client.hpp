#pragma once
#include "todo_api.hpp"
#include "utils.hpp"
#include <httplib.h>
#include <memory>
#include <string>

namespace todochat {

// Bearer-authenticated HTTP client for the todo store's REST surface
class TodoApiClient : public TodoApi {
public:
    TodoApiClient(const std::string& base_url, std::string token, int timeout_sec = 10);

    ApiResponse create_todo(const nlohmann::json& body) override;
    ApiResponse list_todos(const ListQuery& query) override;
    ApiResponse get_todo(int64_t id) override;
    ApiResponse update_todo(int64_t id, const nlohmann::json& body) override;
    ApiResponse delete_todo(int64_t id) override;
    ApiResponse toggle_todo_complete(int64_t id) override;

private:
    UrlParts url_;
    std::string token_;
    int timeout_sec_;

    std::unique_ptr<httplib::Client> make_client() const;
    httplib::Headers headers() const;
    std::string todo_path(int64_t id) const;
    static ApiResponse wrap(const httplib::Result& res);
};

} // namespace todochat
