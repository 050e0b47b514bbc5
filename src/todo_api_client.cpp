#include "todo_api_client.hpp"
#include <memory>

namespace todochat {

TodoApiClient::TodoApiClient(const std::string& base_url, std::string token, int timeout_sec)
    : url_(parse_url(base_url)), token_(std::move(token)), timeout_sec_(timeout_sec) {}

std::unique_ptr<httplib::Client> TodoApiClient::make_client() const {
    auto cli = std::make_unique<httplib::Client>(url_.origin());
    cli->set_connection_timeout(timeout_sec_);
    cli->set_read_timeout(timeout_sec_);
    cli->set_write_timeout(timeout_sec_);
    return cli;
}

httplib::Headers TodoApiClient::headers() const {
    return {
        {"Authorization", "Bearer " + token_},
        {"Accept", "application/json"}
    };
}

std::string TodoApiClient::todo_path(int64_t id) const {
    return url_.path_prefix + "/api/todos/" + std::to_string(id);
}

ApiResponse TodoApiClient::wrap(const httplib::Result& res) {
    ApiResponse out;
    if (!res) {
        out.body = "connection error: " + httplib::to_string(res.error());
        return out;
    }
    out.status = res->status;
    out.body = res->body;
    return out;
}

ApiResponse TodoApiClient::create_todo(const nlohmann::json& body) {
    auto cli = make_client();
    return wrap(cli->Post(url_.path_prefix + "/api/todos", headers(), body.dump(), "application/json"));
}

ApiResponse TodoApiClient::list_todos(const ListQuery& query) {
    httplib::Params params;
    if (!query.search.empty()) params.emplace("search", query.search);
    if (!query.sort_by.empty()) params.emplace("sort_by", query.sort_by);
    if (!query.sort_order.empty()) params.emplace("sort_order", query.sort_order);

    auto cli = make_client();
    return wrap(cli->Get(url_.path_prefix + "/api/todos", params, headers()));
}

ApiResponse TodoApiClient::get_todo(int64_t id) {
    auto cli = make_client();
    return wrap(cli->Get(todo_path(id), headers()));
}

ApiResponse TodoApiClient::update_todo(int64_t id, const nlohmann::json& body) {
    auto cli = make_client();
    return wrap(cli->Put(todo_path(id), headers(), body.dump(), "application/json"));
}

ApiResponse TodoApiClient::delete_todo(int64_t id) {
    auto cli = make_client();
    return wrap(cli->Delete(todo_path(id), headers()));
}

ApiResponse TodoApiClient::toggle_todo_complete(int64_t id) {
    auto cli = make_client();
    return wrap(cli->Patch(todo_path(id) + "/toggle-complete", headers(), std::string(), "application/json"));
}

} // namespace todochat
