#include "tool_server.hpp"
#include "tool_spec.hpp"
#include "todo_api_client.hpp"
#include "credential.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

namespace todochat {

static std::string upstream_detail(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        if (j.is_object()) {
            for (auto key : {"detail", "error", "message"}) {
                if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
            }
        }
    } catch (const nlohmann::json::parse_error&) {
        // plain-text body
    }
    return body.substr(0, 500);
}

ToolCallResult map_api_response(const std::string& id, const ApiResponse& resp) {
    if (resp.ok()) {
        nlohmann::json payload = nlohmann::json::object();
        if (!resp.body.empty()) {
            try {
                payload = nlohmann::json::parse(resp.body);
            } catch (const nlohmann::json::parse_error&) {
                payload = resp.body;
            }
        }
        return ToolCallResult::success(id, std::move(payload));
    }

    ToolError err;
    err.status = resp.status;
    if (resp.status == 404) {
        err.kind = ToolErrorKind::not_found;
        err.message = upstream_detail(resp.body);
        if (err.message.empty()) err.message = "Todo not found";
    } else if (resp.status == 401 || resp.status == 403) {
        err.kind = ToolErrorKind::unauthorized;
        err.message = "The todo service rejected the credential (" + std::to_string(resp.status) +
                      "); the user needs to log in again";
    } else if (resp.status == 0) {
        err.kind = ToolErrorKind::upstream_failure;
        err.message = "Todo service unreachable: " + resp.body;
    } else {
        err.kind = ToolErrorKind::upstream_failure;
        err.message = "Todo service returned " + std::to_string(resp.status) + ": " + upstream_detail(resp.body);
    }
    return ToolCallResult::failure(id, std::move(err));
}

Frame ToolServer::capabilities_frame() {
    Frame f;
    f.kind = FrameKind::capabilities;
    nlohmann::json tools = nlohmann::json::array();
    for (auto& spec : tool_specs()) tools.push_back(spec.to_json());
    f.payload = {
        {"protocol_version", kProtocolVersion},
        {"server", {{"name", "todochat-tools"}, {"version", "1.0"}}},
        {"tools", std::move(tools)}
    };
    return f;
}

ToolCallResult ToolServer::execute(const std::string& id, const std::string& tool, const nlohmann::json& args) {
    if (tool == "create_todo") {
        return map_api_response(id, api_.create_todo(args));
    }
    if (tool == "list_todos") {
        ListQuery q;
        q.search = args.value("search", "");
        q.sort_by = args.value("sort_by", q.sort_by);
        q.sort_order = args.value("sort_order", q.sort_order);
        return map_api_response(id, api_.list_todos(q));
    }

    int64_t todo_id = args.at("todo_id").get<int64_t>();
    if (tool == "get_todo") return map_api_response(id, api_.get_todo(todo_id));
    if (tool == "delete_todo") return map_api_response(id, api_.delete_todo(todo_id));
    if (tool == "toggle_todo_complete") return map_api_response(id, api_.toggle_todo_complete(todo_id));
    if (tool == "update_todo") {
        nlohmann::json body = args;
        body.erase("todo_id");
        return map_api_response(id, api_.update_todo(todo_id, body));
    }

    // validate_tool_call already rejected anything outside the table
    ToolError err;
    err.kind = ToolErrorKind::unknown_tool;
    err.message = "Unknown tool: " + tool;
    return ToolCallResult::failure(id, std::move(err));
}

ToolCallResult ToolServer::dispatch(const ToolCallRequest& req) {
    nlohmann::json args;
    if (auto err = validate_tool_call(req.name, req.arguments, &args)) {
        std::cerr << "[tools] Rejected " << req.name << " (" << req.id << "): " << err->message << "\n";
        return ToolCallResult::failure(req.id, std::move(*err));
    }

    auto result = execute(req.id, req.name, args);
    if (result.ok()) {
        std::cerr << "[tools] " << req.name << " (" << req.id << ") ok\n";
    } else {
        std::cerr << "[tools] " << req.name << " (" << req.id << ") "
                  << tool_error_kind_name(result.error->kind) << "\n";
    }
    return result;
}

Frame ToolServer::handle(const Frame& frame) {
    switch (frame.kind) {
    case FrameKind::init:
        initialized_ = true;
        return capabilities_frame();

    case FrameKind::call: {
        ToolCallRequest req;
        req.id = frame.id;
        if (!frame.payload.is_object() || !frame.payload.contains("tool") || !frame.payload["tool"].is_string()) {
            std::cerr << "[tools] Call without a tool name (" << req.id << ")\n";
            ToolError err;
            err.kind = ToolErrorKind::invalid_arguments;
            err.field = "tool";
            err.message = "call payload must be an object naming a tool";
            return make_result_frame(ToolCallResult::failure(req.id, std::move(err)));
        }
        req.name = frame.payload["tool"].get<std::string>();
        if (frame.payload.contains("arguments")) req.arguments = frame.payload["arguments"];
        if (!initialized_) {
            std::cerr << "[tools] Call before init frame (" << req.id << ")\n";
        }
        return make_result_frame(dispatch(req));
    }

    default: {
        Frame err;
        err.kind = FrameKind::error;
        err.id = frame.id;
        ToolError e;
        e.kind = ToolErrorKind::invalid_arguments;
        e.message = std::string("unexpected frame kind: ") + frame_kind_name(frame.kind);
        err.payload = e.to_json();
        return err;
    }
    }
}

int ToolServer::serve(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        Frame response;
        try {
            response = handle(decode_frame(line));
        } catch (const ProtocolError& e) {
            std::cerr << "[tools] Malformed frame: " << e.what() << "\n";
            ToolError err;
            err.kind = ToolErrorKind::invalid_arguments;
            err.message = std::string("malformed frame: ") + e.what();
            response.kind = FrameKind::error;
            response.payload = err.to_json();
        }

        out << encode_frame(response) << std::flush;
        if (!out) {
            std::cerr << "[tools] Output closed, exiting\n";
            return 1;
        }
    }
    return 0;
}

static void write_startup_failure(std::ostream& out, ToolErrorKind kind, const std::string& message) {
    ToolError err;
    err.kind = kind;
    err.message = message;
    Frame f;
    f.kind = FrameKind::error;
    f.payload = err.to_json();
    out << encode_frame(f) << std::flush;
}

int run_tool_process(std::istream& in, std::ostream& out) {
    // Read exactly once; the identity is fixed for this process
    const char* token = std::getenv(kAuthTokenEnv);
    const char* base_url = std::getenv(kApiBaseUrlEnv);

    if (!token || !*token) {
        std::cerr << "[tools] " << kAuthTokenEnv << " is not set, refusing to start\n";
        write_startup_failure(out, ToolErrorKind::unauthorized,
                              std::string(kAuthTokenEnv) + " is not set");
        return 2;
    }
    if (!base_url || !*base_url) {
        std::cerr << "[tools] " << kApiBaseUrlEnv << " is not set, refusing to start\n";
        write_startup_failure(out, ToolErrorKind::invalid_arguments,
                              std::string(kApiBaseUrlEnv) + " is not set");
        return 2;
    }

    TodoApiClient client(base_url, token);
    ToolServer server(client);
    return server.serve(in, out);
}

} // namespace todochat
