#pragma once
#include "protocol.hpp"
#include "todo_api.hpp"
#include <istream>
#include <ostream>

namespace todochat {

// Server side of the tool protocol. Runs inside todochat-tools for the whole
// life of that process, under the single identity baked into its TodoApi.
class ToolServer {
public:
    explicit ToolServer(TodoApi& api) : api_(api) {}

    // Serves frames until EOF on `in`. Returns the process exit code.
    int serve(std::istream& in, std::ostream& out);

    // Response to one incoming frame
    Frame handle(const Frame& frame);

    // Validates and executes one call. Never throws for tool-level failures.
    ToolCallResult dispatch(const ToolCallRequest& req);

    static Frame capabilities_frame();

private:
    TodoApi& api_;
    bool initialized_ = false;

    ToolCallResult execute(const std::string& id, const std::string& tool, const nlohmann::json& args);
};

// Upstream HTTP outcome -> tool result. 2xx bodies pass through verbatim.
ToolCallResult map_api_response(const std::string& id, const ApiResponse& resp);

// Entry point of the tool process: reads the credential from the
// environment once, then serves stdin/stdout. Fails fast without it.
int run_tool_process(std::istream& in, std::ostream& out);

} // namespace todochat
