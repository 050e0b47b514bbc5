#include "protocol.hpp"

namespace todochat {

const char* frame_kind_name(FrameKind kind) {
    switch (kind) {
    case FrameKind::init:         return "init";
    case FrameKind::capabilities: return "capabilities";
    case FrameKind::call:         return "call";
    case FrameKind::result:       return "result";
    case FrameKind::error:        return "error";
    }
    return "error";
}

std::optional<FrameKind> parse_frame_kind(const std::string& name) {
    if (name == "init") return FrameKind::init;
    if (name == "capabilities") return FrameKind::capabilities;
    if (name == "call") return FrameKind::call;
    if (name == "result") return FrameKind::result;
    if (name == "error") return FrameKind::error;
    return std::nullopt;
}

std::string encode_frame(const Frame& frame) {
    nlohmann::json j;
    j["kind"] = frame_kind_name(frame.kind);
    if (!frame.id.empty()) j["id"] = frame.id;
    j["payload"] = frame.payload;
    // dump() escapes control characters, so the line never contains a raw '\n'
    return j.dump() + "\n";
}

Frame decode_frame(const std::string& line) {
    if (line.size() > kMaxFrameBytes) {
        throw ProtocolError("frame exceeds " + std::to_string(kMaxFrameBytes) + " bytes");
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProtocolError(std::string("frame is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) throw ProtocolError("frame is not a JSON object");

    if (!j.contains("kind") || !j["kind"].is_string()) {
        throw ProtocolError("frame has no kind");
    }
    auto kind = parse_frame_kind(j["kind"].get<std::string>());
    if (!kind) throw ProtocolError("unknown frame kind: " + j["kind"].get<std::string>());

    Frame f;
    f.kind = *kind;
    if (j.contains("id")) {
        if (!j["id"].is_string()) throw ProtocolError("frame id must be a string");
        f.id = j["id"].get<std::string>();
    }
    if (f.id.empty() && (f.kind == FrameKind::call || f.kind == FrameKind::result)) {
        throw ProtocolError(std::string(frame_kind_name(f.kind)) + " frame without id");
    }
    if (j.contains("payload")) f.payload = j["payload"];
    return f;
}

// ── Tool errors ─────────────────────────────────────────────────────

const char* tool_error_kind_name(ToolErrorKind kind) {
    switch (kind) {
    case ToolErrorKind::unknown_tool:      return "UnknownTool";
    case ToolErrorKind::invalid_arguments: return "InvalidArguments";
    case ToolErrorKind::not_found:         return "NotFound";
    case ToolErrorKind::unauthorized:      return "Unauthorized";
    case ToolErrorKind::upstream_failure:  return "UpstreamFailure";
    }
    return "UpstreamFailure";
}

std::optional<ToolErrorKind> parse_tool_error_kind(const std::string& name) {
    if (name == "UnknownTool") return ToolErrorKind::unknown_tool;
    if (name == "InvalidArguments") return ToolErrorKind::invalid_arguments;
    if (name == "NotFound") return ToolErrorKind::not_found;
    if (name == "Unauthorized") return ToolErrorKind::unauthorized;
    if (name == "UpstreamFailure") return ToolErrorKind::upstream_failure;
    return std::nullopt;
}

nlohmann::json ToolError::to_json() const {
    nlohmann::json j;
    j["kind"] = tool_error_kind_name(kind);
    j["message"] = message;
    if (!field.empty()) j["field"] = field;
    if (kind == ToolErrorKind::upstream_failure) j["status"] = status;
    return j;
}

ToolError ToolError::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("kind") || !j["kind"].is_string()) {
        throw ProtocolError("error payload has no kind");
    }
    auto kind = parse_tool_error_kind(j["kind"].get<std::string>());
    if (!kind) throw ProtocolError("unknown error kind: " + j["kind"].get<std::string>());

    ToolError e;
    e.kind = *kind;
    if (j.contains("message") && j["message"].is_string()) e.message = j["message"].get<std::string>();
    if (j.contains("field") && j["field"].is_string()) e.field = j["field"].get<std::string>();
    if (j.contains("status") && j["status"].is_number_integer()) e.status = j["status"].get<int>();
    return e;
}

// ── Calls and results ───────────────────────────────────────────────

ToolCallResult ToolCallResult::success(std::string id, nlohmann::json payload) {
    ToolCallResult r;
    r.id = std::move(id);
    r.payload = std::move(payload);
    return r;
}

ToolCallResult ToolCallResult::failure(std::string id, ToolError error) {
    ToolCallResult r;
    r.id = std::move(id);
    r.error = std::move(error);
    return r;
}

std::string ToolCallResult::observation() const {
    if (error) return nlohmann::json{{"error", error->to_json()}}.dump();
    return payload.dump();
}

Frame make_call_frame(const ToolCallRequest& req) {
    Frame f;
    f.kind = FrameKind::call;
    f.id = req.id;
    f.payload = {{"tool", req.name}, {"arguments", req.arguments}};
    return f;
}

Frame make_result_frame(const ToolCallResult& result) {
    Frame f;
    f.id = result.id;
    if (result.error) {
        f.kind = FrameKind::error;
        f.payload = result.error->to_json();
    } else {
        f.kind = FrameKind::result;
        f.payload = result.payload;
    }
    return f;
}

ToolCallResult result_from_frame(const Frame& frame) {
    if (frame.kind == FrameKind::result) {
        return ToolCallResult::success(frame.id, frame.payload);
    }
    if (frame.kind == FrameKind::error) {
        if (frame.id.empty()) throw ProtocolError("uncorrelated error frame");
        return ToolCallResult::failure(frame.id, ToolError::from_json(frame.payload));
    }
    throw ProtocolError(std::string("expected result or error frame, got ") + frame_kind_name(frame.kind));
}

// ── Line splitting ──────────────────────────────────────────────────

void LineBuffer::append(const char* data, size_t len) {
    buf_.append(data, len);
}

std::optional<std::string> LineBuffer::next_line() {
    size_t nl = buf_.find('\n');
    if (nl == std::string::npos) {
        if (buf_.size() > kMaxFrameBytes) {
            throw ProtocolError("frame exceeds " + std::to_string(kMaxFrameBytes) + " bytes");
        }
        return std::nullopt;
    }
    std::string line = buf_.substr(0, nl);
    buf_.erase(0, nl + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

} // namespace todochat
