#pragma once
#include <string>
#include <optional>
#include <stdexcept>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace todochat {

// ── Tool protocol ───────────────────────────────────────────────────
// One JSON object per line: {"kind": ..., "id": ..., "payload": ...}.
// "id" is mandatory on call/result/error frames; an error frame without an
// id is a process-level diagnostic (e.g. a startup failure).

inline constexpr const char* kProtocolVersion = "1";
inline constexpr size_t kMaxFrameBytes = 1 << 20;

enum class FrameKind { init, capabilities, call, result, error };

const char* frame_kind_name(FrameKind kind);
std::optional<FrameKind> parse_frame_kind(const std::string& name);

struct Frame {
    FrameKind kind = FrameKind::error;
    std::string id;
    nlohmann::json payload = nlohmann::json::object();
};

class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Serialized frame including the trailing newline
std::string encode_frame(const Frame& frame);

// Throws ProtocolError on anything that is not a well-formed frame
Frame decode_frame(const std::string& line);

// ── Tool-level outcomes ─────────────────────────────────────────────

enum class ToolErrorKind { unknown_tool, invalid_arguments, not_found, unauthorized, upstream_failure };

const char* tool_error_kind_name(ToolErrorKind kind);
std::optional<ToolErrorKind> parse_tool_error_kind(const std::string& name);

struct ToolError {
    ToolErrorKind kind = ToolErrorKind::upstream_failure;
    std::string message;
    std::string field;   // offending argument for invalid_arguments
    int status = 0;      // upstream HTTP status for upstream_failure (0 = transport)

    nlohmann::json to_json() const;
    static ToolError from_json(const nlohmann::json& j);
};

struct ToolCallRequest {
    std::string id;
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct ToolCallResult {
    std::string id;
    nlohmann::json payload;
    std::optional<ToolError> error;

    bool ok() const { return !error.has_value(); }

    static ToolCallResult success(std::string id, nlohmann::json payload);
    static ToolCallResult failure(std::string id, ToolError error);

    // Text appended to the transcript as the observation for this call
    std::string observation() const;
};

Frame make_call_frame(const ToolCallRequest& req);
Frame make_result_frame(const ToolCallResult& result);

// Accepts result and error frames; throws ProtocolError otherwise
ToolCallResult result_from_frame(const Frame& frame);

// Splits a byte stream into frame lines. Throws ProtocolError once a
// pending line grows past kMaxFrameBytes.
class LineBuffer {
public:
    void append(const char* data, size_t len);
    std::optional<std::string> next_line();
    size_t pending() const { return buf_.size(); }
    std::string head(size_t n) const { return buf_.substr(0, n); }
    // Unterminated remainder, for diagnostics once the stream has ended
    std::string drain() { std::string rest; rest.swap(buf_); return rest; }

private:
    std::string buf_;
};

} // namespace todochat
