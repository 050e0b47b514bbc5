#pragma once
#include "config.hpp"
#include "credential.hpp"
#include "protocol.hpp"
#include "tool_invoker.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/types.h>

namespace todochat {

enum class ChannelErrorKind {
    handshake_timeout,
    process_exited,
    call_timeout,
    protocol_violation,
    spawn_failed,
    cancelled
};

const char* channel_error_kind_name(ChannelErrorKind kind);

class ChannelError : public std::runtime_error {
public:
    ChannelError(ChannelErrorKind kind, const std::string& message, std::string raw = "")
        : std::runtime_error(message), kind_(kind), raw_(std::move(raw)) {}

    ChannelErrorKind kind() const { return kind_; }
    // Offending bytes, kept for diagnostics only
    const std::string& raw() const { return raw_; }

private:
    ChannelErrorKind kind_;
    std::string raw_;
};

// Owns one tool process for one orchestration run: spawn, handshake,
// correlated calls, and termination. Not copyable, never shared.
class ToolChannel : public ToolInvoker {
public:
    explicit ToolChannel(ToolProcessConfig cfg);
    ~ToolChannel() override;

    ToolChannel(const ToolChannel&) = delete;
    ToolChannel& operator=(const ToolChannel&) = delete;

    // Spawns the process with the credential in its environment and performs
    // the init/capabilities handshake. Throws ChannelError.
    void open(const Credential& credential, const RunControl& control = {});

    ToolCallResult call(const ToolCallRequest& req, const RunControl& control) override;

    // Closes stdin, waits for the grace interval (skipped when `immediate`),
    // then kills and reaps. Safe to call more than once.
    void close(bool immediate = false);

    pid_t pid() const { return pid_; }
    bool usable() const { return usable_; }
    bool closed() const { return closed_; }
    // Raw waitpid status once the process has been reaped
    std::optional<int> exit_status() const { return exit_status_; }
    const std::vector<std::string>& advertised_tools() const { return advertised_; }

private:
    ToolProcessConfig cfg_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    bool opened_ = false;
    bool usable_ = false;
    bool closed_ = false;
    std::optional<int> exit_status_;
    LineBuffer buffer_;
    std::vector<std::string> advertised_;

    void spawn(const Credential& credential);
    void write_frame(const Frame& frame);
    std::string read_line(int timeout_ms, const RunControl& control, ChannelErrorKind timeout_kind);
    [[noreturn]] void fail(ChannelErrorKind kind, const std::string& message, const std::string& raw = "");
};

// Executable used for the tool process: the configured command, else
// todochat-tools next to the running binary, else whatever PATH finds.
std::string resolve_tools_command(const ToolProcessConfig& cfg);

} // namespace todochat
