#include "tool_channel.hpp"
#include "tool_spec.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <mutex>
#include <set>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace todochat {

using Clock = std::chrono::steady_clock;

// Oversized frames are kept only this far in ChannelError::raw()
static constexpr size_t kRawExcerptBytes = 256;

const char* channel_error_kind_name(ChannelErrorKind kind) {
    switch (kind) {
    case ChannelErrorKind::handshake_timeout:  return "HandshakeTimeout";
    case ChannelErrorKind::process_exited:     return "ProcessExited";
    case ChannelErrorKind::call_timeout:       return "CallTimeout";
    case ChannelErrorKind::protocol_violation: return "ProtocolViolation";
    case ChannelErrorKind::spawn_failed:       return "SpawnFailed";
    case ChannelErrorKind::cancelled:          return "Cancelled";
    }
    return "ProtocolViolation";
}

std::string resolve_tools_command(const ToolProcessConfig& cfg) {
    if (!cfg.command.empty()) return expand_path(cfg.command);

    std::error_code ec;
    auto self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        auto sibling = self.parent_path() / "todochat-tools";
        if (fs::exists(sibling, ec)) return sibling.string();
    }
    return "todochat-tools";
}

static void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

static bool is_channel_env(const char* entry) {
    for (auto name : {kAuthTokenEnv, kApiBaseUrlEnv}) {
        size_t n = std::strlen(name);
        if (std::strncmp(entry, name, n) == 0 && entry[n] == '=') return true;
    }
    return false;
}

ToolChannel::ToolChannel(ToolProcessConfig cfg) : cfg_(std::move(cfg)) {}

ToolChannel::~ToolChannel() {
    close(!usable_);
}

void ToolChannel::fail(ChannelErrorKind kind, const std::string& message, const std::string& raw) {
    usable_ = false;
    std::cerr << "[channel] " << channel_error_kind_name(kind) << " (pid " << pid_ << "): " << message << "\n";
    throw ChannelError(kind, message, raw);
}

// ── Spawn ───────────────────────────────────────────────────────────

void ToolChannel::spawn(const Credential& credential) {
    ignore_sigpipe_once();

    std::string command = resolve_tools_command(cfg_);

    // Everything the child needs is built before fork; after fork the child
    // only calls dup2/exec/write/_exit.
    std::vector<std::string> argv_store;
    argv_store.push_back(command);
    for (auto& a : cfg_.args) argv_store.push_back(a);

    std::vector<std::string> env_store;
    for (char** e = environ; e && *e; ++e) {
        if (is_channel_env(*e)) continue;
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && cfg_.env.count(entry.substr(0, eq))) continue;
        env_store.push_back(std::move(entry));
    }
    for (auto& [k, v] : cfg_.env) {
        if (k == kAuthTokenEnv || k == kApiBaseUrlEnv) continue;
        env_store.push_back(k + "=" + v);
    }
    env_store.push_back(std::string(kAuthTokenEnv) + "=" + credential.token);
    env_store.push_back(std::string(kApiBaseUrlEnv) + "=" + credential.base_url);

    std::vector<char*> argv;
    for (auto& s : argv_store) argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (auto& s : env_store) envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);

    int pipe_stdin[2] = {-1, -1};
    int pipe_stdout[2] = {-1, -1};
    int pipe_status[2] = {-1, -1};
    auto close_all = [&] {
        for (int fd : {pipe_stdin[0], pipe_stdin[1], pipe_stdout[0], pipe_stdout[1], pipe_status[0], pipe_status[1]}) {
            if (fd >= 0) ::close(fd);
        }
    };

    if (pipe2(pipe_stdin, O_CLOEXEC) != 0 || pipe2(pipe_stdout, O_CLOEXEC) != 0 ||
        pipe2(pipe_status, O_CLOEXEC) != 0) {
        int err = errno;
        close_all();
        fail(ChannelErrorKind::spawn_failed, std::string("Failed to create pipes: ") + std::strerror(err));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        fail(ChannelErrorKind::spawn_failed, std::string("Fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child: stdin/stdout become the pipes, stderr stays inherited
        if (dup2(pipe_stdin[0], STDIN_FILENO) < 0 || dup2(pipe_stdout[1], STDOUT_FILENO) < 0) {
            int err = errno;
            ssize_t w = write(pipe_status[1], &err, sizeof(err));
            (void)w;
            _exit(127);
        }
        execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        ssize_t w = write(pipe_status[1], &err, sizeof(err));
        (void)w;
        _exit(127);
    }

    // Parent
    ::close(pipe_stdin[0]);
    ::close(pipe_stdout[1]);
    ::close(pipe_status[1]);

    // The status pipe closes on successful exec; otherwise it carries errno
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(pipe_status[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(pipe_status[0]);

    if (n > 0) {
        ::close(pipe_stdin[1]);
        ::close(pipe_stdout[0]);
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        fail(ChannelErrorKind::spawn_failed,
             "Cannot execute " + command + ": " + std::strerror(child_errno));
    }

    pid_ = pid;
    stdin_fd_ = pipe_stdin[1];
    stdout_fd_ = pipe_stdout[0];
    std::cerr << "[channel] Started tool process " << command << " (pid " << pid_ << ")\n";
}

// ── Framing over the pipes ──────────────────────────────────────────

void ToolChannel::write_frame(const Frame& frame) {
    std::string line = encode_frame(frame);
    size_t total = 0;
    while (total < line.size()) {
        ssize_t n = write(stdin_fd_, line.data() + total, line.size() - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            fail(ChannelErrorKind::process_exited,
                 std::string("Tool process stopped reading: ") + std::strerror(err));
        }
        total += static_cast<size_t>(n);
    }
}

std::string ToolChannel::read_line(int timeout_ms, const RunControl& control, ChannelErrorKind timeout_kind) {
    auto limit = Clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        try {
            if (auto line = buffer_.next_line()) {
                if (line->empty()) continue;
                return *line;
            }
        } catch (const ProtocolError& e) {
            fail(ChannelErrorKind::protocol_violation, e.what(), buffer_.head(kRawExcerptBytes));
        }

        if (control.cancel_requested()) {
            fail(ChannelErrorKind::cancelled, "run cancelled");
        }
        auto now = Clock::now();
        if (now >= control.deadline) {
            fail(ChannelErrorKind::cancelled, "run deadline exceeded");
        }
        if (now >= limit) {
            fail(timeout_kind, "no response within " + std::to_string(timeout_ms) + "ms");
        }

        auto until = std::min(limit, control.deadline);
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(until - now).count();
        int slice = static_cast<int>(std::max<long long>(1, std::min<long long>(100, remaining)));

        struct pollfd pfd;
        pfd.fd = stdout_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ret = poll(&pfd, 1, slice);
        if (ret < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            fail(ChannelErrorKind::process_exited, std::string("poll failed: ") + std::strerror(err));
        }
        if (ret == 0) continue;

        char buf[4096];
        ssize_t n = read(stdout_fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            int err = errno;
            fail(ChannelErrorKind::process_exited, std::string("read failed: ") + std::strerror(err));
        }
        if (n == 0) {
            fail(ChannelErrorKind::process_exited, "tool process closed its output", buffer_.drain());
        }
        buffer_.append(buf, static_cast<size_t>(n));
    }
}

// ── Lifecycle ───────────────────────────────────────────────────────

void ToolChannel::open(const Credential& credential, const RunControl& control) {
    if (opened_) throw std::logic_error("ToolChannel::open called twice");
    opened_ = true;
    if (credential.empty()) {
        fail(ChannelErrorKind::spawn_failed, "credential is missing a token or base address");
    }

    spawn(credential);
    usable_ = true;

    Frame init;
    init.kind = FrameKind::init;
    init.payload = {
        {"protocol_version", kProtocolVersion},
        {"client", {{"name", "todochat"}, {"version", "1.0"}}}
    };
    write_frame(init);

    std::string line = read_line(cfg_.handshake_timeout_ms, control, ChannelErrorKind::handshake_timeout);

    Frame reply;
    try {
        reply = decode_frame(line);
    } catch (const ProtocolError& e) {
        fail(ChannelErrorKind::protocol_violation, std::string("bad handshake reply: ") + e.what(), line);
    }

    if (reply.kind == FrameKind::error && reply.id.empty()) {
        if (!reply.payload.is_object()) {
            fail(ChannelErrorKind::protocol_violation, "startup error frame without an object payload", line);
        }
        // Startup diagnostic; the process exits right after writing it
        std::string reason = "unknown reason";
        if (reply.payload.contains("message") && reply.payload["message"].is_string()) {
            reason = reply.payload["message"].get<std::string>();
        }
        fail(ChannelErrorKind::process_exited, "tool process refused to start: " + reason, line);
    }
    if (reply.kind != FrameKind::capabilities) {
        fail(ChannelErrorKind::protocol_violation,
             std::string("expected capabilities, got ") + frame_kind_name(reply.kind), line);
    }

    std::set<std::string> offered;
    if (reply.payload.contains("tools") && reply.payload["tools"].is_array()) {
        for (auto& t : reply.payload["tools"]) {
            if (t.is_object() && t.contains("name") && t["name"].is_string()) {
                offered.insert(t["name"].get<std::string>());
            }
        }
    }
    for (auto& spec : tool_specs()) {
        if (!offered.count(spec.name)) {
            fail(ChannelErrorKind::protocol_violation, "tool process does not offer " + spec.name, line);
        }
    }
    advertised_.assign(offered.begin(), offered.end());
}

ToolCallResult ToolChannel::call(const ToolCallRequest& req, const RunControl& control) {
    if (!usable_) {
        throw ChannelError(ChannelErrorKind::protocol_violation, "channel is not usable");
    }

    write_frame(make_call_frame(req));
    std::string line = read_line(cfg_.call_timeout_ms, control, ChannelErrorKind::call_timeout);

    Frame reply;
    try {
        reply = decode_frame(line);
    } catch (const ProtocolError& e) {
        fail(ChannelErrorKind::protocol_violation, e.what(), line);
    }

    if (reply.id != req.id) {
        fail(ChannelErrorKind::protocol_violation,
             "response id '" + reply.id + "' does not match call '" + req.id + "'", line);
    }

    try {
        return result_from_frame(reply);
    } catch (const ProtocolError& e) {
        fail(ChannelErrorKind::protocol_violation, e.what(), line);
    }
}

void ToolChannel::close(bool immediate) {
    if (closed_) return;
    closed_ = true;
    usable_ = false;

    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }

    if (pid_ > 0) {
        int status = 0;
        bool reaped = false;
        auto until = Clock::now() + std::chrono::milliseconds(immediate ? 0 : cfg_.close_grace_ms);
        while (true) {
            pid_t r = waitpid(pid_, &status, WNOHANG);
            if (r == pid_) { reaped = true; break; }
            if (r < 0 && errno != EINTR) break;
            if (Clock::now() >= until) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        if (!reaped) {
            kill(pid_, SIGKILL);
            pid_t r;
            do {
                r = waitpid(pid_, &status, 0);
            } while (r < 0 && errno == EINTR);
            reaped = (r == pid_);
            std::cerr << "[channel] Killed tool process (pid " << pid_ << ")\n";
        }
        if (reaped) exit_status_ = status;
    }

    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }
}

} // namespace todochat
