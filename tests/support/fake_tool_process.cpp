// Scripted tool process for channel tests. argv[1] picks the behaviour:
//   echo          handshake, then echo every call back with identity details
//   silent        read frames, never answer
//   exit          exit right away without a word
//   garbage       handshake, then answer calls with non-JSON
//   bad_handshake answer init with non-JSON
//   string_error  answer init with an id-less error whose payload is a string
//   oversize      handshake, then answer calls with an endless line
//   mismatch      handshake, then answer calls under another id
//   hang          handshake, then never answer calls
//   stubborn      handshake, then ignore EOF and keep running
//   partial       advertise only some of the tools
//   unauthorized  handshake, then reject every call as Unauthorized
#include "protocol.hpp"
#include "tool_server.hpp"
#include "credential.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>

using namespace todochat;

static void send(const Frame& f) {
    std::cout << encode_frame(f) << std::flush;
}

static std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? v : "";
}

int main(int argc, char* argv[]) {
    std::string mode = argc > 1 ? argv[1] : "echo";
    if (mode == "exit") return 3;

    nlohmann::json argv_list = nlohmann::json::array();
    for (int i = 0; i < argc; i++) argv_list.push_back(argv[i]);

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        Frame in;
        try {
            in = decode_frame(line);
        } catch (const ProtocolError&) {
            continue;
        }

        if (mode == "silent") continue;

        if (in.kind == FrameKind::init) {
            if (mode == "bad_handshake") {
                std::cout << "this is not a frame\n" << std::flush;
                continue;
            }
            if (mode == "string_error") {
                std::cout << R"({"kind":"error","payload":"boom"})" << "\n" << std::flush;
                continue;
            }
            Frame caps = ToolServer::capabilities_frame();
            if (mode == "partial") {
                auto& tools = caps.payload["tools"];
                tools.erase(tools.begin() + 4, tools.end());
            }
            send(caps);
            if (mode == "stubborn") {
                std::signal(SIGTERM, SIG_IGN);
            }
            continue;
        }

        if (in.kind != FrameKind::call) continue;

        if (mode == "hang") continue;
        if (mode == "garbage") {
            std::cout << "{{{ not json\n" << std::flush;
            continue;
        }
        if (mode == "mismatch") {
            std::cout << R"({"kind":"result","id":")" << in.id << R"(-other","payload":{}})" << "\n" << std::flush;
            continue;
        }
        if (mode == "oversize") {
            std::string chunk(64 * 1024, 'x');
            for (size_t sent = 0; sent <= kMaxFrameBytes && std::cout; sent += chunk.size()) std::cout << chunk;
            std::cout << std::flush;
            continue;
        }
        if (mode == "unauthorized") {
            ToolError err;
            err.kind = ToolErrorKind::unauthorized;
            err.message = "token rejected";
            send(make_result_frame(ToolCallResult::failure(in.id, err)));
            continue;
        }

        Frame out;
        out.kind = FrameKind::result;
        out.id = in.id;
        out.payload = {
            {"tool", in.payload.value("tool", "")},
            {"arguments", in.payload.value("arguments", nlohmann::json::object())},
            {"pid", static_cast<int>(getpid())},
            {"token", env_or_empty(kAuthTokenEnv)},
            {"base_url", env_or_empty(kApiBaseUrlEnv)},
            {"argv", argv_list}
        };
        send(out);
    }

    if (mode == "stubborn") {
        for (;;) std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    return 0;
}
