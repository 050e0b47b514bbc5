#include <iostream>
#include <string>
#include <vector>
#include "commands.hpp"

static void print_usage() {
    std::cout << "Usage: todochat <command> [options]\n\n"
              << "Commands:\n"
              << "  init                        Write ~/.todochat/config.json\n"
              << "  serve [--host H] [--port P]\n"
              << "                              Start the todo API and chat endpoint\n"
              << "  chat -m MSG [--token-stdin] [--history FILE]\n"
              << "                              Run one chat turn against a running server;\n"
              << "                              the token comes from stdin or TODOCHAT_AUTH_TOKEN\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    if (cmd == "init") {
        return todochat::cmd_init();
    }
    else if (cmd == "serve") {
        std::string host;
        int port = 0;
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--host" && i + 1 < args.size()) {
                host = args[++i];
            } else if (args[i] == "--port" && i + 1 < args.size()) {
                try {
                    port = std::stoi(args[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Invalid port: " << args[i] << "\n";
                    return 1;
                }
            }
        }
        return todochat::cmd_serve(host, port);
    }
    else if (cmd == "chat") {
        std::string message;
        bool token_from_stdin = false;
        std::string history;
        for (size_t i = 0; i < args.size(); i++) {
            if ((args[i] == "-m" || args[i] == "--message") && i + 1 < args.size()) {
                message = args[++i];
            } else if (args[i] == "--token-stdin") {
                token_from_stdin = true;
            } else if (args[i] == "--token") {
                std::cerr << "--token is not supported; pipe the token with --token-stdin "
                          << "or set TODOCHAT_AUTH_TOKEN\n";
                return 1;
            } else if (args[i] == "--history" && i + 1 < args.size()) {
                history = args[++i];
            }
        }
        return todochat::cmd_chat(message, token_from_stdin, history);
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
