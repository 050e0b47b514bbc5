#include "tool_server.hpp"
#include <iostream>

// todochat-tools: one instance per orchestration run, spoken to over
// stdin/stdout by the tool channel. Diagnostics go to stderr.
int main() {
    std::ios::sync_with_stdio(false);
    try {
        return todochat::run_tool_process(std::cin, std::cout);
    } catch (const std::exception& e) {
        std::cerr << "[tools] Fatal: " << e.what() << "\n";
        return 1;
    }
}
