#pragma once
#include <string>
#include <chrono>
#include <cstdlib>
#include <istream>

namespace todochat {

// Caller-scoped identity for one orchestration run. Travels by value into the
// tool channel and reaches the tool process only through its environment.
// Never log the token.
struct Credential {
    std::string token;
    std::string base_url;
    std::chrono::system_clock::time_point expiry = std::chrono::system_clock::time_point::max();

    bool empty() const { return token.empty() || base_url.empty(); }
};

// Environment contract between the tool channel and the tool process
inline constexpr const char* kAuthTokenEnv = "TODOCHAT_AUTH_TOKEN";
inline constexpr const char* kApiBaseUrlEnv = "TODOCHAT_API_BASE_URL";

// Bearer token for a terminal run: the first line of `in` when from_stdin,
// otherwise TODOCHAT_AUTH_TOKEN. Tokens are never taken from argv.
inline std::string cli_token(bool from_stdin, std::istream& in) {
    std::string token;
    if (from_stdin) {
        std::getline(in, token);
    } else if (const char* env = std::getenv(kAuthTokenEnv)) {
        token = env;
    }
    size_t b = token.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    return token.substr(b, token.find_last_not_of(" \t\r\n") - b + 1);
}

} // namespace todochat
