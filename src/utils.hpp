#pragma once
#include <string>
#include <cstdlib>
#include <cstdint>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <ctime>

namespace todochat {

namespace fs = std::filesystem;

inline std::string home_dir() {
    const char* h = std::getenv("HOME");
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        return home_dir() + p.substr(1);
    }
    return p;
}

inline std::string default_config_path() {
    const char* env = std::getenv("TODOCHAT_CONFIG");
    if (env && *env) return env;
    return home_dir() + "/.todochat/config.json";
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return "";
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

inline std::string format_time(std::time_t t, const char* fmt, bool utc) {
    std::tm tm{};
    if (utc) gmtime_r(&t, &tm);
    else localtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return buf;
}

// UTC timestamp in the store's wire format: YYYY-MM-DDTHH:MM:SS
inline std::string iso_now_utc() {
    return format_time(std::time(nullptr), "%Y-%m-%dT%H:%M:%S", true);
}

inline int64_t epoch_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

struct UrlParts {
    std::string scheme = "http";
    std::string host = "127.0.0.1";
    int port = 80;
    std::string path_prefix;  // no trailing slash

    std::string origin() const {
        return scheme + "://" + host + ":" + std::to_string(port);
    }
};

inline UrlParts parse_url(const std::string& url) {
    UrlParts u;
    size_t pos = 0;
    if (url.compare(0, 8, "https://") == 0) {
        u.scheme = "https"; pos = 8; u.port = 443;
    } else if (url.compare(0, 7, "http://") == 0) {
        pos = 7;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        u.path_prefix = url.substr(slash);
        while (!u.path_prefix.empty() && u.path_prefix.back() == '/') u.path_prefix.pop_back();
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        u.host = host_port.substr(0, colon);
        u.port = std::stoi(host_port.substr(colon + 1));
    } else if (!host_port.empty()) {
        u.host = host_port;
    }
    return u;
}

} // namespace todochat
