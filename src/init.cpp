#include "commands.hpp"
#include "config.hpp"
#include <iostream>

namespace todochat {

int cmd_init() {
    std::string config_path = default_config_path();

    if (!fs::exists(config_path)) {
        auto parent = fs::path(config_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
        Config cfg = Config::make_default();
        cfg.save(config_path);
        std::cout << "[init] Created config: " << config_path << "\n";
    } else {
        std::cout << "[init] Config already exists: " << config_path << "\n";
    }

    Config cfg = Config::load(config_path);
    auto db_dir = fs::path(cfg.db_path()).parent_path();
    if (!db_dir.empty()) fs::create_directories(db_dir);
    std::cout << "[init] Database: " << cfg.db_path() << "\n";
    std::cout << "[init] Set OPENAI_API_KEY or edit providers.default.api_key, then run: todochat serve\n";
    return 0;
}

} // namespace todochat
