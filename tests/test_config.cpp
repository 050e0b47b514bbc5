#include <gtest/gtest.h>
#include "config.hpp"
#include "credential.hpp"
#include "tool_channel.hpp"
#include <cstdlib>
#include <sstream>
#include <unistd.h>

using namespace todochat;

class ConfigTest : public ::testing::Test {
protected:
    std::string dir;

    void SetUp() override {
        dir = (fs::temp_directory_path() / ("todochat-config-" + std::to_string(getpid()))).string();
        fs::create_directories(dir);
        unsetenv("OPENAI_API_KEY");
        unsetenv("TODOCHAT_API_BASE_URL");
    }

    void TearDown() override {
        fs::remove_all(dir);
        unsetenv("OPENAI_API_KEY");
        unsetenv("TODOCHAT_API_BASE_URL");
    }
};

TEST_F(ConfigTest, DefaultsMatchDocumentedValues) {
    Config cfg = Config::make_default();
    EXPECT_EQ(cfg.agent.max_tool_calls, 8);
    EXPECT_EQ(cfg.tool_process.handshake_timeout_ms, 5000);
    EXPECT_EQ(cfg.tool_process.call_timeout_ms, 15000);
    EXPECT_EQ(cfg.store.token_ttl_minutes, 30);
    EXPECT_EQ(cfg.resolve_provider().api_base, "https://api.openai.com/v1");
}

TEST_F(ConfigTest, SaveAndLoad) {
    Config cfg = Config::make_default();
    cfg.agent.max_tool_calls = 4;
    cfg.tool_process.command = "/opt/todochat/bin/todochat-tools";
    cfg.tool_process.env["LANG"] = "C";
    cfg.http.port = 9123;
    cfg.http.rate_limit_rpm = 30;

    std::string path = dir + "/config.json";
    cfg.save(path);
    Config loaded = Config::load(path);
    EXPECT_EQ(loaded.agent.max_tool_calls, 4);
    EXPECT_EQ(loaded.tool_process.command, "/opt/todochat/bin/todochat-tools");
    EXPECT_EQ(loaded.tool_process.env["LANG"], "C");
    EXPECT_EQ(loaded.http.port, 9123);
    EXPECT_EQ(loaded.http.rate_limit_rpm, 30);
}

TEST_F(ConfigTest, MissingOrBrokenFileFallsBack) {
    Config missing = Config::load(dir + "/absent.json");
    EXPECT_EQ(missing.model, Config{}.model);

    std::string path = dir + "/broken.json";
    std::ofstream(path) << "{ not json";
    Config broken = Config::load(path);
    EXPECT_EQ(broken.api_base_url, Config{}.api_base_url);
}

TEST_F(ConfigTest, ExplicitProviderWins) {
    auto cfg = Config::from_json({
        {"provider", "local"},
        {"providers", {
            {"default", {{"api_base", "https://api.openai.com/v1"}}},
            {"local", {{"api_base", "http://127.0.0.1:11434/v1"}}}
        }}
    });
    EXPECT_EQ(cfg.resolve_provider().api_base, "http://127.0.0.1:11434/v1");
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("OPENAI_API_KEY", "sk-env", 1);
    setenv("TODOCHAT_API_BASE_URL", "http://todo.internal:8000", 1);
    Config cfg = Config::make_default();
    cfg.apply_env_overrides();
    EXPECT_EQ(cfg.resolve_provider().api_key, "sk-env");
    EXPECT_EQ(cfg.api_base_url, "http://todo.internal:8000");
}

TEST_F(ConfigTest, ToolsCommandResolution) {
    ToolProcessConfig tp;
    tp.command = "/usr/local/bin/todochat-tools";
    EXPECT_EQ(resolve_tools_command(tp), "/usr/local/bin/todochat-tools");

    tp.command.clear();
    auto resolved = resolve_tools_command(tp);
    EXPECT_EQ(fs::path(resolved).filename().string(), "todochat-tools");
}

TEST_F(ConfigTest, CliTokenComesFromStdinOrEnvironment) {
    std::istringstream piped("  tok-from-pipe\nsecond line\n");
    EXPECT_EQ(cli_token(true, piped), "tok-from-pipe");

    std::istringstream unused("ignored\n");
    unsetenv(kAuthTokenEnv);
    EXPECT_EQ(cli_token(false, unused), "");
    setenv(kAuthTokenEnv, "tok-from-env", 1);
    EXPECT_EQ(cli_token(false, unused), "tok-from-env");
    unsetenv(kAuthTokenEnv);

    std::istringstream empty("");
    EXPECT_EQ(cli_token(true, empty), "");
}
