#include <signalhub/server/server_config.hpp>

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <map>
#include <string>
#include <vector>

using namespace signalhub::server;

namespace
{
// Owns a mutable argv for getopt.
class args
{
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;

public:
    args(std::initializer_list<const char*> values)
    {
        storage_.emplace_back("signalhub-server");
        for (auto v : values)
            storage_.emplace_back(v);
        for (auto& s : storage_)
            pointers_.push_back(s.data());
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }
};

env_lookup environment(std::map<std::string, std::string> values)
{
    return [values = std::move(values)](const char* name) -> const char* {
        auto it = values.find(name);
        return it != values.end() ? it->second.c_str() : nullptr;
    };
}

const env_lookup no_environment = [](const char*) -> const char* { return nullptr; };

command_line parse(args a)
{
    return parse_command_line(a.argc(), a.argv());
}
} // namespace

TEST(ServerConfig, DefaultsAreValid)
{
    server_config config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.websocket_path, "/ws");
    EXPECT_TRUE(config.redis_url.empty());
    EXPECT_GE(config.threads, 1u);
    EXPECT_EQ(config.registry.sweep_interval.count(), 60);
}

TEST(ServerConfig, ParsesLongAndShortOptions)
{
    auto cli = parse({"--port", "9000", "-b", "127.0.0.1", "--threads=2", "-l", "debug", "--redis", "redis://r:6379/1"});
    EXPECT_FALSE(cli.help);
    EXPECT_FALSE(cli.config_path.has_value());

    auto config = resolve_server_config(cli, no_environment);
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.bind_address, "127.0.0.1");
    EXPECT_EQ(config.threads, 2u);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.redis_url, "redis://r:6379/1");
}

TEST(ServerConfig, HelpFlag)
{
    EXPECT_TRUE(parse({"-h"}).help);
    EXPECT_TRUE(parse({"--help"}).help);
}

TEST(ServerConfig, BadCommandLinesThrow)
{
    EXPECT_THROW(parse({"--bogus"}), std::invalid_argument);
    EXPECT_THROW(parse({"--port"}), std::invalid_argument);
    EXPECT_THROW(parse({"stray"}), std::invalid_argument);
    EXPECT_THROW(resolve_server_config(parse({"--port", "http"}), no_environment), std::invalid_argument);
    EXPECT_THROW(resolve_server_config(parse({"--port", "70000"}), no_environment), std::invalid_argument);
    EXPECT_THROW(resolve_server_config(parse({"--threads", "0"}), no_environment), std::invalid_argument);
    EXPECT_THROW(resolve_server_config(parse({"-l", "loud"}), no_environment), std::invalid_argument);
    EXPECT_THROW(resolve_server_config(parse({"-r", "mysql://db"}), no_environment), std::invalid_argument);
}

TEST(ServerConfig, EnvironmentOverridesDefaults)
{
    auto config = resolve_server_config(parse({}), environment({
                                                        {"PORT", "5000"},
                                                        {"REDIS_URL", "redis://cache:6379"},
                                                        {"SIGNALHUB_LOG_LEVEL", "warning"},
                                                        {"SIGNALHUB_METRICS_ADDRESS", ""},
                                                    }));
    EXPECT_EQ(config.port, 5000);
    EXPECT_EQ(config.redis_url, "redis://cache:6379");
    EXPECT_EQ(config.log_level, "warning");
    EXPECT_TRUE(config.metrics_address.empty());
}

TEST(ServerConfig, CommandLineOverridesEnvironment)
{
    auto config = resolve_server_config(parse({"-p", "7000"}), environment({{"PORT", "5000"}}));
    EXPECT_EQ(config.port, 7000);
}

TEST(ServerConfig, JsonLayer)
{
    server_config config;
    apply_json(config, {
                           {"port", 6000},
                           {"websocket_path", "/signal"},
                           {"registry", {{"sweep_interval", 30}, {"freshness_window", 120}, {"device_expiry", 240}}},
                       });
    EXPECT_EQ(config.port, 6000);
    EXPECT_EQ(config.websocket_path, "/signal");
    EXPECT_EQ(config.registry.sweep_interval.count(), 30);
    EXPECT_EQ(config.registry.freshness_window.count(), 120);
    EXPECT_EQ(config.registry.device_expiry.count(), 240);
    EXPECT_EQ(config.registry.session_expiry.count(), 3600);
    EXPECT_NO_THROW(config.validate());

    EXPECT_THROW(apply_json(config, {{"port", "not a number"}}), std::invalid_argument);
    EXPECT_THROW(apply_json(config, nlohmann::json::array()), std::invalid_argument);
    EXPECT_THROW(apply_json(config, {{"registry", 5}}), std::invalid_argument);
}

TEST(ServerConfig, ConfigFileIsTheLowestExplicitLayer)
{
    const std::string path = ::testing::TempDir() + "signalhub_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"port": 6100, "bind_address": "10.0.0.1", "log_level": "error"})";
    }

    auto config = resolve_server_config(parse({"-c", path.c_str(), "-l", "info"}), environment({{"PORT", "6200"}}));
    EXPECT_EQ(config.bind_address, "10.0.0.1");
    EXPECT_EQ(config.port, 6200);
    EXPECT_EQ(config.log_level, "info");

    std::remove(path.c_str());
}

TEST(ServerConfig, MissingOrBrokenConfigFile)
{
    server_config config;
    EXPECT_THROW(load_config_file(config, "/nonexistent/signalhub.json"), std::invalid_argument);

    const std::string path = ::testing::TempDir() + "signalhub_broken_config.json";
    {
        std::ofstream out(path);
        out << "{ port: ";
    }
    EXPECT_THROW(load_config_file(config, path), std::invalid_argument);
    std::remove(path.c_str());
}

TEST(ServerConfig, ValidateNamesTheField)
{
    server_config config;
    config.websocket_path = "ws";
    try
    {
        config.validate();
        FAIL() << "expected invalid_argument";
    }
    catch (const std::invalid_argument& e)
    {
        EXPECT_NE(std::string{e.what()}.find("websocket_path"), std::string::npos);
    }

    config = server_config{};
    config.registry.freshness_window = std::chrono::seconds{900};
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = server_config{};
    config.metrics_address = "9100";
    EXPECT_THROW(config.validate(), std::invalid_argument);
}
