#pragma once

#include <signalhub/registry/registry_config.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace signalhub::server
{

// ============================================================================
// Server Configuration
// ============================================================================
//
// Resolved in layers: defaults, then the JSON file named by --config, then
// environment variables, then the remaining command line options.

struct server_config
{
    std::string bind_address{"0.0.0.0"};
    uint16_t port{8080};
    unsigned threads{default_threads()};
    std::string websocket_path{"/ws"};
    size_t max_message_size{1024 * 1024};
    std::string redis_url{};                      // empty: in-memory only
    std::string metrics_address{"0.0.0.0:9100"};  // empty: no exposer
    std::string log_level{"info"};
    registry_config registry{};

    // Throws std::invalid_argument naming the offending field.
    void validate() const;

    static unsigned default_threads();
};

struct command_line
{
    bool help{false};
    std::optional<std::string> config_path{};
    std::vector<std::pair<int, std::string>> options{};
};

using env_lookup = std::function<const char*(const char*)>;

// Throws std::invalid_argument for unknown options or missing arguments.
command_line parse_command_line(int argc, char* argv[]);

void apply_json(server_config& config, const nlohmann::json& document);
void load_config_file(server_config& config, const std::string& path);
void apply_environment(server_config& config, const env_lookup& lookup);
void apply_command_line(server_config& config, const command_line& cli);

// All layers in order, validated.
server_config resolve_server_config(const command_line& cli, const env_lookup& lookup);
server_config resolve_server_config(const command_line& cli);

void print_usage(const char* program);
void print_summary(const server_config& config);

} // namespace signalhub::server
