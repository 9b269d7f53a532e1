#pragma once

#include <signalhub/registry/clock.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace signalhub
{

inline constexpr std::string_view role_server = "server";
inline constexpr std::string_view role_client = "client";

enum class device_status
{
    online,
    offline,
};

const char* to_string(device_status status);
std::optional<device_status> parse_device_status(std::string_view name);

// What a caller supplies on registration. Empty fields get defaults.
struct device_info
{
    std::string display_name{};
    std::set<std::string> capabilities{};
    nlohmann::json metadata = nlohmann::json::object();
};

struct device
{
    std::string id{};
    std::string display_name{};
    std::set<std::string> capabilities{};
    device_status status{device_status::online};
    clock::time_point last_seen{};
    nlohmann::json metadata = nlohmann::json::object();

    bool has_capability(std::string_view role) const
    {
        return capabilities.find(std::string{role}) != capabilities.end();
    }

    bool operator==(const device&) const = default;
};

std::string default_display_name(const std::string& device_id);

void to_json(nlohmann::json& j, const device_status& status);
void from_json(const nlohmann::json& j, device_status& status);
void to_json(nlohmann::json& j, const device& d);
void from_json(const nlohmann::json& j, device& d);

} // namespace signalhub
