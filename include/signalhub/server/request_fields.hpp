#pragma once

#include <signalhub/registry/device.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace signalhub::server
{

// Field access shared by the HTTP and pub/sub surfaces. Missing or
// mistyped fields raise registry_error(validation_error).

std::string required_string(const nlohmann::json& body, std::string_view key);
std::optional<std::string> optional_string(const nlohmann::json& body, std::string_view key);

// Registration fields: name, capabilities, metadata plus the well-known
// metadata keys (device_type, public_ip, local_ip, version) accepted at
// top level. device_type defaults to "android" and version to "1.0.0";
// a "server" device_type without explicit capabilities implies the server role.
device_info parse_device_info(const nlohmann::json& body);

} // namespace signalhub::server
