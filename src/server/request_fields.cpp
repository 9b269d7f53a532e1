#include <signalhub/server/request_fields.hpp>

#include <signalhub/registry/errors.hpp>

#include <array>

namespace signalhub::server
{

namespace
{
constexpr std::array<std::string_view, 4> metadata_keys{"device_type", "public_ip", "local_ip", "version"};

constexpr const char* default_device_type = "android";
constexpr const char* default_version = "1.0.0";
} // namespace

std::string required_string(const nlohmann::json& body, std::string_view key)
{
    auto value = optional_string(body, key);
    if (!value || value->empty())
        throw registry_error(error_kind::validation_error, std::string{key} + " is required");
    return *value;
}

std::optional<std::string> optional_string(const nlohmann::json& body, std::string_view key)
{
    if (!body.is_object())
        return std::nullopt;

    auto it = body.find(std::string{key});
    if (it == body.end() || it->is_null())
        return std::nullopt;
    if (!it->is_string())
        throw registry_error(error_kind::validation_error, std::string{key} + " must be a string");
    return it->get<std::string>();
}

device_info parse_device_info(const nlohmann::json& body)
{
    device_info info;

    if (auto name = optional_string(body, "name"))
        info.display_name = *name;
    else if (auto display = optional_string(body, "display_name"))
        info.display_name = *display;

    if (auto metadata = body.find("metadata"); metadata != body.end() && !metadata->is_null())
    {
        if (!metadata->is_object())
            throw registry_error(error_kind::validation_error, "metadata must be an object");
        info.metadata = *metadata;
    }

    for (auto key : metadata_keys)
    {
        if (auto value = optional_string(body, key))
            info.metadata[std::string{key}] = *value;
    }
    if (!info.metadata.contains("device_type"))
        info.metadata["device_type"] = default_device_type;
    if (!info.metadata.contains("version"))
        info.metadata["version"] = default_version;

    if (auto caps = body.find("capabilities"); caps != body.end() && !caps->is_null())
    {
        if (!caps->is_array())
            throw registry_error(error_kind::validation_error, "capabilities must be an array of strings");
        for (const auto& cap : *caps)
        {
            if (!cap.is_string() || cap.get_ref<const std::string&>().empty())
                throw registry_error(error_kind::validation_error, "capabilities must be an array of strings");
            info.capabilities.insert(cap.get<std::string>());
        }
    }
    else if (info.metadata["device_type"] == std::string{role_server})
    {
        info.capabilities.insert(std::string{role_server});
    }

    return info;
}

} // namespace signalhub::server
