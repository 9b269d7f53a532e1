#include <signalhub/registry/device.hpp>
#include <signalhub/registry/session.hpp>

namespace signalhub
{

// ============================================================================
// Device
// ============================================================================

const char* to_string(device_status status)
{
    switch (status)
    {
        case device_status::online: return "online";
        case device_status::offline: return "offline";
    }
    return "offline";
}

std::optional<device_status> parse_device_status(std::string_view name)
{
    if (name == "online")
        return device_status::online;
    if (name == "offline")
        return device_status::offline;
    return std::nullopt;
}

std::string default_display_name(const std::string& device_id)
{
    return "Device " + device_id.substr(0, 8);
}

void to_json(nlohmann::json& j, const device_status& status)
{
    j = to_string(status);
}

void from_json(const nlohmann::json& j, device_status& status)
{
    auto parsed = parse_device_status(j.get<std::string>());
    if (!parsed)
        throw std::invalid_argument("unknown device status: " + j.get<std::string>());
    status = *parsed;
}

void to_json(nlohmann::json& j, const device& d)
{
    j = nlohmann::json{
        {"id", d.id},
        {"name", d.display_name},
        {"capabilities", d.capabilities},
        {"status", d.status},
        {"last_seen", to_epoch_seconds(d.last_seen)},
        {"metadata", d.metadata},
    };
}

void from_json(const nlohmann::json& j, device& d)
{
    j.at("id").get_to(d.id);
    d.display_name = j.value("name", default_display_name(d.id));
    d.capabilities = j.value("capabilities", std::set<std::string>{});
    d.status = j.value("status", device_status::offline);
    d.last_seen = from_epoch_seconds(j.value("last_seen", 0.0));
    d.metadata = j.value("metadata", nlohmann::json::object());
}

// ============================================================================
// Session
// ============================================================================

const char* to_string(session_status status)
{
    switch (status)
    {
        case session_status::unpaired: return "unpaired";
        case session_status::half_paired: return "half_paired";
        case session_status::paired: return "paired";
        case session_status::active: return "active";
        case session_status::ended: return "ended";
    }
    return "ended";
}

const char* to_string(session_role role)
{
    return role == session_role::server ? "server" : "client";
}

std::optional<session_status> parse_session_status(std::string_view name)
{
    for (auto s : {session_status::unpaired, session_status::half_paired, session_status::paired,
                   session_status::active, session_status::ended})
    {
        if (name == to_string(s))
            return s;
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const session_status& status)
{
    j = to_string(status);
}

void from_json(const nlohmann::json& j, session_status& status)
{
    auto parsed = parse_session_status(j.get<std::string>());
    if (!parsed)
        throw std::invalid_argument("unknown session status: " + j.get<std::string>());
    status = *parsed;
}

namespace
{
nlohmann::json optional_ref(const std::optional<std::string>& ref)
{
    return ref ? nlohmann::json(*ref) : nlohmann::json(nullptr);
}

std::optional<std::string> read_ref(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    return it->get<std::string>();
}
} // namespace

void to_json(nlohmann::json& j, const session& s)
{
    j = nlohmann::json{
        {"session_id", s.id},
        {"status", s.status},
        {"server_id", optional_ref(s.server_ref)},
        {"client_id", optional_ref(s.client_ref)},
        {"created_at", to_epoch_seconds(s.created_at)},
        {"last_activity", to_epoch_seconds(s.last_activity_at)},
    };
}

void from_json(const nlohmann::json& j, session& s)
{
    j.at("session_id").get_to(s.id);
    j.at("status").get_to(s.status);
    s.server_ref = read_ref(j, "server_id");
    s.client_ref = read_ref(j, "client_id");
    s.created_at = from_epoch_seconds(j.value("created_at", 0.0));
    s.last_activity_at = from_epoch_seconds(j.value("last_activity", 0.0));
}

} // namespace signalhub
