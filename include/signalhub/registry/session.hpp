#pragma once

#include <signalhub/registry/clock.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace signalhub
{

// ============================================================================
// Session State Machine
// ============================================================================
//
//   unpaired --bind--> half_paired --bind other side--> paired --start--> active
//
//   Any non-ended state moves to ended on stop, disconnect of a member, or
//   expiry. Ended is terminal; session ids are never reused.
//

enum class session_status
{
    unpaired,
    half_paired,
    paired,
    active,
    ended,
};

enum class session_role
{
    server,
    client,
};

const char* to_string(session_status status);
const char* to_string(session_role role);
std::optional<session_status> parse_session_status(std::string_view name);

struct session
{
    std::string id{};
    std::optional<std::string> server_ref{};
    std::optional<std::string> client_ref{};
    session_status status{session_status::unpaired};
    clock::time_point created_at{};
    clock::time_point last_activity_at{};

    bool is_member(const std::string& device_id) const
    {
        return (server_ref && *server_ref == device_id) || (client_ref && *client_ref == device_id);
    }

    // The other side's device id, if bound.
    std::optional<std::string> peer_of(const std::string& device_id) const
    {
        if (server_ref && *server_ref == device_id)
            return client_ref;
        if (client_ref && *client_ref == device_id)
            return server_ref;
        return std::nullopt;
    }

    bool is_joinable() const
    {
        return status == session_status::half_paired && server_ref && !client_ref;
    }

    bool is_ended() const { return status == session_status::ended; }

    bool operator==(const session&) const = default;
};

void to_json(nlohmann::json& j, const session_status& status);
void from_json(const nlohmann::json& j, session_status& status);
void to_json(nlohmann::json& j, const session& s);
void from_json(const nlohmann::json& j, session& s);

} // namespace signalhub
