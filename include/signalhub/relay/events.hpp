#pragma once

#include <optional>
#include <string_view>

namespace signalhub::events
{

// Outbound
inline constexpr std::string_view connected = "connected";
inline constexpr std::string_view device_registered = "device-registered";
inline constexpr std::string_view available_servers = "available-servers";
inline constexpr std::string_view server_available = "server-available";
inline constexpr std::string_view offer = "offer";
inline constexpr std::string_view answer = "answer";
inline constexpr std::string_view candidate = "candidate";
inline constexpr std::string_view data = "data";
inline constexpr std::string_view peer_disconnected = "peer-disconnected";
inline constexpr std::string_view session_status_changed = "session-status-changed";
inline constexpr std::string_view error = "error";

// Inbound
inline constexpr std::string_view register_device = "register-device";
inline constexpr std::string_view bind_server = "bind-server";
inline constexpr std::string_view bind_client = "bind-client";
inline constexpr std::string_view session_started = "session-started";
inline constexpr std::string_view session_ended = "session-ended";
inline constexpr std::string_view heartbeat = "heartbeat";

// Topic every connected channel joins on connect
inline constexpr std::string_view discovery_topic = "discovery";

} // namespace signalhub::events

namespace signalhub
{

// Negotiation payloads the relay forwards without looking inside.
enum class payload_kind
{
    offer,
    answer,
    candidate,
    data,
};

inline std::string_view event_name(payload_kind kind)
{
    switch (kind)
    {
        case payload_kind::offer: return events::offer;
        case payload_kind::answer: return events::answer;
        case payload_kind::candidate: return events::candidate;
        case payload_kind::data: return events::data;
    }
    return events::data;
}

inline std::optional<payload_kind> parse_payload_kind(std::string_view name)
{
    if (name == events::offer)
        return payload_kind::offer;
    if (name == events::answer)
        return payload_kind::answer;
    if (name == events::candidate)
        return payload_kind::candidate;
    if (name == events::data)
        return payload_kind::data;
    return std::nullopt;
}

} // namespace signalhub
