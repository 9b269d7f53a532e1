#pragma once

#include <signalhub/registry/clock.hpp>
#include <signalhub/registry/device_registry.hpp>
#include <signalhub/registry/registry_store.hpp>
#include <signalhub/registry/session_manager.hpp>
#include <signalhub/relay/events.hpp>
#include <signalhub/relay/transport.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace signalhub
{

struct disconnect_outcome
{
    std::optional<std::string> device_id{};
    std::vector<session> ended{};
    size_t notified{0};
};

// ============================================================================
// Signaling Relay
// ============================================================================
//
// Moves opaque negotiation payloads between the two members of a session.
// Payloads are never parsed; failures are reported to the origin as
// registry_error and nothing is delivered in that case.

class signaling_relay
{
    registry_store& store_;
    const clock& clock_;
    transport& transport_;
    device_registry& devices_;
    session_manager& sessions_;

public:
    signaling_relay(registry_store& store,
                    const clock& clock,
                    transport& transport,
                    device_registry& devices,
                    session_manager& sessions)
        : store_(store)
        , clock_(clock)
        , transport_(transport)
        , devices_(devices)
        , sessions_(sessions) {}

    signaling_relay(const signaling_relay&) = delete;
    signaling_relay& operator=(const signaling_relay&) = delete;

    // Bind a transport channel to a registered device. Replaces any older channel.
    void attach(const channel_id& channel, const std::string& device_id);

    void route(const std::string& session_id,
               const std::string& origin_device_id,
               payload_kind kind,
               const nlohmann::json& payload);

    // Transport-level drop. Idempotent, never throws.
    disconnect_outcome on_disconnect(const channel_id& channel) noexcept;

    // session-status-changed to every connected member; returns deliveries.
    size_t notify_status(const session& record);

    // server-available on the discovery topic for a joinable session.
    void announce_server(const session& record);

    bool is_reachable(const std::string& device_id) const;
    std::optional<std::string> device_on(const channel_id& channel) const;

private:
    bool deliver_to_device(const std::string& device_id, const outbound_event& event);
};

} // namespace signalhub
