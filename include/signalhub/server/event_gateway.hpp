#pragma once

#include <signalhub/hub.hpp>
#include <signalhub/monitoring/relay_metrics.hpp>
#include <signalhub/registry/errors.hpp>
#include <signalhub/relay/transport.hpp>
#include <signalhub/server/envelope.hpp>

#include <string>
#include <string_view>

namespace signalhub::server
{

// ============================================================================
// Event Gateway
// ============================================================================
//
// Pub/sub surface of the hub. Decodes inbound frames, runs the matching hub
// operation for the device bound to the channel, and answers failures with
// an `error` event to the origin only. Transport-agnostic: the same gateway
// drives WebSocket channels and in-process test doubles.

class event_gateway
{
    hub& hub_;
    transport& transport_;
    monitoring::RelayMetrics* metrics_;

public:
    event_gateway(hub& hub, transport& transport, monitoring::RelayMetrics* metrics = nullptr)
        : hub_(hub)
        , transport_(transport)
        , metrics_(metrics) {}

    event_gateway(const event_gateway&) = delete;
    event_gateway& operator=(const event_gateway&) = delete;

    void on_connect(const channel_id& channel);

    // Never throws; every failure becomes an `error` event.
    void handle(const channel_id& channel, std::string_view text) noexcept;

    // Throws registry_error.
    void dispatch(const channel_id& channel, const inbound_event& event);

    disconnect_outcome on_disconnect(const channel_id& channel) noexcept;

private:
    void on_register(const channel_id& channel, const nlohmann::json& data);
    void on_bind(const channel_id& channel, session_role role, const nlohmann::json& data);
    void on_payload(const channel_id& channel, payload_kind kind, const nlohmann::json& data);
    void on_transition(const channel_id& channel, session_status target, const nlohmann::json& data);
    void on_heartbeat(const channel_id& channel);

    std::string origin_of(const channel_id& channel) const;
    void reply(const channel_id& channel, std::string_view name, nlohmann::json data);
    void reply_error(const channel_id& channel, std::string_view event, error_kind kind, std::string_view message);
};

} // namespace signalhub::server
