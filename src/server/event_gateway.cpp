#include <signalhub/server/event_gateway.hpp>

#include <signalhub/logger.h>
#include <signalhub/relay/events.hpp>
#include <signalhub/server/request_fields.hpp>

namespace signalhub::server
{

void event_gateway::on_connect(const channel_id& channel)
{
    log_debug("channel {} connected", channel);
    reply(channel, events::connected, {{"channel", channel}, {"message", "connected to signalhub"}});
}

void event_gateway::handle(const channel_id& channel, std::string_view text) noexcept
{
    std::string name;
    try
    {
        auto event = decode_envelope(text);
        name = event.name;
        dispatch(channel, event);
    }
    catch (const registry_error& e)
    {
        log_debug("{} from channel {} rejected: {}", name.empty() ? "frame" : name, channel, e.what());
        reply_error(channel, name, e.kind(), e.what());
    }
    catch (const nlohmann::json::exception& e)
    {
        reply_error(channel, name, error_kind::validation_error, e.what());
    }
    catch (const std::exception& e)
    {
        log_error("{} from channel {} failed: {}", name, channel, e.what());
        reply_error(channel, name, error_kind::internal_fault, "internal error");
    }
}

void event_gateway::dispatch(const channel_id& channel, const inbound_event& event)
{
    const auto& name = event.name;

    if (name == events::register_device)
        return on_register(channel, event.data);
    if (name == events::bind_server)
        return on_bind(channel, session_role::server, event.data);
    if (name == events::bind_client)
        return on_bind(channel, session_role::client, event.data);
    if (auto kind = parse_payload_kind(name))
        return on_payload(channel, *kind, event.data);
    if (name == events::session_started)
        return on_transition(channel, session_status::active, event.data);
    if (name == events::session_ended)
        return on_transition(channel, session_status::ended, event.data);
    if (name == events::heartbeat)
        return on_heartbeat(channel);

    throw registry_error(error_kind::validation_error, "unknown event: " + name);
}

disconnect_outcome event_gateway::on_disconnect(const channel_id& channel) noexcept
{
    auto outcome = hub_.relay().on_disconnect(channel);
    if (outcome.device_id && !outcome.ended.empty())
        log_info("device {} left {} session(s), {} peer(s) notified",
                 *outcome.device_id, outcome.ended.size(), outcome.notified);
    return outcome;
}

// ============================================================================
// Handlers
// ============================================================================

void event_gateway::on_register(const channel_id& channel, const nlohmann::json& data)
{
    auto device_id = required_string(data, "device_id");
    auto registered = hub_.devices().register_device(device_id, parse_device_info(data));
    hub_.relay().attach(channel, device_id);

    reply(channel, events::device_registered, {{"device", registered}});
    reply(channel, events::available_servers,
          {{"servers", hub_.devices().list_available(role_server)},
           {"sessions", hub_.sessions().list_available_sessions()}});
}

void event_gateway::on_bind(const channel_id& channel, session_role role, const nlohmann::json& data)
{
    auto origin = origin_of(channel);
    auto session_id = optional_string(data, "session_id");

    session record;
    if (role == session_role::server && !session_id)
    {
        auto id = hub_.sessions().create_session(origin);
        record = hub_.sessions().get_session(id);
    }
    else if (!session_id)
    {
        throw registry_error(error_kind::validation_error, "session_id is required");
    }
    else if (role == session_role::server)
    {
        record = hub_.sessions().bind_server(*session_id, origin);
    }
    else
    {
        record = hub_.sessions().bind_client(*session_id, origin);
    }

    hub_.relay().notify_status(record);
    hub_.relay().announce_server(record);
}

void event_gateway::on_payload(const channel_id& channel, payload_kind kind, const nlohmann::json& data)
{
    auto origin = origin_of(channel);
    auto session_id = required_string(data, "session_id");

    nlohmann::json payload;
    if (auto it = data.find("payload"); it != data.end())
    {
        payload = *it;
    }
    else
    {
        // Flat frames carry the payload beside the session id
        payload = data;
        payload.erase("session_id");
    }

    hub_.relay().route(session_id, origin, kind, payload);
    if (metrics_)
        metrics_->RecordRelayed(kind);
}

void event_gateway::on_transition(const channel_id& channel, session_status target, const nlohmann::json& data)
{
    auto origin = origin_of(channel);
    auto session_id = required_string(data, "session_id");

    auto result = target == session_status::active ? hub_.sessions().start_session(session_id, origin)
                                                   : hub_.sessions().end_session(session_id, origin);
    if (result.changed)
        hub_.relay().notify_status(result.record);
}

void event_gateway::on_heartbeat(const channel_id& channel)
{
    hub_.devices().touch(origin_of(channel), device_status::online);
}

// ============================================================================
// Helpers
// ============================================================================

std::string event_gateway::origin_of(const channel_id& channel) const
{
    auto device_id = hub_.relay().device_on(channel);
    if (!device_id)
        throw registry_error(error_kind::validation_error, "channel has no registered device; send register-device first");
    return *device_id;
}

void event_gateway::reply(const channel_id& channel, std::string_view name, nlohmann::json data)
{
    if (!transport_.deliver(channel, {std::string{name}, std::move(data)}))
        log_debug("reply {} to closed channel {} dropped", name, channel);
}

void event_gateway::reply_error(const channel_id& channel,
                                std::string_view event,
                                error_kind kind,
                                std::string_view message)
{
    try
    {
        if (metrics_)
            metrics_->RecordFailure(kind);

        auto body = error_body(kind, message);
        if (!event.empty())
            body["event"] = event;
        reply(channel, events::error, std::move(body));
    }
    catch (const std::exception& e)
    {
        log_error("could not report {} to channel {}: {}", to_string(kind), channel, e.what());
    }
}

} // namespace signalhub::server
