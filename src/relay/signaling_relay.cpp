#include <signalhub/relay/signaling_relay.hpp>

#include <signalhub/logger.h>
#include <signalhub/registry/errors.hpp>

namespace signalhub
{

void signaling_relay::attach(const channel_id& channel, const std::string& device_id)
{
    auto previous = store_.attach_channel(channel, device_id);
    if (previous)
        log_info("device {} moved from channel {} to {}", device_id, *previous, channel);
    else
        log_debug("device {} attached to channel {}", device_id, channel);
}

void signaling_relay::route(const std::string& session_id,
                            const std::string& origin_device_id,
                            payload_kind kind,
                            const nlohmann::json& payload)
{
    if (session_id.empty())
        throw registry_error(error_kind::validation_error, "session_id is required");
    if (origin_device_id.empty())
        throw registry_error(error_kind::validation_error, "origin device is unknown; register first");

    auto target = store_.resolve_route(session_id, origin_device_id, clock_.now());

    if (!target.peer)
        throw registry_error(error_kind::peer_unreachable, "session " + session_id + " has no peer bound yet");

    if (!target.peer_channel || !transport_.is_connected(*target.peer_channel))
        throw registry_error(error_kind::peer_unreachable, "peer " + *target.peer + " is not connected");

    outbound_event event{
        std::string{event_name(kind)},
        {{"session_id", session_id}, {"from", origin_device_id}, {"payload", payload}},
    };

    if (!transport_.deliver(*target.peer_channel, event))
        throw registry_error(error_kind::peer_unreachable, "peer " + *target.peer + " dropped its channel");

    store_.record_activity(session_id, clock_.now());

    log_debug("relayed {} in session {}: {} -> {}", event.name, session_id, origin_device_id, *target.peer);
}

disconnect_outcome signaling_relay::on_disconnect(const channel_id& channel) noexcept
{
    disconnect_outcome outcome;
    try
    {
        outcome.device_id = store_.detach_channel(channel);
        if (!outcome.device_id)
            return outcome;

        const auto& device_id = *outcome.device_id;
        log_info("channel {} of device {} disconnected", channel, device_id);

        devices_.touch(device_id, device_status::offline);
        outcome.ended = sessions_.end_sessions_of(device_id);

        for (const auto& record : outcome.ended)
        {
            auto peer = record.peer_of(device_id);
            if (!peer)
                continue;

            outbound_event event{
                std::string{events::peer_disconnected},
                {{"session_id", record.id}, {"device_id", device_id}, {"status", record.status}},
            };
            if (deliver_to_device(*peer, event))
                ++outcome.notified;
        }
    }
    catch (const std::exception& e)
    {
        log_error("disconnect handling for channel {} failed: {}", channel, e.what());
    }
    return outcome;
}

size_t signaling_relay::notify_status(const session& record)
{
    outbound_event event{std::string{events::session_status_changed}, nlohmann::json(record)};

    size_t delivered = 0;
    for (const auto& member : {record.server_ref, record.client_ref})
    {
        if (member && deliver_to_device(*member, event))
            ++delivered;
    }
    return delivered;
}

void signaling_relay::announce_server(const session& record)
{
    if (!record.is_joinable())
        return;

    nlohmann::json server = {{"id", *record.server_ref}};
    if (auto d = devices_.find(*record.server_ref))
    {
        server["name"] = d->display_name;
        server["device_type"] = d->metadata.value("device_type", "unknown");
    }

    transport_.publish(std::string{events::discovery_topic},
                       {std::string{events::server_available}, {{"session_id", record.id}, {"server", server}}});
}

bool signaling_relay::is_reachable(const std::string& device_id) const
{
    auto channel = store_.channel_of(device_id);
    return channel && transport_.is_connected(*channel);
}

std::optional<std::string> signaling_relay::device_on(const channel_id& channel) const
{
    return store_.device_on(channel);
}

bool signaling_relay::deliver_to_device(const std::string& device_id, const outbound_event& event)
{
    auto channel = store_.channel_of(device_id);
    if (!channel || !transport_.is_connected(*channel))
        return false;
    return transport_.deliver(*channel, event);
}

} // namespace signalhub
