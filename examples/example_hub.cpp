#include "signalhub/signalhub.h"

#include <boost/asio.hpp>

#include <string>

using namespace signalhub;

// Prints every event instead of writing it to a socket.
class console_transport : public transport
{
public:
    bool is_connected(const channel_id&) const override { return true; }

    bool deliver(const channel_id& channel, const outbound_event& event) override
    {
        log_info("-> {} {} {}", channel, event.name, event.data.dump());
        return true;
    }

    void publish(const std::string& topic, const outbound_event& event) override
    {
        log_info("=> [{}] {} {}", topic, event.name, event.data.dump());
    }
};

int main()
{
    auto& logger = Logger::instance();
    logger.set_level(LogLevel::Info);
    log_info("{}", version_full());

    boost::asio::io_context io_context;
    system_clock_source clock;
    memory_mirror mirror;
    console_transport transport;
    hub relay_hub(&io_context, clock, mirror, transport);

    device_info tv;
    tv.display_name = "Living Room TV";
    tv.capabilities = {std::string{role_server}};
    tv.metadata = {{"device_type", "server"}};
    relay_hub.devices().register_device("tv-1", tv);
    relay_hub.relay().attach("ch-tv", "tv-1");

    relay_hub.devices().register_device("phone-1", {});
    relay_hub.relay().attach("ch-phone", "phone-1");

    auto session_id = relay_hub.sessions().create_session(std::string{"tv-1"});
    relay_hub.relay().announce_server(relay_hub.sessions().get_session(session_id));

    auto record = relay_hub.sessions().bind_client(session_id, "phone-1");
    relay_hub.relay().notify_status(record);

    relay_hub.relay().route(session_id, "tv-1", payload_kind::offer, {{"type", "offer"}, {"sdp", "v=0"}});
    relay_hub.relay().route(session_id, "phone-1", payload_kind::answer, {{"type", "answer"}, {"sdp", "v=0"}});

    auto started = relay_hub.sessions().start_session(session_id, std::string{"phone-1"});
    relay_hub.relay().notify_status(started.record);

    try
    {
        relay_hub.relay().route(session_id, "stranger", payload_kind::data, {{"hello", true}});
    }
    catch (const registry_error& e)
    {
        log_info("rejected as expected: {} ({})", to_string(e.kind()), e.what());
    }

    relay_hub.relay().on_disconnect("ch-phone");

    auto health = relay_hub.health();
    log_info("devices={} sessions={} active={} mirrored records={}",
             health.devices, health.sessions, health.active_sessions, mirror.size());

    auto report = relay_hub.sweeper().sweep_once();
    log_info("reaper removed {} device(s) and {} session(s)", report.devices.size(), report.sessions.size());

    return 0;
}
