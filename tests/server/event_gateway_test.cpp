#include <signalhub/server/event_gateway.hpp>

#include "support/recording_transport.hpp"

#include <gtest/gtest.h>

using namespace signalhub;
using namespace std::chrono_literals;
using test_support::recording_transport;

class EventGatewayTest : public ::testing::Test
{
protected:
    boost::asio::io_context io_context_;
    manual_clock clock_;
    memory_mirror mirror_;
    recording_transport transport_;
    hub hub_{&io_context_, clock_, mirror_, transport_};
    server::event_gateway gateway_{hub_, transport_};

    void send(const std::string& channel, const nlohmann::json& frame)
    {
        gateway_.handle(channel, frame.dump());
    }

    // Connects a channel and registers a device on it.
    void connect_device(const std::string& channel, nlohmann::json registration)
    {
        transport_.connect(channel);
        gateway_.on_connect(channel);
        send(channel, {{"event", "register-device"}, {"data", std::move(registration)}});
    }

    std::string only_joinable_session()
    {
        auto sessions = hub_.sessions().list_available_sessions();
        EXPECT_EQ(sessions.size(), 1u);
        return sessions.empty() ? std::string{} : sessions.front().id;
    }

    nlohmann::json last_error(const std::string& channel)
    {
        auto errors = transport_.sent_to(channel, "error");
        EXPECT_FALSE(errors.empty());
        return errors.empty() ? nlohmann::json{} : errors.back().data;
    }
};

TEST_F(EventGatewayTest, ConnectGreetsTheChannel)
{
    transport_.connect("ch-1");
    gateway_.on_connect("ch-1");

    auto greeting = transport_.sent_to("ch-1", "connected");
    ASSERT_EQ(greeting.size(), 1u);
    EXPECT_EQ(greeting[0].data["channel"], "ch-1");
}

TEST_F(EventGatewayTest, RegisterRepliesWithDeviceAndDiscovery)
{
    connect_device("ch-tv", {{"device_id", "tv"}, {"device_type", "server"}, {"name", "TV"}});
    send("ch-tv", {{"event", "bind-server"}, {"data", nlohmann::json::object()}});

    connect_device("ch-phone", {{"device_id", "phone"}});

    auto registered = transport_.sent_to("ch-phone", "device-registered");
    ASSERT_EQ(registered.size(), 1u);
    EXPECT_EQ(registered[0].data["device"]["id"], "phone");
    EXPECT_EQ(registered[0].data["device"]["capabilities"], nlohmann::json::array({"client"}));

    auto discovery = transport_.sent_to("ch-phone", "available-servers");
    ASSERT_EQ(discovery.size(), 1u);
    ASSERT_EQ(discovery[0].data["servers"].size(), 1u);
    EXPECT_EQ(discovery[0].data["servers"][0]["id"], "tv");
    ASSERT_EQ(discovery[0].data["sessions"].size(), 1u);
    EXPECT_EQ(discovery[0].data["sessions"][0]["server_id"], "tv");
}

TEST_F(EventGatewayTest, RegisterWithoutDeviceIdIsRejected)
{
    transport_.connect("ch-1");
    send("ch-1", {{"event", "register-device"}, {"data", {{"name", "nameless"}}}});

    auto error = last_error("ch-1");
    EXPECT_EQ(error["error"], "ValidationError");
    EXPECT_EQ(error["event"], "register-device");
    EXPECT_TRUE(hub_.devices().list_all().empty());
}

TEST_F(EventGatewayTest, BindServerWithoutSessionCreatesAndAnnounces)
{
    connect_device("ch-tv", {{"device_id", "tv"}, {"device_type", "server"}});
    send("ch-tv", {{"event", "bind-server"}, {"data", nlohmann::json::object()}});

    auto id = only_joinable_session();
    auto status = transport_.sent_to("ch-tv", "session-status-changed");
    ASSERT_EQ(status.size(), 1u);
    EXPECT_EQ(status[0].data["session_id"], id);
    EXPECT_EQ(status[0].data["status"], "half_paired");

    auto published = transport_.published();
    ASSERT_EQ(published.size(), 1u);
    EXPECT_EQ(published[0].second.name, "server-available");
    EXPECT_EQ(published[0].second.data["session_id"], id);
}

TEST_F(EventGatewayTest, FullNegotiationOverFrames)
{
    connect_device("ch-tv", {{"device_id", "tv"}, {"device_type", "server"}});
    connect_device("ch-phone", {{"device_id", "phone"}});
    send("ch-tv", {{"event", "bind-server"}, {"data", nlohmann::json::object()}});
    auto id = only_joinable_session();

    send("ch-phone", {{"event", "bind-client"}, {"data", {{"session_id", id}}}});
    EXPECT_EQ(hub_.sessions().get_session(id).status, session_status::paired);
    EXPECT_EQ(transport_.sent_to("ch-tv", "session-status-changed").back().data["status"], "paired");

    nlohmann::json sdp = {{"type", "offer"}, {"sdp", "v=0"}};
    send("ch-tv", {{"event", "offer"}, {"data", {{"session_id", id}, {"payload", sdp}}}});
    auto offers = transport_.sent_to("ch-phone", "offer");
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(offers[0].data["payload"], sdp);
    EXPECT_EQ(offers[0].data["from"], "tv");

    // Legacy flat frame: payload fields sit beside the session id
    send("ch-phone", {{"event", "ice_candidate"}, {"data", {{"session_id", id}, {"candidate", "a=candidate:1"}}}});
    auto candidates = transport_.sent_to("ch-tv", "candidate");
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].data["payload"], (nlohmann::json{{"candidate", "a=candidate:1"}}));

    send("ch-phone", {{"event", "session-started"}, {"data", {{"session_id", id}}}});
    EXPECT_EQ(hub_.sessions().get_session(id).status, session_status::active);

    send("ch-tv", {{"event", "session-ended"}, {"data", {{"session_id", id}}}});
    EXPECT_EQ(hub_.sessions().get_session(id).status, session_status::ended);
    EXPECT_EQ(transport_.sent_to("ch-phone", "session-status-changed").back().data["status"], "ended");

    EXPECT_TRUE(transport_.sent_to("ch-tv", "error").empty());
    EXPECT_TRUE(transport_.sent_to("ch-phone", "error").empty());
}

TEST_F(EventGatewayTest, UnregisteredChannelCannotAct)
{
    transport_.connect("ch-anon");
    send("ch-anon", {{"event", "offer"}, {"data", {{"session_id", "x"}}}});

    auto error = last_error("ch-anon");
    EXPECT_EQ(error["error"], "ValidationError");
    EXPECT_EQ(error["event"], "offer");
}

TEST_F(EventGatewayTest, RelayFailuresGoToOriginOnly)
{
    connect_device("ch-tv", {{"device_id", "tv"}, {"device_type", "server"}});
    connect_device("ch-intruder", {{"device_id", "intruder"}});
    send("ch-tv", {{"event", "bind-server"}, {"data", nlohmann::json::object()}});
    auto id = only_joinable_session();
    transport_.clear();

    send("ch-intruder", {{"event", "answer"}, {"data", {{"session_id", id}, {"payload", {{"sdp", "x"}}}}}});
    EXPECT_EQ(last_error("ch-intruder")["error"], "NotAMember");

    send("ch-tv", {{"event", "offer"}, {"data", {{"session_id", id}, {"payload", {{"sdp", "x"}}}}}});
    EXPECT_EQ(last_error("ch-tv")["error"], "PeerUnreachable");

    send("ch-tv", {{"event", "offer"}, {"data", {{"session_id", "missing"}}}});
    EXPECT_EQ(last_error("ch-tv")["error"], "UnknownSession");

    EXPECT_EQ(transport_.delivery_count(), 3u);
}

TEST_F(EventGatewayTest, BindConflictsAreReported)
{
    connect_device("ch-tv", {{"device_id", "tv"}, {"device_type", "server"}});
    connect_device("ch-tv2", {{"device_id", "tv2"}, {"device_type", "server"}});
    send("ch-tv", {{"event", "bind-server"}, {"data", nlohmann::json::object()}});
    auto id = only_joinable_session();

    send("ch-tv2", {{"event", "bind-server"}, {"data", {{"session_id", id}}}});
    EXPECT_EQ(last_error("ch-tv2")["error"], "AlreadyBound");

    send("ch-tv2", {{"event", "bind-client"}, {"data", nlohmann::json::object()}});
    EXPECT_EQ(last_error("ch-tv2")["error"], "ValidationError");

    send("ch-tv2", {{"event", "bind-client"}, {"data", {{"session_id", id}}}});
    EXPECT_EQ(last_error("ch-tv2")["error"], "ValidationError");
}

TEST_F(EventGatewayTest, MalformedAndUnknownFrames)
{
    transport_.connect("ch-1");

    gateway_.handle("ch-1", "{not json");
    auto error = last_error("ch-1");
    EXPECT_EQ(error["error"], "ValidationError");
    EXPECT_FALSE(error.contains("event"));

    send("ch-1", {{"event", "teleport"}, {"data", nlohmann::json::object()}});
    error = last_error("ch-1");
    EXPECT_EQ(error["error"], "ValidationError");
    EXPECT_EQ(error["event"], "teleport");
}

TEST_F(EventGatewayTest, HeartbeatRefreshesLastSeen)
{
    connect_device("ch-phone", {{"device_id", "phone"}});
    clock_.advance(120s);

    send("ch-phone", {{"event", "heartbeat"}});
    EXPECT_EQ(hub_.devices().find("phone")->last_seen, clock_.now());
}

TEST_F(EventGatewayTest, DisconnectNotifiesPeer)
{
    connect_device("ch-tv", {{"device_id", "tv"}, {"device_type", "server"}});
    connect_device("ch-phone", {{"device_id", "phone"}});
    send("ch-tv", {{"event", "bind-server"}, {"data", nlohmann::json::object()}});
    auto id = only_joinable_session();
    send("ch-phone", {{"event", "bind-client"}, {"data", {{"session_id", id}}}});

    transport_.disconnect("ch-phone");
    auto outcome = gateway_.on_disconnect("ch-phone");

    EXPECT_EQ(outcome.device_id, "phone");
    EXPECT_EQ(outcome.notified, 1u);
    EXPECT_EQ(transport_.sent_to("ch-tv", "peer-disconnected").size(), 1u);
}
