#include <signalhub/server/ws_transport.hpp>

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <vector>

using namespace signalhub;
using namespace signalhub::server;

namespace
{
class capture_sink : public channel_sink
{
public:
    std::vector<std::string> frames;
    int closes{0};

    void send(std::string text) override { frames.push_back(std::move(text)); }
    void close() override { ++closes; }

    nlohmann::json frame(size_t i) const { return nlohmann::json::parse(frames.at(i)); }
};
} // namespace

TEST(WsTransport, OpenAssignsDistinctChannelsAndJoinsDiscovery)
{
    ws_transport transport;
    auto a = transport.open(std::make_shared<capture_sink>());
    auto b = transport.open(std::make_shared<capture_sink>());

    EXPECT_NE(a, b);
    EXPECT_TRUE(transport.is_connected(a));
    EXPECT_EQ(transport.size(), 2u);
    EXPECT_EQ(transport.subscribers("discovery"), 2u);
}

TEST(WsTransport, DeliverEncodesTheEnvelope)
{
    ws_transport transport;
    auto sink = std::make_shared<capture_sink>();
    auto channel = transport.open(sink);

    EXPECT_TRUE(transport.deliver(channel, {"offer", {{"session_id", "abc"}}}));
    ASSERT_EQ(sink->frames.size(), 1u);
    EXPECT_EQ(sink->frame(0)["event"], "offer");
    EXPECT_EQ(sink->frame(0)["data"]["session_id"], "abc");
}

TEST(WsTransport, ClosedChannelIsGone)
{
    ws_transport transport;
    auto sink = std::make_shared<capture_sink>();
    auto channel = transport.open(sink);
    transport.close(channel);

    EXPECT_FALSE(transport.is_connected(channel));
    EXPECT_FALSE(transport.deliver(channel, {"offer", {}}));
    EXPECT_EQ(transport.subscribers("discovery"), 0u);
    EXPECT_TRUE(sink->frames.empty());

    // Closing twice is harmless
    transport.close(channel);
    EXPECT_EQ(transport.size(), 0u);
}

TEST(WsTransport, PublishReachesOnlySubscribers)
{
    ws_transport transport;
    auto listener = std::make_shared<capture_sink>();
    auto other = std::make_shared<capture_sink>();
    auto a = transport.open(listener);
    transport.open(other);
    transport.subscribe(a, "alerts");

    transport.publish("discovery", {"server-available", {{"session_id", "abc"}}});
    transport.publish("alerts", {"notice", {}});
    transport.publish("nobody", {"lost", {}});

    ASSERT_EQ(listener->frames.size(), 2u);
    EXPECT_EQ(listener->frame(0)["event"], "server-available");
    EXPECT_EQ(listener->frame(1)["event"], "notice");
    ASSERT_EQ(other->frames.size(), 1u);
    EXPECT_EQ(other->frame(0)["event"], "server-available");
}

TEST(WsTransport, SubscribeIgnoresUnknownChannels)
{
    ws_transport transport;
    transport.subscribe("ch-404", "discovery");
    EXPECT_EQ(transport.subscribers("discovery"), 0u);
}

TEST(WsTransport, CloseAllAsksEverySinkToClose)
{
    ws_transport transport;
    auto a = std::make_shared<capture_sink>();
    auto b = std::make_shared<capture_sink>();
    transport.open(a);
    transport.open(b);

    transport.close_all();
    EXPECT_EQ(a->closes, 1);
    EXPECT_EQ(b->closes, 1);
}
