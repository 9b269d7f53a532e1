#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace signalhub
{

using channel_id = std::string;

struct outbound_event
{
    std::string name{};
    nlohmann::json data = nlohmann::json::object();

    bool operator==(const outbound_event&) const = default;
};

// ============================================================================
// Publish/Subscribe Transport Interface
// ============================================================================
//
// Implemented by the boundary adapter. Delivery is fire-and-forget: deliver()
// returns false when the channel is gone, it never blocks or queues for a
// channel that is not connected.

class transport
{
public:
    virtual ~transport() = default;

    virtual bool is_connected(const channel_id& channel) const = 0;
    virtual bool deliver(const channel_id& channel, const outbound_event& event) = 0;
    virtual void publish(const std::string& topic, const outbound_event& event) = 0;
};

} // namespace signalhub
