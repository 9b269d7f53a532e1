#pragma once

#include <signalhub/relay/transport.hpp>

#include <algorithm>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace signalhub::test_support
{

// In-process transport double: remembers every delivery and publication.
class recording_transport : public transport
{
    mutable std::mutex mutex_;
    std::set<channel_id> connected_;
    std::set<channel_id> refusing_;
    std::vector<std::pair<channel_id, outbound_event>> delivered_;
    std::vector<std::pair<std::string, outbound_event>> published_;

public:
    void connect(const channel_id& channel)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_.insert(channel);
    }

    void disconnect(const channel_id& channel)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_.erase(channel);
    }

    // Looks connected but every deliver() fails, like a socket torn down mid-send.
    void refuse(const channel_id& channel)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        refusing_.insert(channel);
    }

    bool is_connected(const channel_id& channel) const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_.count(channel) != 0;
    }

    bool deliver(const channel_id& channel, const outbound_event& event) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_.count(channel) || refusing_.count(channel))
            return false;
        delivered_.emplace_back(channel, event);
        return true;
    }

    void publish(const std::string& topic, const outbound_event& event) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        published_.emplace_back(topic, event);
    }

    std::vector<outbound_event> sent_to(const channel_id& channel) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<outbound_event> events;
        for (const auto& [target, event] : delivered_)
        {
            if (target == channel)
                events.push_back(event);
        }
        return events;
    }

    std::vector<outbound_event> sent_to(const channel_id& channel, const std::string& name) const
    {
        auto events = sent_to(channel);
        events.erase(std::remove_if(events.begin(), events.end(),
                                    [&](const outbound_event& e) { return e.name != name; }),
                     events.end());
        return events;
    }

    size_t delivery_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return delivered_.size();
    }

    std::vector<std::pair<std::string, outbound_event>> published() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delivered_.clear();
        published_.clear();
    }
};

} // namespace signalhub::test_support
