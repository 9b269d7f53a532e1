#include <signalhub/server/ws_transport.hpp>

#include <signalhub/logger.h>
#include <signalhub/relay/events.hpp>
#include <signalhub/server/envelope.hpp>

#include <vector>

namespace signalhub::server
{

channel_id ws_transport::open(std::shared_ptr<channel_sink> sink)
{
    auto id = fmt::format("ch-{}", next_id_.fetch_add(1));

    std::lock_guard<std::mutex> lock(mutex_);
    channels_.emplace(id, std::move(sink));
    topics_[std::string{events::discovery_topic}].insert(id);
    return id;
}

void ws_transport::close(const channel_id& channel)
{
    std::lock_guard<std::mutex> lock(mutex_);
    channels_.erase(channel);
    for (auto it = topics_.begin(); it != topics_.end();)
    {
        it->second.erase(channel);
        it = it->second.empty() ? topics_.erase(it) : std::next(it);
    }
}

void ws_transport::close_all()
{
    std::vector<std::shared_ptr<channel_sink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, sink] : channels_)
            sinks.push_back(sink);
    }

    // Sinks report back through close(channel) once their socket is down
    for (auto& sink : sinks)
        sink->close();
}

void ws_transport::subscribe(const channel_id& channel, const std::string& topic)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (channels_.count(channel))
        topics_[topic].insert(channel);
}

bool ws_transport::is_connected(const channel_id& channel) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.count(channel) != 0;
}

bool ws_transport::deliver(const channel_id& channel, const outbound_event& event)
{
    std::shared_ptr<channel_sink> sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(channel);
        if (it == channels_.end())
            return false;
        sink = it->second;
    }

    sink->send(encode_envelope(event));
    return true;
}

void ws_transport::publish(const std::string& topic, const outbound_event& event)
{
    std::vector<std::shared_ptr<channel_sink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = topics_.find(topic);
        if (it == topics_.end())
            return;
        for (const auto& id : it->second)
        {
            if (auto channel = channels_.find(id); channel != channels_.end())
                sinks.push_back(channel->second);
        }
    }

    const auto text = encode_envelope(event);
    for (auto& sink : sinks)
        sink->send(text);

    log_debug("published {} on {} to {} channel(s)", event.name, topic, sinks.size());
}

size_t ws_transport::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

size_t ws_transport::subscribers(const std::string& topic) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = topics_.find(topic);
    return it != topics_.end() ? it->second.size() : 0;
}

} // namespace signalhub::server
