#pragma once

#include <signalhub/relay/transport.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

namespace signalhub::server
{

// One connected pub/sub endpoint. send() queues a text frame and returns
// immediately; close() starts an orderly shutdown.
class channel_sink
{
public:
    virtual ~channel_sink() = default;

    virtual void send(std::string text) = 0;
    virtual void close() = 0;
};

// ============================================================================
// Channel Transport
// ============================================================================
//
// `transport` over a table of live sinks. Channels join the discovery topic
// when opened and leave every topic when closed.

class ws_transport : public transport
{
    mutable std::mutex mutex_;
    std::unordered_map<channel_id, std::shared_ptr<channel_sink>> channels_;
    std::unordered_map<std::string, std::set<channel_id>> topics_;
    std::atomic<uint64_t> next_id_{1};

public:
    ws_transport() = default;
    ws_transport(const ws_transport&) = delete;
    ws_transport& operator=(const ws_transport&) = delete;

    channel_id open(std::shared_ptr<channel_sink> sink);
    void close(const channel_id& channel);
    void close_all();

    void subscribe(const channel_id& channel, const std::string& topic);

    bool is_connected(const channel_id& channel) const override;
    bool deliver(const channel_id& channel, const outbound_event& event) override;
    void publish(const std::string& topic, const outbound_event& event) override;

    size_t size() const;
    size_t subscribers(const std::string& topic) const;
};

} // namespace signalhub::server
