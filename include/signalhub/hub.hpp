#pragma once

#include <signalhub/mirror/mirror_store.hpp>
#include <signalhub/registry/clock.hpp>
#include <signalhub/registry/device_registry.hpp>
#include <signalhub/registry/reaper.hpp>
#include <signalhub/registry/registry_config.hpp>
#include <signalhub/registry/registry_store.hpp>
#include <signalhub/registry/session_manager.hpp>
#include <signalhub/relay/signaling_relay.hpp>
#include <signalhub/relay/transport.hpp>

#include <boost/asio.hpp>

#include <memory>
#include <string>

namespace signalhub
{

struct health_snapshot
{
    clock::time_point at{};
    size_t devices{0};
    size_t online_devices{0};
    size_t sessions{0};
    size_t active_sessions{0};
    size_t channels{0};
    bool mirror_connected{false};
    std::string mirror{};
};

// ============================================================================
// Hub
// ============================================================================
//
// One isolated relay instance: store, registries, relay and reaper wired
// together over caller-owned collaborators (clock, mirror, transport).
// Construction does no I/O. start() preloads from the mirror and starts the
// reaper; stop() halts the reaper. Collaborators must outlive the hub.
// Mirror writes are issued from inside the store's lock; pass a mirror whose
// save/erase return immediately (memory_mirror, write_behind_mirror).

class hub
{
    const clock& clock_;
    mirror_store& mirror_;
    registry_config config_;
    registry_store store_;
    device_registry devices_;
    session_manager sessions_;
    signaling_relay relay_;
    std::shared_ptr<reaper> reaper_;

public:
    hub(boost::asio::io_context* io_context_ptr,
        const clock& clock,
        mirror_store& mirror,
        transport& transport,
        registry_config config = {},
        token_generator generator = random_session_token);

    ~hub();

    hub(const hub&) = delete;
    hub& operator=(const hub&) = delete;
    hub(hub&&) = delete;
    hub& operator=(hub&&) = delete;

    void start();
    void stop();

    // Best-effort restore from the mirror; returns records loaded.
    size_t preload() noexcept;

    health_snapshot health();

    device_registry& devices() { return devices_; }
    session_manager& sessions() { return sessions_; }
    signaling_relay& relay() { return relay_; }
    reaper& sweeper() { return *reaper_; }
    registry_store& store() { return store_; }
    const registry_config& config() const { return config_; }
    const clock& time_source() const { return clock_; }
};

} // namespace signalhub
