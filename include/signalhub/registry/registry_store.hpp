#pragma once

#include <signalhub/mirror/mirror_store.hpp>
#include <signalhub/registry/clock.hpp>
#include <signalhub/registry/device.hpp>
#include <signalhub/registry/errors.hpp>
#include <signalhub/registry/session.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace signalhub
{

inline bool is_available(const device& d, clock::time_point now, clock::duration freshness)
{
    return d.status == device_status::online && now - d.last_seen < freshness;
}

struct transition_result
{
    session record;
    bool changed{false};
};

struct route_target
{
    session record;
    std::optional<std::string> peer{};
    std::optional<std::string> peer_channel{};
};

struct sweep_result
{
    std::vector<std::string> devices{};
    std::vector<std::string> sessions{};
};

struct store_counts
{
    size_t devices{0};
    size_t online_devices{0};
    size_t sessions{0};
    size_t active_sessions{0};
    size_t channels{0};
};

// ============================================================================
// Registry Store
// ============================================================================
//
// Owns every device and session record. All access goes through one mutex;
// compound check-then-set sequences (bind, transition, sweep) run inside a
// single critical section. Callers only ever receive copies.
//
// Besides the records the store keeps two indexes:
//   - bindings: device id -> the non-ended session it is bound into
//   - channels: device id <-> transport channel id
//
// Every committed change is handed to the mirror inside the same critical
// section, so the mirror sees changes in store order. The mirror must not
// block: network mirrors go behind a write_behind_mirror.

class registry_store
{
    mutable std::mutex mutex_;
    std::unordered_map<std::string, device> devices_;
    std::unordered_map<std::string, session> sessions_;
    std::unordered_map<std::string, std::string> bindings_;
    std::unordered_map<std::string, std::string> channel_by_device_;
    std::unordered_map<std::string, std::string> device_by_channel_;
    mirror_store* mirror_{nullptr};

public:
    registry_store() = default;
    registry_store(const registry_store&) = delete;
    registry_store& operator=(const registry_store&) = delete;

    // nullptr detaches. Changes made before attaching are not replayed.
    void set_mirror(mirror_store* mirror);

    // Devices
    device upsert_device(device record);
    // Restore path: like upsert_device but not written back to the mirror.
    void restore_device(device record);
    std::optional<device> touch_device(const std::string& id,
                                       clock::time_point now,
                                       std::optional<device_status> status = std::nullopt);
    std::optional<device> find_device(const std::string& id) const;
    std::vector<device> devices() const;
    bool erase_device(const std::string& id);

    // Sessions
    // False if the id is taken.
    bool add_session(const session& record);
    // Restore path: re-indexes bindings and does not write back to the mirror.
    bool insert_session(const session& record);
    std::optional<session> find_session(const std::string& id) const;
    std::vector<session> sessions() const;
    bool erase_session(const std::string& id);

    // Fill one side of a session. Throws registry_error on any precondition
    // failure and leaves the session untouched in that case.
    session bind(const std::string& session_id,
                 session_role role,
                 const std::string& device_id,
                 clock::time_point now,
                 clock::duration freshness);

    transition_result transition(const std::string& session_id,
                                 session_status target,
                                 clock::time_point now);

    // End every live session the device is bound into.
    std::vector<session> end_sessions_of(const std::string& device_id, clock::time_point now);

    // Validate origin membership, refresh the origin's lastSeen, and report
    // where the peer lives. Session activity is left to record_activity.
    route_target resolve_route(const std::string& session_id,
                               const std::string& origin_device_id,
                               clock::time_point now);

    // Bump lastActivityAt after a delivery went through. Not mirrored.
    void record_activity(const std::string& session_id, clock::time_point now);

    // Channels
    std::optional<std::string> attach_channel(const std::string& channel, const std::string& device_id);
    std::optional<std::string> detach_channel(const std::string& channel);
    std::optional<std::string> channel_of(const std::string& device_id) const;
    std::optional<std::string> device_on(const std::string& channel) const;

    sweep_result sweep(clock::time_point now,
                       clock::duration device_expiry,
                       clock::duration session_expiry);

    store_counts counts() const;

private:
    void mirror_changed(const device& record) noexcept;
    void mirror_changed(const session& record) noexcept;
    void mirror_removed(record_kind kind, const std::string& id) noexcept;
    void release_bindings(const session& record);
    void drop_channel_of(const std::string& device_id);
    session& require_session(const std::string& session_id, error_kind missing);
};

} // namespace signalhub
