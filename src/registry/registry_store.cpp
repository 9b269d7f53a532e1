#include <signalhub/registry/registry_store.hpp>

#include <algorithm>

namespace signalhub
{

void registry_store::set_mirror(mirror_store* mirror)
{
    std::lock_guard<std::mutex> lock(mutex_);
    mirror_ = mirror;
}

// ============================================================================
// Devices
// ============================================================================

device registry_store::upsert_device(device record)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto& stored = devices_[record.id];
    // lastSeen never moves backwards
    record.last_seen = std::max(record.last_seen, stored.last_seen);
    stored = std::move(record);

    mirror_changed(stored);
    return stored;
}

void registry_store::restore_device(device record)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto& stored = devices_[record.id];
    record.last_seen = std::max(record.last_seen, stored.last_seen);
    stored = std::move(record);
}

std::optional<device> registry_store::touch_device(const std::string& id,
                                                   clock::time_point now,
                                                   std::optional<device_status> status)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = devices_.find(id);
    if (it == devices_.end())
        return std::nullopt;

    it->second.last_seen = std::max(it->second.last_seen, now);
    if (status)
        it->second.status = *status;

    mirror_changed(it->second);
    return it->second;
}

std::optional<device> registry_store::find_device(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(id);
    return it != devices_.end() ? std::optional<device>{it->second} : std::nullopt;
}

std::vector<device> registry_store::devices() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<device> result;
    result.reserve(devices_.size());
    for (auto& [id, record] : devices_)
        result.push_back(record);
    return result;
}

bool registry_store::erase_device(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!devices_.erase(id))
        return false;

    bindings_.erase(id);
    drop_channel_of(id);
    mirror_removed(record_kind::device, id);
    return true;
}

// ============================================================================
// Sessions
// ============================================================================

bool registry_store::add_session(const session& record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sessions_.emplace(record.id, record).second)
        return false;

    for (const auto& ref : {record.server_ref, record.client_ref})
    {
        if (ref && !record.is_ended())
            bindings_.emplace(*ref, record.id);
    }

    mirror_changed(record);
    return true;
}

bool registry_store::insert_session(const session& record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sessions_.emplace(record.id, record).second)
        return false;

    // Restored records arrive already bound
    if (!record.is_ended())
    {
        for (const auto& ref : {record.server_ref, record.client_ref})
        {
            if (ref)
                bindings_.emplace(*ref, record.id);
        }
    }
    return true;
}

std::optional<session> registry_store::find_session(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it != sessions_.end() ? std::optional<session>{it->second} : std::nullopt;
}

std::vector<session> registry_store::sessions() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<session> result;
    result.reserve(sessions_.size());
    for (auto& [id, record] : sessions_)
        result.push_back(record);
    return result;
}

bool registry_store::erase_session(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end())
        return false;

    release_bindings(it->second);
    sessions_.erase(it);
    mirror_removed(record_kind::session, id);
    return true;
}

session registry_store::bind(const std::string& session_id,
                             session_role role,
                             const std::string& device_id,
                             clock::time_point now,
                             clock::duration freshness)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto& record = require_session(session_id, error_kind::not_found);
    if (record.is_ended())
        throw registry_error(error_kind::invalid_state, "session " + session_id + " has ended");

    auto device_it = devices_.find(device_id);
    if (device_it == devices_.end())
        throw registry_error(error_kind::not_found, "unknown device: " + device_id);

    const bool as_server = role == session_role::server;
    if (!device_it->second.has_capability(as_server ? role_server : role_client))
        throw registry_error(error_kind::validation_error,
                             "device " + device_id + " lacks the " + to_string(role) + " capability");

    auto& slot = as_server ? record.server_ref : record.client_ref;
    auto& other = as_server ? record.client_ref : record.server_ref;

    if (slot)
    {
        if (*slot == device_id)
            return record;
        throw registry_error(error_kind::already_bound,
                             "session " + session_id + " already has a " + to_string(role));
    }

    if (other && *other == device_id)
        throw registry_error(error_kind::validation_error, "a device cannot pair with itself");

    if (auto bound = bindings_.find(device_id); bound != bindings_.end() && bound->second != session_id)
        throw registry_error(error_kind::already_bound,
                             "device " + device_id + " is already bound to session " + bound->second);

    if (other)
    {
        auto peer_it = devices_.find(*other);
        if (peer_it == devices_.end() || !is_available(peer_it->second, now, freshness))
            throw registry_error(error_kind::peer_unavailable, "peer device " + *other + " is not online");
    }

    slot = device_id;
    bindings_[device_id] = session_id;
    record.status = other ? session_status::paired : session_status::half_paired;
    record.last_activity_at = std::max(record.last_activity_at, now);

    mirror_changed(record);
    return record;
}

transition_result registry_store::transition(const std::string& session_id,
                                             session_status target,
                                             clock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto& record = require_session(session_id, error_kind::not_found);
    if (record.status == target)
        return {record, false};

    switch (target)
    {
        case session_status::active:
            if (record.status != session_status::paired)
                throw registry_error(error_kind::invalid_state,
                                     "session " + session_id + " cannot start while " + to_string(record.status));
            break;

        case session_status::ended:
            release_bindings(record);
            break;

        default:
            throw registry_error(error_kind::invalid_state,
                                 std::string{"transition to "} + to_string(target) + " is driven by binding");
    }

    record.status = target;
    record.last_activity_at = std::max(record.last_activity_at, now);

    mirror_changed(record);
    return {record, true};
}

std::vector<session> registry_store::end_sessions_of(const std::string& device_id, clock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<session> ended;
    for (auto& [id, record] : sessions_)
    {
        if (record.is_ended() || !record.is_member(device_id))
            continue;

        release_bindings(record);
        record.status = session_status::ended;
        record.last_activity_at = std::max(record.last_activity_at, now);
        mirror_changed(record);
        ended.push_back(record);
    }
    return ended;
}

route_target registry_store::resolve_route(const std::string& session_id,
                                           const std::string& origin_device_id,
                                           clock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto& record = require_session(session_id, error_kind::unknown_session);
    if (!record.is_member(origin_device_id))
        throw registry_error(error_kind::not_a_member,
                             "device " + origin_device_id + " is not a member of session " + session_id);
    if (record.is_ended())
        throw registry_error(error_kind::invalid_state, "session " + session_id + " has ended");

    if (auto it = devices_.find(origin_device_id); it != devices_.end())
        it->second.last_seen = std::max(it->second.last_seen, now);

    route_target target{record};
    target.peer = record.peer_of(origin_device_id);
    if (target.peer)
    {
        if (auto channel = channel_by_device_.find(*target.peer); channel != channel_by_device_.end())
            target.peer_channel = channel->second;
    }
    return target;
}

void registry_store::record_activity(const std::string& session_id, clock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it != sessions_.end() && !it->second.is_ended())
        it->second.last_activity_at = std::max(it->second.last_activity_at, now);
}

// ============================================================================
// Channels
// ============================================================================

std::optional<std::string> registry_store::attach_channel(const std::string& channel, const std::string& device_id)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (devices_.find(device_id) == devices_.end())
        throw registry_error(error_kind::not_found, "unknown device: " + device_id);

    // A channel speaks for one device at a time
    if (auto owner = device_by_channel_.find(channel); owner != device_by_channel_.end() && owner->second != device_id)
        channel_by_device_.erase(owner->second);

    std::optional<std::string> previous;
    if (auto it = channel_by_device_.find(device_id); it != channel_by_device_.end())
    {
        if (it->second != channel)
        {
            previous = it->second;
            device_by_channel_.erase(it->second);
        }
    }

    channel_by_device_[device_id] = channel;
    device_by_channel_[channel] = device_id;
    return previous;
}

std::optional<std::string> registry_store::detach_channel(const std::string& channel)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = device_by_channel_.find(channel);
    if (it == device_by_channel_.end())
        return std::nullopt;

    auto device_id = it->second;
    device_by_channel_.erase(it);
    channel_by_device_.erase(device_id);
    return device_id;
}

std::optional<std::string> registry_store::channel_of(const std::string& device_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channel_by_device_.find(device_id);
    return it != channel_by_device_.end() ? std::optional<std::string>{it->second} : std::nullopt;
}

std::optional<std::string> registry_store::device_on(const std::string& channel) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = device_by_channel_.find(channel);
    return it != device_by_channel_.end() ? std::optional<std::string>{it->second} : std::nullopt;
}

// ============================================================================
// Sweep & Stats
// ============================================================================

sweep_result registry_store::sweep(clock::time_point now,
                                   clock::duration device_expiry,
                                   clock::duration session_expiry)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sweep_result removed;

    for (auto it = devices_.begin(); it != devices_.end();)
    {
        if (now - it->second.last_seen > device_expiry)
        {
            removed.devices.push_back(it->first);
            bindings_.erase(it->first);
            drop_channel_of(it->first);
            mirror_removed(record_kind::device, it->first);
            it = devices_.erase(it);
        }
        else
        {
            ++it;
        }
    }

    for (auto it = sessions_.begin(); it != sessions_.end();)
    {
        if (it->second.is_ended() || now - it->second.last_activity_at > session_expiry)
        {
            removed.sessions.push_back(it->first);
            release_bindings(it->second);
            mirror_removed(record_kind::session, it->first);
            it = sessions_.erase(it);
        }
        else
        {
            ++it;
        }
    }

    return removed;
}

store_counts registry_store::counts() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    store_counts c;
    c.devices = devices_.size();
    c.sessions = sessions_.size();
    c.channels = device_by_channel_.size();
    for (auto& [id, record] : devices_)
    {
        if (record.status == device_status::online)
            ++c.online_devices;
    }
    for (auto& [id, record] : sessions_)
    {
        if (record.status == session_status::active)
            ++c.active_sessions;
    }
    return c;
}

// ============================================================================
// Internals (mutex held)
// ============================================================================

void registry_store::mirror_changed(const device& record) noexcept
{
    if (mirror_)
        mirror_save(*mirror_, record);
}

void registry_store::mirror_changed(const session& record) noexcept
{
    if (mirror_)
        mirror_save(*mirror_, record);
}

void registry_store::mirror_removed(record_kind kind, const std::string& id) noexcept
{
    if (mirror_)
        mirror_erase(*mirror_, kind, id);
}

void registry_store::release_bindings(const session& record)
{
    for (const auto& ref : {record.server_ref, record.client_ref})
    {
        if (!ref)
            continue;
        if (auto it = bindings_.find(*ref); it != bindings_.end() && it->second == record.id)
            bindings_.erase(it);
    }
}

void registry_store::drop_channel_of(const std::string& device_id)
{
    auto it = channel_by_device_.find(device_id);
    if (it == channel_by_device_.end())
        return;
    device_by_channel_.erase(it->second);
    channel_by_device_.erase(it);
}

session& registry_store::require_session(const std::string& session_id, error_kind missing)
{
    auto it = sessions_.find(session_id);
    if (it == sessions_.end())
        throw registry_error(missing, "unknown session: " + session_id);
    return it->second;
}

} // namespace signalhub
