#include <signalhub/registry/session_manager.hpp>

#include <signalhub/logger.h>
#include <signalhub/registry/errors.hpp>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>

namespace signalhub
{

std::string random_session_token()
{
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

std::string session_manager::create_session(const std::optional<std::string>& server_device_id)
{
    if (server_device_id && server_device_id->empty())
        throw registry_error(error_kind::validation_error, "server_id must not be empty");

    const auto now = clock_.now();

    session record;
    record.created_at = now;
    record.last_activity_at = now;

    bool inserted = false;
    for (int attempt = 0; attempt < max_token_attempts && !inserted; ++attempt)
    {
        record.id = next_token_();
        if (record.id.empty())
            continue;
        inserted = store_.add_session(record);
        if (!inserted)
            log_warning("session token collision on {}, retrying", record.id);
    }

    if (!inserted)
        throw registry_error(error_kind::internal_fault, "could not allocate a unique session token");

    if (server_device_id)
    {
        try
        {
            record = store_.bind(record.id, session_role::server, *server_device_id, now,
                                 std::chrono::duration_cast<clock::duration>(config_.freshness_window));
        }
        catch (const registry_error&)
        {
            // The token was never handed out, so nobody can observe it
            store_.erase_session(record.id);
            throw;
        }
    }

    log_info("session created: {} status={} server={}",
             record.id, to_string(record.status), server_device_id.value_or("-"));
    return record.id;
}

session session_manager::get_session(const std::string& session_id) const
{
    auto record = store_.find_session(session_id);
    if (!record)
        throw registry_error(error_kind::not_found, "session not found: " + session_id);
    return *record;
}

std::vector<session> session_manager::list_available_sessions() const
{
    auto all = store_.sessions();
    std::vector<session> joinable;
    for (auto& s : all)
    {
        if (s.is_joinable())
            joinable.push_back(std::move(s));
    }

    std::sort(joinable.begin(), joinable.end(), [](const session& a, const session& b) {
        if (a.created_at != b.created_at)
            return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return joinable;
}

std::vector<session> session_manager::list_sessions() const
{
    auto all = store_.sessions();
    std::sort(all.begin(), all.end(), [](const session& a, const session& b) {
        if (a.created_at != b.created_at)
            return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return all;
}

session session_manager::bind_server(const std::string& session_id, const std::string& device_id)
{
    return bind(session_id, session_role::server, device_id);
}

session session_manager::bind_client(const std::string& session_id, const std::string& device_id)
{
    return bind(session_id, session_role::client, device_id);
}

transition_result session_manager::start_session(const std::string& session_id,
                                                 const std::optional<std::string>& requested_by)
{
    require_member(session_id, requested_by);

    auto result = store_.transition(session_id, session_status::active, clock_.now());
    if (result.changed)
        log_info("session {} active (started by {})", session_id, requested_by.value_or("api"));
    return result;
}

transition_result session_manager::end_session(const std::string& session_id,
                                               const std::optional<std::string>& requested_by)
{
    require_member(session_id, requested_by);

    auto result = store_.transition(session_id, session_status::ended, clock_.now());
    if (result.changed)
        log_info("session {} ended (stopped by {})", session_id, requested_by.value_or("api"));
    return result;
}

std::vector<session> session_manager::end_sessions_of(const std::string& device_id)
{
    auto ended = store_.end_sessions_of(device_id, clock_.now());
    for (const auto& record : ended)
        log_info("session {} ended: member {} went away", record.id, device_id);
    return ended;
}

session session_manager::bind(const std::string& session_id, session_role role, const std::string& device_id)
{
    if (session_id.empty() || device_id.empty())
        throw registry_error(error_kind::validation_error, "session_id and device_id are required");

    auto record = store_.bind(session_id, role, device_id, clock_.now(),
                              std::chrono::duration_cast<clock::duration>(config_.freshness_window));

    log_info("session {}: {} bound as {} -> {}", session_id, device_id, to_string(role), to_string(record.status));
    return record;
}

void session_manager::require_member(const std::string& session_id,
                                     const std::optional<std::string>& device_id) const
{
    auto record = get_session(session_id);
    if (device_id && !record.is_member(*device_id))
        throw registry_error(error_kind::not_a_member,
                             "device " + *device_id + " is not a member of session " + session_id);
}

} // namespace signalhub
