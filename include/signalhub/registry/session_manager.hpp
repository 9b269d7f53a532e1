#pragma once

#include <signalhub/registry/clock.hpp>
#include <signalhub/registry/registry_config.hpp>
#include <signalhub/registry/registry_store.hpp>
#include <signalhub/registry/session.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace signalhub
{

using token_generator = std::function<std::string()>;

// Random UUID token (Boost.Uuid, one generator per thread).
std::string random_session_token();

// ============================================================================
// Session Manager
// ============================================================================

class session_manager
{
public:
    static constexpr int max_token_attempts{16};

private:
    registry_store& store_;
    const clock& clock_;
    registry_config config_;
    token_generator next_token_;

public:
    session_manager(registry_store& store,
                    const clock& clock,
                    registry_config config,
                    token_generator generator = random_session_token)
        : store_(store)
        , clock_(clock)
        , config_(config)
        , next_token_(std::move(generator)) {}

    session_manager(const session_manager&) = delete;
    session_manager& operator=(const session_manager&) = delete;

    // Allocates a fresh token. With a server id the session starts half paired.
    std::string create_session(const std::optional<std::string>& server_device_id = std::nullopt);

    session get_session(const std::string& session_id) const;

    // Half-paired sessions with a server and no client, oldest first.
    std::vector<session> list_available_sessions() const;
    std::vector<session> list_sessions() const;

    session bind_server(const std::string& session_id, const std::string& device_id);
    session bind_client(const std::string& session_id, const std::string& device_id);

    // paired -> active. `requested_by`, when given, must be a member.
    transition_result start_session(const std::string& session_id,
                                    const std::optional<std::string>& requested_by = std::nullopt);

    // any -> ended. Idempotent on an already ended session.
    transition_result end_session(const std::string& session_id,
                                  const std::optional<std::string>& requested_by = std::nullopt);

    std::vector<session> end_sessions_of(const std::string& device_id);

private:
    session bind(const std::string& session_id, session_role role, const std::string& device_id);
    void require_member(const std::string& session_id, const std::optional<std::string>& device_id) const;
};

} // namespace signalhub
